// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <cstdlib>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <toolchat/log.hpp>

namespace toolchat::log
{

std::shared_ptr<spdlog::logger> get()
{
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;

    std::call_once(
        once,
        []
        {
            logger = spdlog::get(kLoggerName);
            if (!logger)
                logger = spdlog::stderr_color_mt(kLoggerName);

            logger->set_level(spdlog::level::warn);
            if (const char* level = std::getenv(kLogLevelEnv); level && level[0] != '\0')
                logger->set_level(spdlog::level::from_str(level));
        }
    );

    return logger;
}

void set_level(const std::string& level)
{
    get()->set_level(spdlog::level::from_str(level));
}

} // namespace toolchat::log
