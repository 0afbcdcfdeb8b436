// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file log.hpp
/// @brief Shared spdlog logger for the toolchat library

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace toolchat::log
{

/// Name of the library logger registered with spdlog
inline constexpr const char* kLoggerName = "toolchat";

/// Environment variable consulted the first time the logger is created
inline constexpr const char* kLogLevelEnv = "TOOLCHAT_LOG_LEVEL";

/// Get (and lazily create) the library logger
///
/// The logger writes to stderr so that it never interleaves with JSON-RPC
/// traffic on stdout. Its initial level comes from TOOLCHAT_LOG_LEVEL
/// (trace, debug, info, warn, error, critical, off), defaulting to warn.
std::shared_ptr<spdlog::logger> get();

/// Set the library log level by name (same names as TOOLCHAT_LOG_LEVEL)
void set_level(const std::string& level);

} // namespace toolchat::log
