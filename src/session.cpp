// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <toolchat/log.hpp>
#include <toolchat/session.hpp>
#include <toolchat/transport_process.hpp>
#include <utility>

namespace toolchat
{

namespace
{

/// Map an MCP logging level onto spdlog
spdlog::level::level_enum server_log_level(const std::string& level)
{
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info" || level == "notice")
        return spdlog::level::info;
    if (level == "warning")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical" || level == "alert" || level == "emergency")
        return spdlog::level::critical;
    return spdlog::level::info;
}

} // namespace

const char* to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Created:
        return "created";
    case SessionState::Initializing:
        return "initializing";
    case SessionState::Ready:
        return "ready";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

// =============================================================================
// Construction
// =============================================================================

ToolServerSession::ToolServerSession(
    std::string name, TransportFactory factory, SessionOptions options
)
    : name_(std::move(name)), factory_(std::move(factory)), options_(options),
      state_(SessionState::Created), tools_out_of_date_(false), prompts_out_of_date_(false)
{
}

ToolServerSession::~ToolServerSession()
{
    if (auto client = take_client())
        client->stop();
}

std::shared_ptr<ToolServerSession> ToolServerSession::from_config(
    const std::string& name, const ToolServerConfig& config, EnvLookup lookup
)
{
    auto factory = [name, config, lookup = std::move(lookup)]()
    {
        ProcessOptions process_options;
        if (config.env)
        {
            auto env = *config.env;
            process_env_vars(env, lookup);
            process_options.environment = std::move(env);
        }
        return std::make_unique<ChildProcessTransport>(name, config.command, config.args, process_options);
    };

    SessionOptions options;
    options.timeout = std::chrono::milliseconds{config.timeout_ms};
    return std::make_shared<ToolServerSession>(name, std::move(factory), options);
}

void ToolServerSession::set_state_listener(StateListener listener)
{
    std::lock_guard<std::mutex> lock(listener_mutex_);
    state_listener_ = std::move(listener);
}

void ToolServerSession::set_state(SessionState state)
{
    state_ = state;
    log::get()->debug("Tool server {} is {}", name_, to_string(state));

    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = state_listener_;
    }
    if (!listener)
        return;

    try
    {
        listener(name_, state);
    }
    catch (const std::exception& e)
    {
        log::get()->error("State listener for {} threw: {}", name_, e.what());
    }
}

// =============================================================================
// Handshake
// =============================================================================

void ToolServerSession::init()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (state_ == SessionState::Ready)
        return;

    set_state(SessionState::Initializing);

    // A previous attempt or a closed connection leaves a stopped client behind
    if (auto stale = take_client())
        stale->stop();

    try
    {
        auto client = std::make_shared<JsonRpcClient>(factory_(), options_.framing);
        install_handlers(*client);
        client->start();
        {
            std::lock_guard<std::mutex> lock(client_mutex_);
            client_ = client;
        }

        json params = {
            {"protocolVersion", kMcpProtocolVersion},
            {"capabilities", json::object()},
            {"clientInfo", {{"name", kClientName}, {"version", kVersion}}},
        };
        auto result = client->invoke_sync("initialize", params, options_.timeout);
        auto capabilities = result.get<ServerCapabilities>();
        if (capabilities.protocol_version != kMcpProtocolVersion)
        {
            log::get()->warn(
                "Tool server {} answered with protocol version {}",
                name_,
                capabilities.protocol_version
            );
        }

        client->notify("notifications/initialized");

        std::vector<ToolSpec> tools;
        if (capabilities.has_tools)
            tools = list_all(*client, "tools/list", "tools").get<std::vector<ToolSpec>>();

        std::vector<PromptSpec> prompts;
        if (capabilities.has_prompts)
            prompts = list_all(*client, "prompts/list", "prompts").get<std::vector<PromptSpec>>();

        {
            std::unique_lock<std::shared_mutex> lock(cache_mutex_);
            capabilities_ = std::move(capabilities);
            tools_ = std::move(tools);
            prompts_ = std::move(prompts);
        }
        tools_out_of_date_ = false;
        prompts_out_of_date_ = false;
    }
    catch (const std::exception& e)
    {
        log::get()->error("Failed to initialize tool server {}: {}", name_, e.what());
        throw;
    }

    set_state(SessionState::Ready);
    log::get()->info("Tool server {} ready with {} tools", name_, tools().size());
}

void ToolServerSession::install_handlers(JsonRpcClient& client)
{
    client.on_notification(
        "notifications/tools/list_changed",
        [this](const std::string&, const json&)
        {
            log::get()->info("Tool list of {} changed", name_);
            tools_out_of_date_ = true;
        }
    );

    client.on_notification(
        "notifications/prompts/list_changed",
        [this](const std::string&, const json&)
        {
            log::get()->info("Prompt list of {} changed", name_);
            prompts_out_of_date_ = true;
        }
    );

    client.on_notification(
        "notifications/message",
        [this](const std::string&, const json& params)
        {
            auto level = params.is_object() ? params.value("level", "info") : std::string("info");
            auto data = params.is_object() && params.contains("data") ? params.at("data") : params;
            auto text = data.is_string() ? data.get<std::string>() : data.dump();
            log::get()->log(server_log_level(level), "[{}] {}", name_, text);
        }
    );

    client.set_notification_handler(
        [this](const std::string& method, const json&)
        { log::get()->warn("Dropping unknown notification {} from {}", method, name_); }
    );

    // Only the reader thread runs this; it must not stop the client
    client.set_close_handler(
        [this]
        {
            auto expected = SessionState::Ready;
            if (state_.compare_exchange_strong(expected, SessionState::Closed))
            {
                log::get()->warn("Tool server {} closed the connection", name_);
                set_state(SessionState::Closed);
            }
        }
    );
}

json ToolServerSession::list_all(
    JsonRpcClient& client, const std::string& method, const std::string& key
)
{
    json items = json::array();
    std::optional<std::string> cursor;

    do
    {
        json params = json::object();
        if (cursor)
            params["cursor"] = *cursor;

        auto page = client.invoke_sync(method, params, options_.timeout);
        if (page.contains(key) && page.at(key).is_array())
        {
            for (auto& item : page.at(key))
                items.push_back(item);
        }

        cursor.reset();
        if (page.contains("nextCursor") && page.at("nextCursor").is_string())
            cursor = page.at("nextCursor").get<std::string>();
    } while (cursor);

    return items;
}

// =============================================================================
// Requests
// =============================================================================

std::shared_ptr<JsonRpcClient> ToolServerSession::ready_client() const
{
    auto state = state_.load();
    if (state != SessionState::Ready)
        throw ServerNotReadyError(name_, state);

    std::lock_guard<std::mutex> lock(client_mutex_);
    if (!client_ || !client_->is_running())
        throw ServerNotReadyError(name_, SessionState::Closed);
    return client_;
}

std::shared_ptr<JsonRpcClient> ToolServerSession::take_client()
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    return std::exchange(client_, nullptr);
}

json ToolServerSession::request(const std::string& method, const json& params)
{
    return ready_client()->invoke_sync(method, params, options_.timeout);
}

PendingCall ToolServerSession::request_async(const std::string& method, const json& params)
{
    return ready_client()->invoke_with_id(method, params, options_.timeout);
}

bool ToolServerSession::cancel(int64_t request_id, const std::string& reason)
{
    std::shared_ptr<JsonRpcClient> client;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        client = client_;
    }
    return client && client->cancel(request_id, reason);
}

void ToolServerSession::notify(const std::string& method, const json& params)
{
    ready_client()->notify(method, params);
}

// =============================================================================
// Capability Cache
// =============================================================================

std::optional<ServerCapabilities> ToolServerSession::capabilities() const
{
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return capabilities_;
}

std::vector<ToolSpec> ToolServerSession::tools() const
{
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return tools_;
}

std::vector<PromptSpec> ToolServerSession::prompts() const
{
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return prompts_;
}

std::vector<ToolSpec> ToolServerSession::refresh_tools()
{
    auto client = ready_client();

    // Cleared first so a change announced during the fetch is not lost
    tools_out_of_date_ = false;
    try
    {
        auto tools = list_all(*client, "tools/list", "tools").get<std::vector<ToolSpec>>();
        std::unique_lock<std::shared_mutex> lock(cache_mutex_);
        tools_ = tools;
        return tools;
    }
    catch (const std::exception&)
    {
        tools_out_of_date_ = true;
        throw;
    }
}

std::vector<PromptSpec> ToolServerSession::refresh_prompts()
{
    auto client = ready_client();

    prompts_out_of_date_ = false;
    try
    {
        auto prompts = list_all(*client, "prompts/list", "prompts").get<std::vector<PromptSpec>>();
        std::unique_lock<std::shared_mutex> lock(cache_mutex_);
        prompts_ = prompts;
        return prompts;
    }
    catch (const std::exception&)
    {
        prompts_out_of_date_ = true;
        throw;
    }
}

void ToolServerSession::close()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    auto client = take_client();
    if (state_ != SessionState::Closed)
        set_state(SessionState::Closed);
    if (client)
        client->stop();
}

} // namespace toolchat
