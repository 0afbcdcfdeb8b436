// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <toolchat/types.hpp>

namespace toolchat
{

namespace
{

template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool list_changed(const json& capability)
{
    return capability.is_object() && capability.value("listChanged", false);
}

} // namespace

void from_json(const json& j, ServerCapabilities& c)
{
    c.protocol_version = j.value("protocolVersion", "");

    if (j.contains("serverInfo") && j.at("serverInfo").is_object())
    {
        const auto& info = j.at("serverInfo");
        c.server_name = info.value("name", "");
        c.server_version = info.value("version", "");
    }

    if (j.contains("capabilities") && j.at("capabilities").is_object())
    {
        c.raw = j.at("capabilities");
        c.has_tools = c.raw.contains("tools");
        c.has_prompts = c.raw.contains("prompts");
        c.has_resources = c.raw.contains("resources");
        c.tools_list_changed = c.has_tools && list_changed(c.raw.at("tools"));
        c.prompts_list_changed = c.has_prompts && list_changed(c.raw.at("prompts"));
    }
}

void from_json(const json& j, MessageContent& c)
{
    auto type = j.at("type").get<std::string>();
    if (type == "text")
        c = TextContent{j.at("text").get<std::string>()};
    else if (type == "image")
        c = ImageContent{j.at("data").get<std::string>(), j.at("mimeType").get<std::string>()};
    else if (type == "resource")
        c = ResourceContent{j.at("resource")};
    else
        throw json::type_error::create(302, "unknown content type '" + type + "'", &j);
}

template <typename T>
    requires std::same_as<T, MessageContent>
void to_json(json& j, const T& c)
{
    std::visit(
        Overloaded{
            [&](const TextContent& t) { j = json{{"type", "text"}, {"text", t.text}}; },
            [&](const ImageContent& i)
            { j = json{{"type", "image"}, {"data", i.data}, {"mimeType", i.mime_type}}; },
            [&](const ResourceContent& r) { j = json{{"type", "resource"}, {"resource", r.resource}}; },
        },
        c
    );
}

template void to_json<MessageContent>(json& j, const MessageContent& c);

void from_json(const json& j, ToolCallResult& r)
{
    if (!j.is_object())
        throw json::type_error::create(302, "tool call result must be an object", &j);
    j.at("content").get_to(r.content);
    r.is_error = j.value("isError", false);
}

void to_json(json& j, const ToolCallResult& r)
{
    j = json{{"content", r.content}, {"isError", r.is_error}};
}

} // namespace toolchat
