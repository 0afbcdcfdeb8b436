// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <array>
#include <cctype>
#include <cstdlib>
#include <thread>
#include <toolchat/builtin_tools.hpp>
#include <toolchat/log.hpp>
#include <toolchat/process.hpp>
#include <toolchat/util.hpp>

namespace toolchat
{

namespace
{

constexpr std::array<std::string_view, 6> kReadOnlyOps = {
    "get", "describe", "list", "ls", "search", "batch_get"
};

/// Extra user agent metadata picked up by the AWS CLI
constexpr const char* kUserAgentEnvVar = "AWS_EXECUTION_ENV";

constexpr size_t kMaxStreamSize = kMaxToolResponseSize / 3;

std::string read_all(ReadPipe& pipe)
{
    std::string out;
    char buffer[4096];
    while (size_t n = pipe.read(buffer, sizeof(buffer)))
        out.append(buffer, n);
    return out;
}

std::string cap_output(const std::string& text)
{
    if (text.size() <= kMaxStreamSize)
        return text;
    return std::string(truncate_safe(text, kMaxStreamSize)) + " ... truncated";
}

} // namespace

std::string to_kebab_case(std::string_view name)
{
    while (name.substr(0, 2) == "--")
        name.remove_prefix(2);

    std::string out;
    auto is_upper = [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; };
    auto is_lower = [](char c) { return std::islower(static_cast<unsigned char>(c)) != 0; };

    for (size_t i = 0; i < name.size(); ++i)
    {
        char c = name[i];
        if (c == '_' || c == '-' || c == ' ')
        {
            if (!out.empty() && out.back() != '-')
                out.push_back('-');
            continue;
        }

        if (is_upper(c) && !out.empty() && out.back() != '-')
        {
            bool after_lower = i > 0 && (is_lower(name[i - 1]) ||
                                         std::isdigit(static_cast<unsigned char>(name[i - 1])));
            bool acronym_end = i > 0 && is_upper(name[i - 1]) && i + 1 < name.size() &&
                               is_lower(name[i + 1]);
            if (after_lower || acronym_end)
                out.push_back('-');
        }

        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    while (!out.empty() && out.back() == '-')
        out.pop_back();
    return out;
}

void from_json(const json& j, UseAws& tool)
{
    j.at("service_name").get_to(tool.service_name);
    j.at("operation_name").get_to(tool.operation_name);
    j.at("region").get_to(tool.region);

    if (j.contains("parameters") && !j.at("parameters").is_null())
        tool.parameters = j.at("parameters").get<std::map<std::string, json>>();
    if (j.contains("profile_name") && !j.at("profile_name").is_null())
        tool.profile_name = j.at("profile_name").get<std::string>();
    if (j.contains("label") && !j.at("label").is_null())
        tool.label = j.at("label").get<std::string>();
}

bool UseAws::requires_acceptance() const
{
    for (auto op : kReadOnlyOps)
    {
        if (operation_name.compare(0, op.size(), op) == 0)
            return false;
    }
    return true;
}

std::vector<std::pair<std::string, std::string>> UseAws::cli_parameters() const
{
    std::vector<std::pair<std::string, std::string>> params;
    if (!parameters)
        return params;

    for (const auto& [name, value] : *parameters)
    {
        auto rendered = value.is_string() ? value.get<std::string>() : value.dump();
        params.emplace_back("--" + to_kebab_case(name), std::move(rendered));
    }
    return params;
}

std::vector<std::string> UseAws::command_args() const
{
    std::vector<std::string> args = {"--region", region};
    if (profile_name)
    {
        args.push_back("--profile");
        args.push_back(*profile_name);
    }
    args.push_back(service_name);
    args.push_back(operation_name);

    for (auto& [name, value] : cli_parameters())
    {
        args.push_back(name);
        if (!value.empty())
            args.push_back(value);
    }
    return args;
}

PermissionRequest UseAws::permission_request() const
{
    return PermissionRequest{ToolIdentity::builtin(kName), service_name, !requires_acceptance()};
}

InvokeOutput UseAws::invoke(const std::string& executable) const
{
    ProcessOptions options;
    options.redirect_stdin = false;
    options.redirect_stdout = true;
    options.redirect_stderr = true;

    std::string user_agent = std::string(kClientName) + " Version/" + kVersion;
    const char* existing = std::getenv(kUserAgentEnvVar);
    options.environment[kUserAgentEnvVar] =
        existing && existing[0] != '\0' ? std::string(existing) + " " + user_agent : user_agent;

    Process process;
    std::string out;
    std::string err;
    int status = 0;
    try
    {
        process.spawn(executable, command_args(), options);
        log::get()->debug("Running {} {} {} (pid {})", executable, service_name, operation_name, process.pid());

        std::thread stderr_reader([&] { err = read_all(process.stderr_pipe()); });
        try
        {
            out = read_all(process.stdout_pipe());
        }
        catch (const ProcessError&)
        {
            stderr_reader.join();
            throw;
        }
        stderr_reader.join();
        status = process.wait();
    }
    catch (const ProcessError& e)
    {
        throw ToolExecutionError("Unable to run " + executable + ": " + e.what());
    }

    auto stderr_text = cap_output(err);
    if (status != 0)
        throw ToolExecutionError(stderr_text);

    return InvokeOutput{JsonOutput{json{
        {"exit_status", std::to_string(status)},
        {"stdout", cap_output(out)},
        {"stderr", stderr_text},
    }}};
}

ToolSpec UseAws::spec()
{
    return ToolSpec{
        kName,
        "Make an AWS CLI api call with the specified service, operation, and parameters. "
        "All arguments MUST conform to the AWS CLI specification. Should the output of the "
        "invocation indicate a malformed command, invoke help to obtain the correct command.",
        json{
            {"type", "object"},
            {"properties",
             {
                 {"service_name",
                  {{"type", "string"}, {"description", "The name of the AWS service, e.g. s3."}}},
                 {"operation_name",
                  {{"type", "string"},
                   {"description", "The name of the operation to perform, in kebab case."}}},
                 {"parameters",
                  {{"type", "object"},
                   {"description", "Parameters for the operation, keyed by parameter name."}}},
                 {"region", {{"type", "string"}, {"description", "Region name, e.g. us-west-2."}}},
                 {"profile_name",
                  {{"type", "string"}, {"description", "Optional: AWS profile name from ~/.aws/credentials."}}},
                 {"label", {{"type", "string"}, {"description", "Human readable description of the call."}}},
             }},
            {"required", {"region", "service_name", "operation_name", "label"}},
        },
    };
}

} // namespace toolchat
