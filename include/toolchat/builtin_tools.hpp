// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file builtin_tools.hpp
/// @brief Tools implemented in-process rather than by a tool server

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <toolchat/permission.hpp>
#include <toolchat/tool_invocation.hpp>
#include <toolchat/types.hpp>
#include <utility>
#include <vector>

namespace toolchat
{

/// A built-in tool ran but failed (non-zero exit, spawn failure)
class ToolExecutionError : public std::runtime_error
{
  public:
    explicit ToolExecutionError(const std::string& message) : std::runtime_error(message) {}
};

/// `TableName` -> `table-name`, `max_items` -> `max-items`
std::string to_kebab_case(std::string_view name);

// =============================================================================
// use_aws
// =============================================================================

/// Runs one AWS CLI operation
///
/// Operations starting with get, describe, list, ls, search or batch_get are
/// read-only and run without asking. Allow-listing `use_aws` with a settings
/// block narrows it per service:
///
/// @code
/// "toolsSettings": { "use_aws": { "allowedServices": ["s3"], "deniedServices": ["iam"] } }
/// @endcode
struct UseAws
{
    static constexpr const char* kName = "use_aws";

    std::string service_name;
    std::string operation_name;
    std::optional<std::map<std::string, json>> parameters;
    std::string region;
    std::optional<std::string> profile_name;
    std::optional<std::string> label;

    /// False for read-only operations
    bool requires_acceptance() const;

    /// Parameters as `--kebab-name value` pairs; an empty string value is a flag
    std::vector<std::pair<std::string, std::string>> cli_parameters() const;

    /// Full argument list after the executable
    std::vector<std::string> command_args() const;

    PermissionRequest permission_request() const;

    PermissionDecision eval_perm(const AgentPolicy& policy) const
    {
        return evaluate_permission(permission_request(), policy);
    }

    /// Run the CLI and capture its output
    ///
    /// stdout and stderr are each capped at a third of kMaxToolResponseSize.
    /// @throws ToolExecutionError with stderr on a non-zero exit
    InvokeOutput invoke(const std::string& executable = "aws") const;

    /// Catalogue entry presented to the model
    static ToolSpec spec();
};

/// @throws json::exception on missing or mistyped fields
void from_json(const json& j, UseAws& tool);

} // namespace toolchat
