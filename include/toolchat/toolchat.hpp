// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file toolchat.hpp
/// @brief Master include for toolchat
///
/// Pulls in every public header. Individual headers can be included instead.

#include <toolchat/builtin_tools.hpp>
#include <toolchat/config.hpp>
#include <toolchat/conversation.hpp>
#include <toolchat/jsonrpc.hpp>
#include <toolchat/log.hpp>
#include <toolchat/message.hpp>
#include <toolchat/permission.hpp>
#include <toolchat/process.hpp>
#include <toolchat/session.hpp>
#include <toolchat/tool_invocation.hpp>
#include <toolchat/tool_manager.hpp>
#include <toolchat/transport.hpp>
#include <toolchat/transport_process.hpp>
#include <toolchat/types.hpp>
#include <toolchat/util.hpp>
