// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file util.hpp
/// @brief UTF-8 safe truncation, input sanitization and token estimates

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolchat
{

// =============================================================================
// Truncation
// =============================================================================

/// Suffix appended to content cut down to fit a budget
inline constexpr std::string_view kTruncatedSuffix = "...content truncated due to length";

/// Longest prefix of `s` that is at most `max_bytes` long and ends on a
/// UTF-8 character boundary
std::string_view truncate_safe(std::string_view s, size_t max_bytes);

/// Shorten `s` to at most `max_bytes`, ending it with `suffix`
///
/// No-op when `s` already fits. Otherwise `s` is cut on a character boundary
/// to `max_bytes - suffix.size()` and the suffix appended. When the suffix
/// alone does not fit, `s` is cut to `max_bytes` without it.
void truncate_safe_in_place(std::string& s, size_t max_bytes, std::string_view suffix);

// =============================================================================
// Sanitization
// =============================================================================

/// True for invisible Unicode tag, zero-width and format characters that can
/// smuggle hidden instructions into model input
bool is_hidden_code_point(char32_t c);

/// Remove hidden characters from UTF-8 text. Invalid bytes are kept as they are.
std::string sanitize_unicode_tags(std::string_view text);

// =============================================================================
// Token Estimates
// =============================================================================

/// Rough token estimates using a fixed characters-per-token ratio
class TokenCounter
{
  public:
    static constexpr size_t kTokenToCharRatio = 3;

    /// Estimated number of tokens in UTF-8 text
    static size_t count_tokens(std::string_view text);

    static constexpr size_t token_to_chars(size_t tokens)
    {
        return tokens * kTokenToCharRatio;
    }
};

/// (file name, content) pair of a context file
using ContextFile = std::pair<std::string, std::string>;

/// Greedily drop the largest files until the rest fit within `token_limit`
///
/// `files` is sorted largest first and keeps only the retained files.
/// @return The dropped files, largest first
std::vector<ContextFile> drop_matched_context_files(std::vector<ContextFile>& files, size_t token_limit);

} // namespace toolchat
