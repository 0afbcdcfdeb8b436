// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <toolchat/log.hpp>
#include <toolchat/util.hpp>

namespace toolchat
{

namespace
{

bool is_continuation_byte(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

/// Decode the sequence starting at text[pos]; returns its length, 0 if invalid
size_t decode_utf8(std::string_view text, size_t pos, char32_t& out)
{
    auto lead = static_cast<unsigned char>(text[pos]);
    size_t len = 0;
    char32_t cp = 0;

    if (lead < 0x80)
    {
        out = lead;
        return 1;
    }
    if ((lead & 0xE0) == 0xC0)
    {
        len = 2;
        cp = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        len = 3;
        cp = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        len = 4;
        cp = lead & 0x07;
    }
    else
        return 0;

    if (pos + len > text.size())
        return 0;

    for (size_t i = 1; i < len; ++i)
    {
        auto c = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation_byte(c))
            return 0;
        cp = (cp << 6) | (c & 0x3F);
    }

    out = cp;
    return len;
}

} // namespace

std::string_view truncate_safe(std::string_view s, size_t max_bytes)
{
    if (s.size() <= max_bytes)
        return s;

    size_t end = max_bytes;
    while (end > 0 && is_continuation_byte(static_cast<unsigned char>(s[end])))
        --end;
    return s.substr(0, end);
}

void truncate_safe_in_place(std::string& s, size_t max_bytes, std::string_view suffix)
{
    if (s.size() <= max_bytes)
        return;

    if (suffix.size() > max_bytes)
    {
        s.resize(truncate_safe(s, max_bytes).size());
        return;
    }

    auto end = truncate_safe(s, max_bytes - suffix.size()).size();
    s.resize(end);
    s.append(suffix);
}

bool is_hidden_code_point(char32_t c)
{
    return (c >= 0xE0000 && c <= 0xE007F) || // tag characters
           (c >= 0x200B && c <= 0x200F) ||   // zero-width space, joiners, direction marks
           (c >= 0x2028 && c <= 0x202F) ||   // line/paragraph separators, embedding controls
           (c >= 0x205F && c <= 0x206F) ||   // format controls
           (c >= 0xFFF0 && c <= 0xFFFC) || (c >= 0xFFFE && c <= 0xFFFF);
}

std::string sanitize_unicode_tags(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    size_t removed = 0;

    size_t pos = 0;
    while (pos < text.size())
    {
        char32_t cp = 0;
        auto len = decode_utf8(text, pos, cp);
        if (len == 0)
        {
            out.push_back(text[pos++]);
            continue;
        }

        if (is_hidden_code_point(cp))
            ++removed;
        else
            out.append(text.substr(pos, len));
        pos += len;
    }

    if (removed > 0)
        log::get()->debug("Detected and removed {} hidden chars", removed);
    return out;
}

size_t TokenCounter::count_tokens(std::string_view text)
{
    auto chars = static_cast<size_t>(std::count_if(
        text.begin(), text.end(), [](char c) { return !is_continuation_byte(static_cast<unsigned char>(c)); }
    ));
    return chars / kTokenToCharRatio;
}

std::vector<ContextFile> drop_matched_context_files(std::vector<ContextFile>& files, size_t token_limit)
{
    std::stable_sort(
        files.begin(),
        files.end(),
        [](const ContextFile& a, const ContextFile& b)
        { return TokenCounter::count_tokens(a.second) > TokenCounter::count_tokens(b.second); }
    );

    std::vector<ContextFile> kept;
    std::vector<ContextFile> dropped;
    size_t total = 0;

    for (auto& file : files)
    {
        auto size = TokenCounter::count_tokens(file.second);
        if (total + size > token_limit)
        {
            dropped.push_back(std::move(file));
        }
        else
        {
            total += size;
            kept.push_back(std::move(file));
        }
    }

    files = std::move(kept);
    return dropped;
}

} // namespace toolchat
