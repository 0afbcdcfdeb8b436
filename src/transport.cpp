// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cctype>
#include <optional>
#include <toolchat/transport.hpp>

namespace toolchat
{

namespace
{

constexpr size_t kReadChunkSize = 4096;

/// Upper bound for a single line, protects against a peer that never sends '\n'
constexpr size_t kMaxLineSize = 64 * 1024 * 1024;

/// Upper bound for a Content-Length body
constexpr size_t kMaxFrameSize = kMaxLineSize;

} // namespace

std::string MessageFramer::read_message()
{
    if (framing_ == Framing::ContentLength)
        return read_content_length_message();

    while (true)
    {
        auto line = read_line();
        if (line.find_first_not_of(" \t") != std::string::npos)
            return line;
    }
}

void MessageFramer::write_message(const std::string& message)
{
    if (framing_ == Framing::ContentLength)
    {
        transport_.write(
            "Content-Length: " + std::to_string(message.size()) + "\r\n\r\n" + message
        );
        return;
    }

    if (message.find('\n') != std::string::npos)
        throw TransportError("Newline-delimited message must not contain a newline");
    transport_.write(message + "\n");
}

std::string MessageFramer::read_content_length_message()
{
    std::optional<size_t> content_length;

    while (true)
    {
        auto line = read_line();
        if (line.empty())
            break;

        const std::string prefix = "content-length:";
        std::string lower_line = line;
        for (auto& c : lower_line)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (lower_line.compare(0, prefix.size(), prefix) == 0)
        {
            auto value = line.substr(prefix.size());
            value.erase(0, value.find_first_not_of(" \t"));
            if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front())))
                throw TransportError("Invalid Content-Length value: " + value);
            try
            {
                content_length = std::stoull(value);
            }
            catch (const std::logic_error&)
            {
                throw TransportError("Invalid Content-Length value: " + value);
            }
        }
    }

    if (!content_length)
        throw TransportError("Missing Content-Length header");
    if (*content_length > kMaxFrameSize)
        throw TransportError("Content-Length exceeds maximum frame size");

    std::string message(*content_length, '\0');
    read_exact(message.data(), *content_length);
    return message;
}

void MessageFramer::read_exact(char* buffer, size_t n)
{
    size_t total = 0;
    while (total < n)
    {
        if (buffer_pos_ >= buffer_len_ && !fill_buffer())
            throw ConnectionClosedError("Connection closed while reading message body");

        size_t take = std::min(n - total, buffer_len_ - buffer_pos_);
        std::copy_n(buffer_.data() + buffer_pos_, take, buffer + total);
        buffer_pos_ += take;
        total += take;
    }
}

std::string MessageFramer::read_line()
{
    std::string line;

    while (true)
    {
        if (buffer_pos_ >= buffer_len_ && !fill_buffer())
            throw ConnectionClosedError("Connection closed while reading message");

        auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_pos_);
        auto end = buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_len_);
        auto newline = std::find(begin, end, '\n');

        line.append(begin, newline);
        buffer_pos_ = static_cast<size_t>(newline - buffer_.begin());

        if (line.size() > kMaxLineSize)
            throw TransportError("Incoming line exceeds maximum frame size");

        if (newline != end)
        {
            ++buffer_pos_;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }
    }
}

bool MessageFramer::fill_buffer()
{
    if (buffer_.size() < kReadChunkSize)
        buffer_.resize(kReadChunkSize);

    buffer_pos_ = 0;
    buffer_len_ = transport_.read(buffer_.data(), buffer_.size());
    return buffer_len_ > 0;
}

} // namespace toolchat
