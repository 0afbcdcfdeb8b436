// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolchat
{

// =============================================================================
// Transport Exceptions
// =============================================================================

/// Exception thrown when transport operations fail
class TransportError : public std::runtime_error
{
  public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/// Exception thrown when the peer closed the stream
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

// =============================================================================
// Transport Interface
// =============================================================================

/// Abstract interface for raw byte I/O transport
///
/// Implementations provide the byte stream (child process pipes, in-memory
/// pairs in tests). Framing is handled separately by MessageFramer.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Read up to `size` bytes into buffer
    /// @return Number of bytes actually read (0 indicates EOF)
    /// @throws TransportError on read failure
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Write all bytes to the transport
    /// @throws TransportError on write failure
    virtual void write(const char* data, size_t size) = 0;

    /// Close the transport. Must unblock a concurrent read().
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }
};

// =============================================================================
// Message Framer
// =============================================================================

/// Wire framing of JSON-RPC messages
enum class Framing
{
    /// One JSON value per line (MCP stdio transport)
    NewlineDelimited,
    /// LSP-style `Content-Length: N\r\n\r\n<body>` headers
    ContentLength,
};

/// Splits a byte stream into JSON-RPC message bodies and back
///
/// Newline-delimited framing skips blank lines and strips a trailing `\r`.
/// Messages written in this mode must not contain raw newlines, which holds
/// for compact `json::dump()` output.
class MessageFramer
{
  public:
    explicit MessageFramer(ITransport& transport, Framing framing = Framing::NewlineDelimited)
        : transport_(transport), framing_(framing)
    {
    }

    /// Read a complete message body
    /// @throws TransportError on invalid framing
    /// @throws ConnectionClosedError if the stream ends
    std::string read_message();

    /// Write one message as a single transport write
    void write_message(const std::string& message);

    Framing framing() const
    {
        return framing_;
    }

  private:
    std::string read_line();
    std::string read_content_length_message();
    void read_exact(char* buffer, size_t n);

    /// Refill the internal buffer; returns false on EOF
    bool fill_buffer();

    ITransport& transport_;
    Framing framing_;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;
};

} // namespace toolchat
