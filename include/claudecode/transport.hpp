// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace claudecode
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

/// Exception thrown when connection is closed
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

/// Exception thrown when a line exceeds the framer's size limit.
/// The framer has already skipped past the offending line when this is thrown.
class LineTooLongError : public TransportError
{
  public:
    LineTooLongError(size_t limit, std::string prefix)
        : TransportError("Line exceeds maximum size of " + std::to_string(limit) + " bytes"),
          prefix_(std::move(prefix))
    {
    }

    /// First bytes of the discarded line
    const std::string& prefix() const
    {
        return prefix_;
    }

  private:
    std::string prefix_;
};

// =============================================================================
// Transport Interface
// =============================================================================

/// Abstract interface for raw byte I/O transport
///
/// Implementations provide the underlying byte stream (pipes to a child process,
/// in-memory buffers in tests, etc.). Framing is handled separately by LineFramer.
///
/// Implementations must allow close() to be called from another thread while a
/// read() is blocked, and must make that read() return promptly.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Read up to `size` bytes into buffer
    /// @param buffer Destination buffer
    /// @param size Maximum bytes to read
    /// @return Number of bytes actually read (0 indicates EOF)
    /// @throws TransportError on read failure
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Write all bytes to the transport
    /// @param data Source data
    /// @param size Number of bytes to write
    /// @throws TransportError on write failure
    virtual void write(const char* data, size_t size) = 0;

    /// Close the transport
    virtual void close() = 0;

    /// Check if transport is open
    virtual bool is_open() const = 0;

    // Convenience overloads
    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }

    void write(const std::vector<char>& data)
    {
        write(data.data(), data.size());
    }
};

// =============================================================================
// Newline-delimited Line Framer
// =============================================================================

/// Handles newline framing for the stream-json protocol
///
/// Message format:
/// ```
/// <json-object>\n
/// ```
///
/// Every message is exactly one line. A trailing `\r` is stripped on read so
/// peers that emit CRLF are tolerated.
class LineFramer
{
  public:
    /// Default maximum line size (1 MiB)
    static constexpr size_t kDefaultMaxLineSize = 1024 * 1024;

    explicit LineFramer(ITransport& transport, size_t max_line_size = kDefaultMaxLineSize)
        : transport_(transport), max_line_size_(max_line_size)
    {
    }

    /// Read the next complete line
    /// @return The line without its terminator, or std::nullopt on clean EOF
    /// @throws LineTooLongError if the line exceeds the size limit (stream stays usable)
    /// @throws TransportError on read failure
    std::optional<std::string> read_line();

    /// Write a message followed by exactly one newline
    /// @param message The message content to send; must not contain a newline
    /// @throws TransportError on write failure
    void write_line(const std::string& message);

    size_t max_line_size() const
    {
        return max_line_size_;
    }

  private:
    ITransport& transport_;
    size_t max_line_size_;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;

    /// Refill the buffer; returns false on EOF
    bool fill_buffer();

    /// Discard input up to and including the next newline
    void skip_line();
};

// =============================================================================
// Inline implementations
// =============================================================================

inline std::optional<std::string> LineFramer::read_line()
{
    std::string line;

    while (true)
    {
        if (buffer_pos_ >= buffer_len_)
        {
            if (!fill_buffer())
            {
                // EOF: a trailing unterminated fragment is still delivered so the
                // caller can report it; an empty tail is a clean end of stream.
                if (line.empty())
                    return std::nullopt;
                return line;
            }
        }

        char c = buffer_[buffer_pos_++];

        if (c == '\n')
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }

        line += c;

        if (line.size() > max_line_size_)
        {
            std::string prefix = line.substr(0, 64);
            skip_line();
            throw LineTooLongError(max_line_size_, std::move(prefix));
        }
    }
}

inline void LineFramer::write_line(const std::string& message)
{
    if (message.find('\n') != std::string::npos)
        throw TransportError("Refusing to write a message containing a newline");

    std::string frame;
    frame.reserve(message.size() + 1);
    frame += message;
    frame += '\n';
    transport_.write(frame);
}

inline bool LineFramer::fill_buffer()
{
    constexpr size_t kMinBufferSize = 4096;
    if (buffer_.size() < kMinBufferSize)
        buffer_.resize(kMinBufferSize);

    buffer_pos_ = 0;
    buffer_len_ = transport_.read(buffer_.data(), buffer_.size());
    return buffer_len_ > 0;
}

inline void LineFramer::skip_line()
{
    while (true)
    {
        if (buffer_pos_ >= buffer_len_ && !fill_buffer())
            return;
        if (buffer_[buffer_pos_++] == '\n')
            return;
    }
}

} // namespace claudecode
