// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file transport_pipe.hpp
/// @brief POSIX file-descriptor transport with an interruptible read

#include <atomic>
#include <claudecode/transport.hpp>
#include <mutex>

namespace claudecode
{

/// Transport over a pair of POSIX file descriptors
///
/// Typically the stdout/stdin pipe pair of an already spawned agent process,
/// or STDIN_FILENO/STDOUT_FILENO when this program is itself the child.
///
/// A blocked read() waits in poll() on both the read descriptor and an
/// internal wake pipe, so close() from another thread unblocks it without
/// closing a descriptor that is still being polled.
///
/// @note Writing to a pipe whose reader has exited raises SIGPIPE unless the
///       embedding application ignores that signal.
class PipeTransport : public ITransport
{
  public:
    using Handle = int;

    static constexpr Handle invalid_handle()
    {
        return -1;
    }

    /// Construct from read/write handles
    /// @param read_handle Handle to read from (e.g., process stdout)
    /// @param write_handle Handle to write to (e.g., process stdin)
    /// @param owns_handles If true, handles will be closed by this transport
    /// @throws TransportError if the wake pipe cannot be created
    PipeTransport(Handle read_handle, Handle write_handle, bool owns_handles = true);

    ~PipeTransport() override;

    // Non-copyable, non-movable (a reader thread may hold `this`)
    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;
    PipeTransport(PipeTransport&&) = delete;
    PipeTransport& operator=(PipeTransport&&) = delete;

    using ITransport::write;

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;

    /// Mark closed, wake any blocked reader and close the write side.
    /// A write in progress keeps the write side open until it returns.
    /// The read side is released on destruction. Idempotent.
    void close() override;

    bool is_open() const override
    {
        return open_;
    }

    Handle read_handle() const
    {
        return read_handle_;
    }

  private:
    void write_all(const char* data, size_t size);
    void finish_write();
    void close_write_handle();
    void release_write_handle();

    Handle read_handle_;
    bool owns_handles_;
    std::atomic<bool> open_;

    // The write descriptor is only touched under write_mutex_, so it cannot be
    // closed (and its number reused) while a write is still using it
    std::mutex write_mutex_;
    Handle write_handle_;
    std::atomic<bool> close_write_pending_{false};

    Handle wake_read_ = invalid_handle();
    Handle wake_write_ = invalid_handle();
};

} // namespace claudecode
