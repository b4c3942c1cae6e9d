// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

// POSIX implementation of the file-descriptor transport
// For Linux and macOS

#include <cerrno>
#include <claudecode/transport_pipe.hpp>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace claudecode
{

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1)
        throw TransportError("fcntl F_GETFD failed: " + get_errno_message());
    if (fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1)
        throw TransportError("fcntl F_SETFD failed: " + get_errno_message());
}

// =============================================================================
// PipeTransport implementation
// =============================================================================

PipeTransport::PipeTransport(Handle read_handle, Handle write_handle, bool owns_handles)
    : read_handle_(read_handle), owns_handles_(owns_handles), open_(true), write_handle_(write_handle)
{
    int wake[2] = {-1, -1};
    if (::pipe(wake) != 0)
        throw TransportError("Failed to create wake pipe: " + get_errno_message());

    wake_read_ = wake[0];
    wake_write_ = wake[1];

    try
    {
        set_cloexec(wake_read_);
        set_cloexec(wake_write_);
    }
    catch (...)
    {
        ::close(wake_read_);
        ::close(wake_write_);
        throw;
    }
}

PipeTransport::~PipeTransport()
{
    close();

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        close_write_handle();
    }

    if (owns_handles_ && read_handle_ != invalid_handle())
        ::close(read_handle_);
    read_handle_ = invalid_handle();

    if (wake_read_ != invalid_handle())
        ::close(wake_read_);
    if (wake_write_ != invalid_handle())
        ::close(wake_write_);
}

size_t PipeTransport::read(char* buffer, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    while (true)
    {
        struct pollfd fds[2];
        fds[0].fd = read_handle_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wake_read_;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int result = ::poll(fds, 2, -1);
        if (result < 0)
        {
            if (errno == EINTR)
                continue;
            throw TransportError("poll() failed: " + get_errno_message());
        }

        // Woken by close()
        if (fds[1].revents != 0 || !open_)
            return 0;

        if (fds[0].revents & POLLNVAL)
        {
            open_ = false;
            return 0;
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR))
        {
            ssize_t bytes_read = ::read(read_handle_, buffer, size);
            if (bytes_read < 0)
            {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                    continue;
                if (errno == EPIPE || errno == EBADF)
                {
                    open_ = false;
                    return 0;
                }
                throw TransportError("read() failed: " + get_errno_message());
            }

            if (bytes_read == 0)
                open_ = false;
            return static_cast<size_t>(bytes_read);
        }
    }
}

void PipeTransport::write(const char* data, size_t size)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    try
    {
        write_all(data, size);
    }
    catch (const TransportError&)
    {
        finish_write();
        throw;
    }
    finish_write();
}

/// Requires write_mutex_
void PipeTransport::write_all(const char* data, size_t size)
{
    if (!open_ || write_handle_ == invalid_handle())
        throw ConnectionClosedError();

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(write_handle_, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
            {
                open_ = false;
                throw ConnectionClosedError("Broken pipe (peer closed its input)");
            }
            throw TransportError("write() failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }
}

/// Requires write_mutex_. Performs a close() that arrived during the write.
void PipeTransport::finish_write()
{
    if (close_write_pending_.exchange(false))
        close_write_handle();
}

/// Requires write_mutex_
void PipeTransport::close_write_handle()
{
    Handle fd = write_handle_;
    write_handle_ = invalid_handle();
    // A shared read/write descriptor is closed with the read side
    if (owns_handles_ && fd != invalid_handle() && fd != read_handle_)
        ::close(fd);
}

void PipeTransport::release_write_handle()
{
    std::unique_lock<std::mutex> lock(write_mutex_, std::try_to_lock);
    if (!lock.owns_lock())
    {
        // The writer closes it when its write returns (or the destructor does)
        close_write_pending_ = true;
        return;
    }
    close_write_handle();
}

void PipeTransport::close()
{
    // Reader may already have flipped open_ on EOF; the write side is still released once
    if (open_.exchange(false) && wake_write_ != invalid_handle())
    {
        char byte = 1;
        while (::write(wake_write_, &byte, 1) < 0 && errno == EINTR)
        {
        }
    }

    release_write_handle();
}

} // namespace claudecode
