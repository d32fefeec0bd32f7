#include "common.h"


//==============================================================================
// class sink
//==============================================================================

fsend::io_result fsend::sink::try_send_file(
    [[maybe_unused]] const int file_handle,
    [[maybe_unused]] const uint64_t offset,
    [[maybe_unused]] const uint64_t length)
{
    return io_result::failure(this->is_closed() ? ENOTCONN : ENOTSUP);
}

fsend::io_result fsend::sink::bulk_copy(
    [[maybe_unused]] const int file_handle,
    [[maybe_unused]] const uint64_t offset,
    [[maybe_unused]] const uint64_t length)
{
    return io_result::failure(this->is_closed() ? ENOTCONN : ENOTSUP);
}

fsend::poll_status fsend::sink::wait_writable([[maybe_unused]] const std::chrono::milliseconds timeout)
{
    // A sink that can't be polled is assumed writable
    return this->is_closed() ? poll_status::hang_up : poll_status::ready;
}



//==============================================================================
// class fd_sink
//==============================================================================

namespace
{
    // Wait until the descriptor is writable again, at most budget in total.
    // 0 when writable, ETIMEDOUT when the budget ran out, ECONNRESET on hang-up.
    int wait_until_writable(const int handle, const std::chrono::milliseconds budget)
    {
        const auto deadline = std::chrono::steady_clock::now() + budget;
        while (true) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return ETIMEDOUT;
            }

            pollfd pfd { };
            pfd.fd = handle;
            pfd.events = POLLOUT;
            const int ret = poll(&pfd, 1, (int)std::min<int64_t>(left.count(), std::numeric_limits<int>::max()));
            if (ret < 0) {
                const int err = errno;
                if (err == EINTR) continue;
                LOG_WARN("poll() on sink handle {} failed. {}", handle, infra::errno_description(err));
                return ECONNRESET;
            }
            if (ret == 0) {
                continue;
            }
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                return ECONNRESET;
            }
            if (pfd.revents & POLLOUT) {
                return 0;
            }
        }
    }

    constexpr uint64_t MAX_SYSCALL_LENGTH = 0x7ffff000;  // what Linux transfers in one call at most

}  // namespace


fsend::fd_sink::fd_sink(const int handle, const bool owned)
    : _handle(handle),
      _owned(owned)
{
    ASSERT(handle >= 0);

    struct stat64 st { };
    if (fstat64(_handle, &st) != 0) {
        const int err = errno;
        LOG_ERROR("fstat64() on sink handle {} failed. {}", _handle, infra::errno_description(err));
        this->dispose();
        THROW_SYSTEM_ERROR(err, fstat64);
    }

    if (S_ISSOCK(st.st_mode)) {
        _capabilities.file_range_transfer = true;
        _capabilities.bulk_file_copy = true;
        _capabilities.poll_writable = true;
    }
    else if (S_ISFIFO(st.st_mode)) {
        _capabilities.file_range_transfer = true;
        _capabilities.bulk_file_copy = true;
        _capabilities.poll_writable = true;
    }
    else if (S_ISREG(st.st_mode)) {
        // Never "would block": only the blocking copy makes sense
        _capabilities.bulk_file_copy = true;
    }
    else if (S_ISCHR(st.st_mode)) {
        _capabilities.poll_writable = true;
    }

    _is_socket = S_ISSOCK(st.st_mode);

    LOG_DEBUG("Sink handle {}: file_range_transfer={}, bulk_file_copy={}, poll_writable={}",
              _handle, _capabilities.file_range_transfer, _capabilities.bulk_file_copy, _capabilities.poll_writable);
}

void fsend::fd_sink::dispose_impl() noexcept
{
    close_pipe();

    if (_handle != INVALID_HANDLE) {
        if (!_owned && _nonblock.value_or(false)) {
            // Hand the descriptor back the way we found it
            (void)set_nonblock(false);
        }
        if (_owned) {
            if (_is_socket) {
                (void)shutdown(_handle, SHUT_RDWR);
            }
            if (::close(_handle) != 0) {
                LOG_WARN("close() sink handle {} failed. {}", _handle, infra::errno_description(errno));
            }
        }
        LOG_TRACE("Sink handle {} closed (owned={})", _handle, _owned);
        _handle = INVALID_HANDLE;
    }
}

int fsend::fd_sink::set_nonblock(const bool enable)
{
    if (_nonblock.has_value() && _nonblock.value() == enable) {
        return 0;
    }

    int flags = fcntl(_handle, F_GETFL);
    if (flags == -1) {
        const int err = errno;
        LOG_ERROR("fcntl(F_GETFL) on sink handle {} failed. {}", _handle, infra::errno_description(err));
        return err;
    }

    if (enable)
        flags |= O_NONBLOCK;
    else
        flags &= ~O_NONBLOCK;

    if (fcntl(_handle, F_SETFL, flags) == -1) {
        const int err = errno;
        LOG_ERROR("fcntl(F_SETFL) on sink handle {} failed. {}", _handle, infra::errno_description(err));
        return err;
    }

    _nonblock = enable;
    return 0;
}

int fsend::fd_sink::prepare_blocking_io()
{
    // A pollable sink is driven non-blocking so that a stalled peer can't park us in the kernel:
    // EAGAIN is turned into a bounded wait_until_writable() instead
    if (!_capabilities.poll_writable) {
        return 0;
    }
    return set_nonblock(true);
}

bool fsend::fd_sink::ensure_pipe()
{
    if (_pipe[0] != INVALID_HANDLE) {
        return true;
    }

    if (pipe2(_pipe, O_CLOEXEC) != 0) {
        LOG_ERROR("pipe2() failed. {}", infra::errno_description(errno));
        _pipe[0] = _pipe[1] = INVALID_HANDLE;
        return false;
    }

    // A larger pipe means fewer splice() round trips; the default size is fine if this fails
    if (fcntl(_pipe[1], F_SETPIPE_SZ, PIPE_SIZE) == -1) {
        LOG_DEBUG("fcntl(F_SETPIPE_SZ, {}) failed. {}", PIPE_SIZE, infra::errno_description(errno));
    }

    const int capacity = fcntl(_pipe[1], F_GETPIPE_SZ);
    _pipe_capacity = (capacity > 0) ? (size_t)capacity : (size_t)65536;
    LOG_TRACE("Created splice pipe with capacity {}", _pipe_capacity);
    return true;
}

void fsend::fd_sink::close_pipe() noexcept
{
    for (int& h : _pipe) {
        if (h != INVALID_HANDLE) {
            (void)::close(h);
            h = INVALID_HANDLE;
        }
    }
    _pipe_capacity = 0;
}

fsend::io_result fsend::fd_sink::write(const void* const ptr, const size_t size)
{
    if (this->is_closed()) {
        return io_result::failure(ENOTCONN);
    }
    const int nonblock_err = prepare_blocking_io();
    if (nonblock_err != 0) {
        return io_result::failure(nonblock_err);
    }

    const infra::sigpipe_blocker no_sigpipe;
    while (true) {
        const ssize_t cnt = _is_socket
            ? ::send(_handle, ptr, size, MSG_NOSIGNAL)
            : ::write(_handle, ptr, size);
        if (cnt >= 0) {
            return io_result::success(cnt);
        }

        const int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err == EAGAIN || err == EWOULDBLOCK) {
            const int wait_err = wait_until_writable(_handle, _stall_timeout);
            if (wait_err == 0) continue;
            LOG_DEBUG("Sink handle {} not writable: {}", _handle, infra::errno_description(wait_err));
            return io_result::failure(wait_err);
        }
        return io_result::failure(err);
    }
}

fsend::io_result fsend::fd_sink::try_send_file(const int file_handle, const uint64_t offset, const uint64_t length)
{
    if (this->is_closed()) {
        return io_result::failure(ENOTCONN);
    }
    if (!_capabilities.file_range_transfer) {
        return io_result::failure(ENOTSUP);
    }
    const int nonblock_err = set_nonblock(true);
    if (nonblock_err != 0) {
        return io_result::failure(nonblock_err);
    }

    const infra::sigpipe_blocker no_sigpipe;
    off64_t mutable_off = (off64_t)offset;
    const ssize_t cnt = sendfile64(_handle, file_handle, &mutable_off, (size_t)std::min(length, MAX_SYSCALL_LENGTH));
    if (cnt < 0) {
        const int err = errno;
        return io_result::failure(err == EWOULDBLOCK ? EAGAIN : err);
    }
    return io_result::success(cnt);
}

fsend::io_result fsend::fd_sink::bulk_copy(const int file_handle, const uint64_t offset, const uint64_t length)
{
    if (this->is_closed()) {
        return io_result::failure(ENOTCONN);
    }
    if (!_capabilities.bulk_file_copy) {
        return io_result::failure(ENOTSUP);
    }
    if (!ensure_pipe()) {
        return io_result::failure(EMFILE);
    }
    const int nonblock_err = prepare_blocking_io();
    if (nonblock_err != 0) {
        return io_result::failure(nonblock_err);
    }

    const infra::sigpipe_blocker no_sigpipe;
    constexpr unsigned int flags = SPLICE_F_MOVE | SPLICE_F_MORE;

    // pipe -> pipe splice ignores O_NONBLOCK of the sink and only honors SPLICE_F_NONBLOCK
    const unsigned int drain_flags = _capabilities.poll_writable ? (flags | SPLICE_F_NONBLOCK) : flags;

    uint64_t total = 0;
    loff_t in_off = (loff_t)offset;

    while (total < length) {
        const size_t want = (size_t)std::min<uint64_t>(length - total, _pipe_capacity);
        const ssize_t filled = splice(file_handle, &in_off, _pipe[1], nullptr, want, flags);
        if (filled < 0) {
            const int err = errno;
            if (err == EINTR) continue;
            LOG_DEBUG("splice(file -> pipe, offset={}, len={}) failed. {}", in_off, want, infra::errno_description(err));
            return (total > 0) ? io_result::success((int64_t)total) : io_result::failure(err);
        }
        if (filled == 0) {
            break;  // end of file
        }

        size_t left = (size_t)filled;
        while (left > 0) {
            const ssize_t drained = splice(_pipe[0], nullptr, _handle, nullptr, left, drain_flags);
            if (drained < 0) {
                const int err = errno;
                if (err == EINTR) continue;

                int failure = err;
                if (err == EAGAIN) {
                    failure = wait_until_writable(_handle, _stall_timeout);
                    if (failure == 0) continue;
                }

                // What is still in the pipe was never sent: drop it, the caller resends from offset + total
                LOG_DEBUG("splice(pipe -> sink, len={}) failed. {}", left, infra::errno_description(failure));
                close_pipe();
                total += (uint64_t)filled - left;
                return (total > 0) ? io_result::success((int64_t)total) : io_result::failure(failure);
            }
            left -= (size_t)drained;
        }
        total += (uint64_t)filled;
    }

    return io_result::success((int64_t)total);
}

fsend::poll_status fsend::fd_sink::wait_writable(const std::chrono::milliseconds timeout)
{
    if (this->is_closed()) {
        return poll_status::hang_up;
    }

    pollfd pfd { };
    pfd.fd = _handle;
    pfd.events = POLLOUT;

    const int ret = poll(&pfd, 1, (int)timeout.count());
    if (ret < 0) {
        const int err = errno;
        if (err == EINTR) {
            return poll_status::not_ready;
        }
        LOG_WARN("poll() on sink handle {} failed. {}", _handle, infra::errno_description(err));
        return poll_status::hang_up;
    }
    if (ret == 0) {
        return poll_status::not_ready;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        return poll_status::hang_up;
    }
    return (pfd.revents & POLLOUT) ? poll_status::ready : poll_status::not_ready;
}
