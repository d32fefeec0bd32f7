#if !defined(_FSEND_SINK_H_INCLUDED_)
#define _FSEND_SINK_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    struct sink_capabilities
    {
        bool file_range_transfer = false;   // non-blocking file-to-connection transfer (try_send_file)
        bool bulk_file_copy = false;        // blocking kernel-assisted range copy (bulk_copy)
        bool poll_writable = false;         // wait_writable() actually polls
    };

    enum class poll_status
    {
        ready,
        not_ready,
        hang_up,
    };

    // Result of a single sink primitive: bytes >= 0 on success, otherwise error_code is an errno
    struct io_result
    {
        int64_t bytes = 0;
        int error_code = 0;

        [[nodiscard]]
        bool ok() const noexcept { return error_code == 0; }

        static io_result success(const int64_t bytes) noexcept { return io_result { bytes, 0 }; }
        static io_result failure(const int err) noexcept { return io_result { -1, err }; }
    };


    //
    // The output connection a transfer session writes to.
    // A sink is closed exactly once; closing it again is a no-op.
    // Operations on a closed sink fail with ENOTCONN.
    //
    class sink : public infra::disposable
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(sink)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(sink)
        sink() noexcept = default;

        [[nodiscard]]
        virtual sink_capabilities capabilities() const noexcept = 0;

        // Write up to size bytes; may be partial. Waits at most stall_timeout() for the sink to drain.
        virtual io_result write(const void* ptr, size_t size) = 0;

        // Non-blocking transfer of [offset, offset + length) from file_handle.
        // EAGAIN if the sink is not writable; 0 bytes at end of file.
        virtual io_result try_send_file(int file_handle, uint64_t offset, uint64_t length);

        // Blocking transfer of [offset, offset + length) from file_handle; may be partial.
        // Waits at most stall_timeout() at a time for the sink to drain.
        virtual io_result bulk_copy(int file_handle, uint64_t offset, uint64_t length);

        virtual poll_status wait_writable(std::chrono::milliseconds timeout);

        // Returns true only for the call that actually closed the sink
        bool close() noexcept { return this->dispose(); }

        [[nodiscard]]
        bool is_closed() const noexcept { return this->is_dispose_required(); }

        // How long write() and bulk_copy() wait for a stalled sink before failing with ETIMEDOUT
        void set_stall_timeout(const std::chrono::milliseconds timeout) noexcept { _stall_timeout = timeout; }

        [[nodiscard]]
        std::chrono::milliseconds stall_timeout() const noexcept { return _stall_timeout; }

    protected:
        std::chrono::milliseconds _stall_timeout = transfer_defaults::DEAD_PEER_TIMEOUT;
    };


    //
    // A sink over a file descriptor: socket, pipe, regular file or character device.
    // Capabilities are probed once from the descriptor type.
    //
    class fd_sink final : public sink
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(fd_sink)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(fd_sink)

        // If owned, the descriptor is closed when the sink is closed
        fd_sink(int handle, bool owned);
        ~fd_sink() noexcept override { this->dispose(); }

        [[nodiscard]]
        sink_capabilities capabilities() const noexcept override { return _capabilities; }

        io_result write(const void* ptr, size_t size) override;
        io_result try_send_file(int file_handle, uint64_t offset, uint64_t length) override;
        io_result bulk_copy(int file_handle, uint64_t offset, uint64_t length) override;
        poll_status wait_writable(std::chrono::milliseconds timeout) override;

        [[nodiscard]]
        int handle() const noexcept { return _handle; }

    protected:
        void dispose_impl() noexcept override;

    private:
        // 0 or errno
        int set_nonblock(bool enable);
        int prepare_blocking_io();
        bool ensure_pipe();
        void close_pipe() noexcept;

    private:
        static constexpr const int INVALID_HANDLE = -1;
        static constexpr const int PIPE_SIZE = 1024 * 1024;  // 1 MB

        int _handle = INVALID_HANDLE;
        const bool _owned;
        bool _is_socket = false;
        sink_capabilities _capabilities { };
        std::optional<bool> _nonblock { };

        // Intermediate pipe for splice(): file -> _pipe[1], _pipe[0] -> _handle
        int _pipe[2] { INVALID_HANDLE, INVALID_HANDLE };
        size_t _pipe_capacity = 0;
    };

}  // namespace fsend

#endif  // !defined(_FSEND_SINK_H_INCLUDED_)
