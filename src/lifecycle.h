#if !defined(_FSEND_LIFECYCLE_H_INCLUDED_)
#define _FSEND_LIFECYCLE_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    typedef std::function<void(uint64_t /*total_bytes*/)> total_callback;
    typedef std::function<void(uint64_t /*chunk_bytes*/, uint64_t /*total_bytes*/)> bytes_sent_callback;
    typedef std::function<void(const transfer_failure& /*failure*/)> failure_callback;

    typedef std::variant<total_callback, bytes_sent_callback, failure_callback> named_callback;


    //
    // The six hooks a caller may supply. Unset hooks are no-ops.
    //
    //  started(0)                   first, exactly once
    //  bytes_sent(n, total)         after every chunk accepted by the sink
    //  complete(total)              all files sent; exclusive with aborted
    //  aborted(failure)             transfer did not finish; exclusive with complete
    //  error(failure)               after aborted, only for application errors
    //  cleanup(total)               last, exactly once, whatever happened before
    //
    struct lifecycle_callbacks
    {
    public:
        total_callback started { nullptr };
        bytes_sent_callback bytes_sent { nullptr };
        total_callback complete { nullptr };
        failure_callback aborted { nullptr };
        failure_callback error { nullptr };
        total_callback cleanup { nullptr };

    public:
        // The fast_send.* hook set (started, bytes_sent, complete, aborted, error, cleanup) under the fsend. prefix
        static constexpr const char NAME_STARTED[] = "fsend.started";
        static constexpr const char NAME_BYTES_SENT[] = "fsend.bytes_sent";
        static constexpr const char NAME_COMPLETE[] = "fsend.complete";
        static constexpr const char NAME_ABORTED[] = "fsend.aborted";
        static constexpr const char NAME_ERROR[] = "fsend.error";
        static constexpr const char NAME_CLEANUP[] = "fsend.cleanup";

        static const std::vector<std::string>& recognized_names();

        // Build from a name -> hook map.
        // Throws configuration_error for an unrecognized name, or a hook whose signature doesn't match its name.
        static lifecycle_callbacks from_named(const std::map<std::string, named_callback>& hooks);
    };


    //
    // Fires lifecycle_callbacks and keeps the ordering/once-only rules.
    //
    // started() and bytes_sent() let callback exceptions escape: they abort the transfer.
    // The terminal notifications never throw; they return the exception the caller must
    // rethrow after cleanup (or nullptr).
    //
    class lifecycle_notifier
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(lifecycle_notifier)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(lifecycle_notifier)

        explicit lifecycle_notifier(lifecycle_callbacks callbacks) noexcept
            : _callbacks(std::move(callbacks))
        { }

        void started();
        void bytes_sent(uint64_t chunk_bytes, uint64_t total_bytes);

        [[nodiscard]]
        std::exception_ptr complete(uint64_t total_bytes) noexcept;

        // aborted, plus error if the failure is not a disconnect.
        // For an application failure, returns the failure's own exception.
        [[nodiscard]]
        std::exception_ptr abort(const transfer_failure& failure) noexcept;

        // No-op (returns nullptr) on every call after the first
        [[nodiscard]]
        std::exception_ptr cleanup(uint64_t total_bytes) noexcept;

        bool is_terminal_fired() const noexcept { return _terminal_fired; }
        bool is_cleanup_fired() const noexcept { return _cleanup_fired; }

    private:
        bool _started_fired = false;
        bool _terminal_fired = false;
        bool _cleanup_fired = false;

        const lifecycle_callbacks _callbacks;
    };

}  // namespace fsend

#endif  // !defined(_FSEND_LIFECYCLE_H_INCLUDED_)
