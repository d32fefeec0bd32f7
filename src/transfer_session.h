#if !defined(_FSEND_TRANSFER_SESSION_H_INCLUDED_)
#define _FSEND_TRANSFER_SESSION_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    enum class session_outcome
    {
        running,
        completed,
        aborted,
    };

    const char* to_string(session_outcome outcome) noexcept;


    //
    // Drives every file of a file_source through one transfer_strategy into one sink.
    //
    // The session owns the sink for its whole lifetime: it closes it exactly once, and fires
    // cleanup after that, on every exit path of run(). Peer disconnects end the session quietly
    // (aborted only); anything else fires aborted + error and is rethrown after cleanup.
    //
    class transfer_session
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(transfer_session)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(transfer_session)

        transfer_session(
            file_source& source,
            sink& out,
            transfer_strategy& strategy,
            lifecycle_callbacks callbacks,
            const transfer_options& options);

        ~transfer_session() noexcept { this->close(); }

        // May be called only once. Returns the total bytes written.
        uint64_t run();

        // Close the sink and settle cleanup. Safe to call any number of times;
        // never fires a callback twice.
        void close() noexcept;

        [[nodiscard]]
        uint64_t bytes_written_total() const noexcept { return _bytes_written_total; }

        [[nodiscard]]
        session_outcome outcome() const noexcept { return _outcome; }

        [[nodiscard]]
        uint32_t consecutive_transient_failures() const noexcept { return _consecutive_transient_failures; }

        // Set once the session is aborted
        [[nodiscard]]
        const std::optional<transfer_failure>& failure() const noexcept { return _failure; }

        // nullptr outside of a file's transfer
        [[nodiscard]]
        const file_item* current_file() const noexcept { return _current_file; }

        [[nodiscard]]
        uint64_t remaining_in_file() const noexcept { return _remaining_in_file; }

    private:
        void transfer_file(const file_item& file);
        void wait_writable();
        void on_transient_failure(const transfer_result& result);

        [[nodiscard]]
        std::exception_ptr finalize() noexcept;

    private:
        file_source& _source;
        sink& _sink;
        transfer_strategy& _strategy;
        const transfer_options _options;

        lifecycle_notifier _notifier;
        const chunk_planner _planner;
        timeout_guard _guard;

        bool _run_called = false;
        session_outcome _outcome = session_outcome::running;
        uint64_t _bytes_written_total = 0;
        uint32_t _consecutive_transient_failures = 0;
        std::optional<transfer_failure> _failure { };

        const file_item* _current_file = nullptr;
        uint64_t _remaining_in_file = 0;
    };

}  // namespace fsend

#endif  // !defined(_FSEND_TRANSFER_SESSION_H_INCLUDED_)
