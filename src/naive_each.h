#if !defined(_FSEND_NAIVE_EACH_H_INCLUDED_)
#define _FSEND_NAIVE_EACH_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    typedef std::function<void(const char* /*data*/, size_t /*size*/)> chunk_consumer;


    //
    // Buffered fallback for when the connection can't be taken over:
    // every file is read in buffer_size pieces which are handed to a chunk_consumer.
    //
    // Keeps the same lifecycle contract as transfer_session. A consumer that throws a
    // disconnect-class error (transfer_error, or std::system_error with EPIPE/ECONNRESET/...)
    // aborts quietly; anything else aborts, errors and is rethrown after cleanup.
    //
    class naive_each
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(naive_each)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(naive_each)

        naive_each(file_source& source, lifecycle_callbacks callbacks, size_t buffer_size = transfer_defaults::BUFFER_SIZE);

        // May be called only once. Returns the total bytes handed to consumer.
        uint64_t each(const chunk_consumer& consumer);

        [[nodiscard]]
        uint64_t bytes_written_total() const noexcept { return _bytes_written_total; }

        [[nodiscard]]
        session_outcome outcome() const noexcept { return _outcome; }

        [[nodiscard]]
        const std::optional<transfer_failure>& failure() const noexcept { return _failure; }

    private:
        void read_file(const file_item& file, const chunk_consumer& consumer);

    private:
        file_source& _source;
        lifecycle_notifier _notifier;
        std::unique_ptr<char[]> _buffer;
        const size_t _buffer_size;

        bool _each_called = false;
        session_outcome _outcome = session_outcome::running;
        uint64_t _bytes_written_total = 0;
        std::optional<transfer_failure> _failure { };
    };

}  // namespace fsend

#endif  // !defined(_FSEND_NAIVE_EACH_H_INCLUDED_)
