#if !defined(_FSEND_TRANSFER_TYPES_H_INCLUDED_)
#define _FSEND_TRANSFER_TYPES_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    //
    // How a failed transfer is treated by the session
    //
    enum class failure_kind
    {
        peer_disconnect,    // peer closed/reset, or never became writable in time: aborted only
        transient,          // broken pipe on a live connection: retried a bounded number of times
        application,        // anything else: aborted + error, then rethrown to the caller
    };

    const char* to_string(failure_kind kind) noexcept;

    // Map an errno reported by a transfer primitive to a failure kind
    failure_kind classify_errno(int err) noexcept;


    struct transfer_error : std::exception
    {
    public:
        const failure_kind kind;
        const int error_code;
        const std::string error_message;

    public:
        transfer_error(const failure_kind kind, const int error_code, std::string error_message) noexcept
            : kind(kind),
              error_code(error_code),
              error_message(std::move(error_message))
        { }

        const char* what() const noexcept override { return error_message.c_str(); }
    };


    // Raised before any transfer starts: unknown callback name, invalid options
    struct configuration_error : std::exception
    {
    public:
        const std::string error_message;

    public:
        explicit configuration_error(std::string error_message) noexcept
            : error_message(std::move(error_message))
        { }

        const char* what() const noexcept override { return error_message.c_str(); }
    };


    //
    // What aborted/error callbacks receive
    //
    struct transfer_failure
    {
    public:
        failure_kind kind = failure_kind::application;
        int error_code = 0;
        std::string message { };
        std::exception_ptr exception { nullptr };

    public:
        [[nodiscard]]
        bool is_disconnect() const noexcept { return kind != failure_kind::application; }

        // Classify an exception caught at a session boundary.
        // A transient failure that escaped its retry loop is reported as a peer disconnect.
        [[nodiscard]]
        static transfer_failure from_exception(std::exception_ptr ex);
    };


    struct chunk_range
    {
        uint64_t offset = 0;
        uint64_t length = 0;
    };


    //
    // Outcome of one transfer_strategy::transfer() call
    //
    struct transfer_result
    {
    public:
        enum class status_t
        {
            written,        // bytes (0..range.length) were accepted by the sink
            would_block,    // sink not writable right now; wait and retry the same range
            end_of_file,    // source ran out of bytes before the expected size
            failed,         // error_code/kind describe the failure
        };

        status_t status = status_t::written;
        uint64_t bytes = 0;
        int error_code = 0;
        failure_kind kind = failure_kind::application;

    public:
        static transfer_result written(const uint64_t bytes) noexcept
        {
            transfer_result result;
            result.status = status_t::written;
            result.bytes = bytes;
            return result;
        }

        static transfer_result would_block() noexcept
        {
            transfer_result result;
            result.status = status_t::would_block;
            return result;
        }

        static transfer_result end_of_file() noexcept
        {
            transfer_result result;
            result.status = status_t::end_of_file;
            return result;
        }

        static transfer_result failed(const int err) noexcept
        {
            transfer_result result;
            result.status = status_t::failed;
            result.error_code = err;
            result.kind = classify_errno(err);
            return result;
        }
    };

}  // namespace fsend

#endif  // !defined(_FSEND_TRANSFER_TYPES_H_INCLUDED_)
