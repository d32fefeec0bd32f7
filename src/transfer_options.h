#if !defined(_FSEND_TRANSFER_OPTIONS_H_INCLUDED_)
#define _FSEND_TRANSFER_OPTIONS_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    struct transfer_defaults
    {
        // Bytes per transfer primitive call. Bounds syscall size (sendfile is limited by off_t)
        // and gives the bytes_sent callback a useful granularity.
        static constexpr const uint64_t CHUNK_SIZE = 2 * 1024 * 1024;  // 2 MB
        static constexpr const uint64_t MAX_CHUNK_SIZE = 1024 * 1024 * 1024;  // 1 GB

        // Time between writability polls while a non-blocking send would block
        static constexpr const std::chrono::milliseconds POLL_INTERVAL { 250 };

        // How long a sink may stay unwritable before the peer is considered dead
        static constexpr const std::chrono::milliseconds DEAD_PEER_TIMEOUT { 60 * 1000 };

        static constexpr const uint32_t MAX_TRANSIENT_RETRIES = 100;
        static constexpr const std::chrono::milliseconds TRANSIENT_BACKOFF { 10 };

        // Read buffer of the buffered copy strategy and of the naive "each" fallback
        static constexpr const size_t BUFFER_SIZE = 64 * 1024;  // 64 KB
    };

    struct transfer_options
    {
    public:
        uint64_t chunk_size = transfer_defaults::CHUNK_SIZE;
        std::chrono::milliseconds poll_interval = transfer_defaults::POLL_INTERVAL;
        std::chrono::milliseconds dead_peer_timeout = transfer_defaults::DEAD_PEER_TIMEOUT;
        uint32_t max_transient_retries = transfer_defaults::MAX_TRANSIENT_RETRIES;
        std::chrono::milliseconds transient_backoff = transfer_defaults::TRANSIENT_BACKOFF;
        size_t buffer_size = transfer_defaults::BUFFER_SIZE;

    public:
        // throws configuration_error
        void validate() const;
    };

}  // namespace fsend

#endif  // !defined(_FSEND_TRANSFER_OPTIONS_H_INCLUDED_)
