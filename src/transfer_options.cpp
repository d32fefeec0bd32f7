#include "common.h"


void fsend::transfer_options::validate() const
{
    if (chunk_size == 0 || chunk_size > transfer_defaults::MAX_CHUNK_SIZE) {
        LOG_ERROR("Invalid chunk size {} (expects 1..{})", chunk_size, transfer_defaults::MAX_CHUNK_SIZE);
        throw configuration_error("chunk_size must be in 1.." + std::to_string(transfer_defaults::MAX_CHUNK_SIZE));
    }

    if (poll_interval.count() <= 0) {
        LOG_ERROR("Invalid poll interval {} ms", poll_interval.count());
        throw configuration_error("poll_interval must be positive");
    }

    if (dead_peer_timeout < poll_interval) {
        LOG_ERROR("Dead peer timeout {} ms is shorter than poll interval {} ms",
                  dead_peer_timeout.count(), poll_interval.count());
        throw configuration_error("dead_peer_timeout must not be shorter than poll_interval");
    }

    if (max_transient_retries == 0) {
        LOG_ERROR("max_transient_retries must be at least 1");
        throw configuration_error("max_transient_retries must be at least 1");
    }

    if (transient_backoff.count() < 0) {
        LOG_ERROR("Invalid transient backoff {} ms", transient_backoff.count());
        throw configuration_error("transient_backoff must not be negative");
    }

    if (buffer_size == 0) {
        LOG_ERROR("buffer_size must be at least 1");
        throw configuration_error("buffer_size must be at least 1");
    }
}
