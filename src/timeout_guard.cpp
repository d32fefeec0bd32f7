#include "common.h"


const char* fsend::to_string(const timeout_guard::await_result result) noexcept
{
    switch (result) {
        case timeout_guard::await_result::ready: return "ready";
        case timeout_guard::await_result::timed_out: return "timed_out";
        case timeout_guard::await_result::hang_up: return "hang_up";
    }
    return "unknown";
}

std::chrono::milliseconds fsend::timeout_guard::elapsed() const noexcept
{
    if (!_blocked_since.has_value()) {
        return std::chrono::milliseconds::zero();
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - _blocked_since.value());
}

fsend::timeout_guard::await_result fsend::timeout_guard::await_writable(sink& out)
{
    if (!_blocked_since.has_value()) {
        _blocked_since = std::chrono::steady_clock::now();
    }

    while (true) {
        if (this->elapsed() >= _budget) {
            LOG_WARN("Sink was not writable for {} ms", this->elapsed().count());
            return await_result::timed_out;
        }

        if (!out.capabilities().poll_writable) {
            std::this_thread::sleep_for(_poll_interval);
            return await_result::ready;
        }

        const poll_status status = out.wait_writable(_poll_interval);
        switch (status) {
            case poll_status::ready:
                return await_result::ready;
            case poll_status::hang_up:
                LOG_DEBUG("Sink hung up while waiting for it to become writable");
                return await_result::hang_up;
            case poll_status::not_ready:
                LOG_TRACE("Sink still not writable after {} ms", this->elapsed().count());
                break;
        }
    }
}
