#if !defined(_FSEND_TIMEOUT_GUARD_H_INCLUDED_)
#define _FSEND_TIMEOUT_GUARD_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    //
    // Slow loris detection.
    //
    // The clock starts at the first would-block of the current chunk and keeps running
    // across polls until reset() is called after progress.
    //
    class timeout_guard
    {
    public:
        enum class await_result
        {
            ready,
            timed_out,
            hang_up,
        };

    public:
        timeout_guard(std::chrono::milliseconds poll_interval, std::chrono::milliseconds budget) noexcept
            : _poll_interval(poll_interval),
              _budget(budget)
        { }

        // Poll until out is writable, the budget is exhausted or the peer hangs up.
        // Sinks without poll support are waited for one interval.
        await_result await_writable(sink& out);

        void reset() noexcept { _blocked_since.reset(); }

        [[nodiscard]]
        std::chrono::milliseconds elapsed() const noexcept;

        [[nodiscard]]
        bool is_blocked() const noexcept { return _blocked_since.has_value(); }

    private:
        const std::chrono::milliseconds _poll_interval;
        const std::chrono::milliseconds _budget;
        std::optional<std::chrono::steady_clock::time_point> _blocked_since { };
    };

    const char* to_string(timeout_guard::await_result result) noexcept;

}  // namespace fsend

#endif  // !defined(_FSEND_TIMEOUT_GUARD_H_INCLUDED_)
