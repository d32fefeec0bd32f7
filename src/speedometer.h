#if !defined(_FSEND_SPEEDOMETER_H_INCLUDED_)
#define _FSEND_SPEEDOMETER_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    //
    // Prints bytes sent and throughput to stderr, at most once per interval.
    // Driven by the bytes_sent / cleanup callbacks of a session.
    //
    class speedometer
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(speedometer)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(speedometer)

        explicit speedometer(std::string remarks, const std::chrono::milliseconds interval = std::chrono::milliseconds(1000))
            : _interval(interval),
              _remarks(std::move(remarks))
        {
            reset();
        }

        void reset() noexcept
        {
            _start = clock::now();
            _interval_start = _start;
            _last = _start;
            _bytes = 0;
            _interval_bytes = 0;
        }

        void measure(const uint64_t increase)
        {
            _last = clock::now();
            _bytes += increase;
            _interval_bytes += increase;

            const double interval_sec = seconds(_last - _interval_start);
            if (interval_sec * 1000 >= (double)_interval.count()) {
                print((double)_interval_bytes / interval_sec);
                _interval_bytes = 0;
                _interval_start = _last;
            }
        }

        // Print the average over the whole transfer and end the line
        void finish() const
        {
            const double total_sec = seconds(_last - _start);
            print(total_sec > 0 ? (double)_bytes / total_sec : 0);
            fprintf(stderr, "\n");
            fflush(stderr);
        }

        [[nodiscard]]
        uint64_t bytes() const noexcept { return _bytes; }

    private:
        typedef std::chrono::steady_clock clock;

        static double seconds(const clock::duration d) noexcept
        {
            return std::chrono::duration_cast<std::chrono::duration<double>>(d).count();
        }

        void print(const double bytes_per_sec) const
        {
            const auto [scaled_bytes, bytes_unit] = binary_prefix((double)_bytes);
            const auto [scaled_rate, rate_unit] = binary_prefix(bytes_per_sec);

            const int64_t elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(_last - _start).count();
            fprintf(stderr,
                    "%6.2f %3s %2" PRId64 ":%02" PRId64 ":%02" PRId64 ".%03" PRId64 " [%6.2f %3s/s] %-15s\r",
                    scaled_bytes, bytes_unit,
                    elapsed_ms / 3600000,
                    elapsed_ms / 60000 % 60,
                    elapsed_ms / 1000 % 60,
                    elapsed_ms % 1000,
                    scaled_rate, rate_unit,
                    _remarks.c_str());
        }

        static std::pair<double, const char*> binary_prefix(double value) noexcept
        {
            static constexpr const char* UNITS[] = { "B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB" };
            constexpr size_t COUNT = sizeof(UNITS) / sizeof(UNITS[0]);

            for (size_t i = 0; i < COUNT - 1; ++i) {
                if (value < 1000) {
                    return { value, UNITS[i] };
                }
                value /= 1024;
            }
            return { value, UNITS[COUNT - 1] };
        }

    private:
        const std::chrono::milliseconds _interval;
        const std::string _remarks;

        clock::time_point _start;
        clock::time_point _interval_start;
        clock::time_point _last;
        uint64_t _bytes = 0;
        uint64_t _interval_bytes = 0;
    };

}  // namespace fsend

#endif  // !defined(_FSEND_SPEEDOMETER_H_INCLUDED_)
