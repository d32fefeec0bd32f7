#if !defined(_FSEND_TEST_HELPERS_H_INCLUDED_)
#define _FSEND_TEST_HELPERS_H_INCLUDED_

#include "common.h"

#include <gtest/gtest.h>

#include <deque>
#include <fstream>


namespace fsend::test
{
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = 1024 * 1024;

    // Options that keep timing-dependent tests fast
    inline transfer_options fast_options()
    {
        transfer_options options;
        options.poll_interval = std::chrono::milliseconds(5);
        options.dead_peer_timeout = std::chrono::milliseconds(100);
        options.transient_backoff = std::chrono::milliseconds(0);
        return options;
    }

    // Deterministic, position-dependent content
    inline std::string make_pattern(const size_t size, const size_t seed = 0)
    {
        std::string data(size, '\0');
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<char>((i * 131 + seed * 7 + (i >> 8)) & 0xFF);
        }
        return data;
    }


    //
    // A scratch directory removed at the end of the test
    //
    class temp_dir
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(temp_dir)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(temp_dir)

        temp_dir()
        {
            const ::testing::TestInfo* const info = ::testing::UnitTest::GetInstance()->current_test_info();
            std::string name = "fsend_test_" + std::to_string(getpid());
            if (info != nullptr) {
                name += std::string("_") + info->test_suite_name() + "_" + info->name();
            }
            _path = stdfs::temp_directory_path() / name;
            stdfs::remove_all(_path);
            stdfs::create_directories(_path);
        }

        ~temp_dir()
        {
            std::error_code ec;
            stdfs::remove_all(_path, ec);
        }

        [[nodiscard]]
        const stdfs::path& path() const noexcept { return _path; }

        std::string create_file(const std::string& name, const std::string& content) const
        {
            const stdfs::path file = _path / name;
            std::ofstream ofs(file, std::ios::binary | std::ios::trunc);
            ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
            return file.string();
        }

        std::string read_file(const std::string& name) const
        {
            std::ifstream ifs(_path / name, std::ios::binary);
            return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
        }

    private:
        stdfs::path _path;
    };


    //
    // File items with a size but no descriptor, for strategies that never read
    //
    class sized_file_source final : public file_source
    {
    public:
        explicit sized_file_source(std::vector<uint64_t> sizes)
            : _sizes(std::move(sizes))
        { }

        // Throw this instead of yielding the file at index
        void throw_at(const size_t index, std::exception_ptr ex)
        {
            _throw_index = index;
            _throw = std::move(ex);
        }

        void each_file(const std::function<void(const file_item&)>& fn) override
        {
            for (size_t i = 0; i < _sizes.size(); ++i) {
                if (_throw && _throw_index == i) {
                    std::rethrow_exception(_throw);
                }

                file_item item;
                item.file_handle = -1;
                item.size = _sizes[i];
                item.path = "file-" + std::to_string(i);
                ++yielded;
                fn(item);
            }
        }

    public:
        size_t yielded = 0;

    private:
        const std::vector<uint64_t> _sizes;
        size_t _throw_index = 0;
        std::exception_ptr _throw { nullptr };
    };


    //
    // Records every lifecycle callback, in order
    //
    struct callback_recorder
    {
    public:
        std::vector<std::string> events { };
        std::vector<std::pair<uint64_t, uint64_t>> bytes_sent { };
        std::optional<uint64_t> started_with { };
        std::optional<uint64_t> complete_with { };
        std::optional<uint64_t> cleanup_with { };
        std::optional<transfer_failure> aborted_with { };
        std::optional<transfer_failure> error_with { };

    public:
        lifecycle_callbacks callbacks()
        {
            lifecycle_callbacks cb;
            cb.started = [this](const uint64_t n) {
                events.emplace_back("started");
                started_with = n;
            };
            cb.bytes_sent = [this](const uint64_t n, const uint64_t total) {
                events.emplace_back("bytes_sent");
                bytes_sent.emplace_back(n, total);
            };
            cb.complete = [this](const uint64_t total) {
                events.emplace_back("complete");
                complete_with = total;
            };
            cb.aborted = [this](const transfer_failure& failure) {
                events.emplace_back("aborted");
                aborted_with = failure;
            };
            cb.error = [this](const transfer_failure& failure) {
                events.emplace_back("error");
                error_with = failure;
            };
            cb.cleanup = [this](const uint64_t total) {
                events.emplace_back("cleanup");
                cleanup_with = total;
            };
            return cb;
        }

        [[nodiscard]]
        size_t count(const std::string& name) const
        {
            return (size_t)std::count(events.begin(), events.end(), name);
        }

        // Events other than bytes_sent
        [[nodiscard]]
        std::vector<std::string> milestones() const
        {
            std::vector<std::string> result;
            for (const std::string& e : events) {
                if (e != "bytes_sent") result.push_back(e);
            }
            return result;
        }

        [[nodiscard]]
        uint64_t bytes_sent_sum() const
        {
            uint64_t sum = 0;
            for (const auto& [n, total] : bytes_sent) sum += n;
            return sum;
        }
    };


    //
    // An in-memory sink. Counts closes and keeps what write() received.
    //
    class fake_sink final : public sink
    {
    public:
        explicit fake_sink(const sink_capabilities caps = sink_capabilities { })
            : _caps(caps)
        { }

        ~fake_sink() noexcept override { this->dispose(); }

        [[nodiscard]]
        sink_capabilities capabilities() const noexcept override { return _caps; }

        io_result write(const void* ptr, const size_t size) override
        {
            if (this->is_closed()) {
                return io_result::failure(ENOTCONN);
            }
            if (!write_errors.empty()) {
                const int err = write_errors.front();
                write_errors.pop_front();
                return io_result::failure(err);
            }

            if (fail_after_bytes.has_value() && data.size() >= fail_after_bytes.value()) {
                return io_result::failure(fail_errno);
            }

            size_t accepted = std::min(size, max_write);
            if (fail_after_bytes.has_value()) {
                accepted = std::min(accepted, fail_after_bytes.value() - data.size());
            }
            data.append(static_cast<const char*>(ptr), accepted);
            return io_result::success((int64_t)accepted);
        }

        poll_status wait_writable(const std::chrono::milliseconds timeout) override
        {
            ++wait_calls;
            if (this->is_closed()) {
                return poll_status::hang_up;
            }
            if (poll_result == poll_status::not_ready) {
                std::this_thread::sleep_for(timeout);
            }
            return poll_result;
        }

    protected:
        void dispose_impl() noexcept override { ++close_count; }

    public:
        std::string data { };
        size_t max_write = std::numeric_limits<size_t>::max();
        std::deque<int> write_errors { };
        std::optional<size_t> fail_after_bytes { };     // every write fails once this much was accepted
        int fail_errno = EPIPE;
        poll_status poll_result = poll_status::ready;
        size_t wait_calls = 0;
        size_t close_count = 0;

    private:
        const sink_capabilities _caps;
    };


    //
    // A strategy that never touches descriptors: results come from a script,
    // then from fallback (which accepts the whole range unless replaced)
    //
    class scripted_strategy final : public transfer_strategy
    {
    public:
        [[nodiscard]]
        strategy_kind kind() const noexcept override { return strategy_kind::zero_copy; }

        transfer_result transfer(const file_item& /*file*/, const chunk_range& range, sink& out) override
        {
            ranges.push_back(range);
            if (out.is_closed()) {
                return transfer_result::failed(ENOTCONN);
            }
            if (!script.empty()) {
                const transfer_result result = script.front();
                script.pop_front();
                return result;
            }
            return fallback(range);
        }

    public:
        std::deque<transfer_result> script { };
        std::function<transfer_result(const chunk_range&)> fallback = [](const chunk_range& range) {
            return transfer_result::written(range.length);
        };
        std::vector<chunk_range> ranges { };
    };


    // Check that ranges which made progress tile [0, size) of each file in order
    inline void expect_exact_tiling(const std::vector<std::pair<uint64_t, uint64_t>>& progressed, const uint64_t size)
    {
        uint64_t expected_offset = 0;
        for (const auto& [offset, length] : progressed) {
            EXPECT_EQ(offset, expected_offset);
            expected_offset = offset + length;
        }
        EXPECT_EQ(expected_offset, size);
    }


    //
    // Drains one end of a socketpair/pipe on a background thread
    //
    class drain_thread
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(drain_thread)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(drain_thread)

        explicit drain_thread(const int handle)
            : _handle(handle),
              _thread([this]() { this->run(); })
        { }

        ~drain_thread()
        {
            if (_thread.joinable()) {
                _thread.join();
            }
            (void)close(_handle);
        }

        // Wait for end of stream and return everything read
        std::string join()
        {
            if (_thread.joinable()) {
                _thread.join();
            }
            return _data;
        }

    private:
        void run()
        {
            char buffer[64 * 1024];
            while (true) {
                const ssize_t cnt = read(_handle, buffer, sizeof(buffer));
                if (cnt < 0 && errno == EINTR) continue;
                if (cnt <= 0) break;
                _data.append(buffer, (size_t)cnt);
            }
        }

    private:
        const int _handle;
        std::string _data { };
        std::thread _thread;
    };

}  // namespace fsend::test

#endif  // !defined(_FSEND_TEST_HELPERS_H_INCLUDED_)
