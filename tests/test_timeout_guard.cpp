#include "test_helpers.h"

namespace fsend::test {

namespace {
    sink_capabilities pollable() {
        sink_capabilities caps;
        caps.poll_writable = true;
        return caps;
    }
}  // namespace

TEST(TimeoutGuardTest, ReadySinkReturnsImmediately) {
    fake_sink out(pollable());
    timeout_guard guard(std::chrono::milliseconds(5), std::chrono::milliseconds(1000));

    EXPECT_FALSE(guard.is_blocked());
    EXPECT_EQ(guard.await_writable(out), timeout_guard::await_result::ready);
    EXPECT_TRUE(guard.is_blocked());
    EXPECT_EQ(out.wait_calls, 1u);
}

TEST(TimeoutGuardTest, NeverWritableTimesOutAfterBudget) {
    fake_sink out(pollable());
    out.poll_result = poll_status::not_ready;
    timeout_guard guard(std::chrono::milliseconds(5), std::chrono::milliseconds(60));

    const auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(guard.await_writable(out), timeout_guard::await_result::timed_out);
    const auto waited = std::chrono::steady_clock::now() - begin;

    EXPECT_GE(waited, std::chrono::milliseconds(60));
    EXPECT_LT(waited, std::chrono::milliseconds(5000));
    EXPECT_GE(out.wait_calls, 2u);
    EXPECT_GE(guard.elapsed(), std::chrono::milliseconds(60));
}

TEST(TimeoutGuardTest, BudgetAccumulatesAcrossCallsUntilReset) {
    fake_sink out(pollable());
    timeout_guard guard(std::chrono::milliseconds(5), std::chrono::milliseconds(50));

    // Writable every time, but the caller keeps making no progress
    EXPECT_EQ(guard.await_writable(out), timeout_guard::await_result::ready);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(guard.await_writable(out), timeout_guard::await_result::timed_out);

    // Progress starts a fresh budget
    guard.reset();
    EXPECT_FALSE(guard.is_blocked());
    EXPECT_EQ(guard.elapsed(), std::chrono::milliseconds::zero());
    EXPECT_EQ(guard.await_writable(out), timeout_guard::await_result::ready);
}

TEST(TimeoutGuardTest, HangUpIsReported) {
    fake_sink out(pollable());
    out.poll_result = poll_status::hang_up;
    timeout_guard guard(std::chrono::milliseconds(5), std::chrono::milliseconds(1000));

    EXPECT_EQ(guard.await_writable(out), timeout_guard::await_result::hang_up);
}

TEST(TimeoutGuardTest, SinkWithoutPollingWaitsOneInterval) {
    fake_sink out;  // no poll_writable
    timeout_guard guard(std::chrono::milliseconds(20), std::chrono::milliseconds(1000));

    const auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(guard.await_writable(out), timeout_guard::await_result::ready);
    EXPECT_GE(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(20));
    EXPECT_EQ(out.wait_calls, 0u);
}

TEST(TimeoutGuardTest, StalledSocketTimesOut) {
    int sv[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv), 0);
    fd_sink out(sv[0], /*owned*/true);

    // Fill the socket until it would block; nobody reads the other end
    ASSERT_EQ(fcntl(sv[0], F_SETFL, fcntl(sv[0], F_GETFL) | O_NONBLOCK), 0);
    const std::string block = make_pattern(64 * KB);
    while (send(sv[0], block.data(), block.size(), MSG_NOSIGNAL) > 0) { }
    ASSERT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);

    timeout_guard guard(std::chrono::milliseconds(10), std::chrono::milliseconds(50));
    EXPECT_EQ(guard.await_writable(out), timeout_guard::await_result::timed_out);

    out.close();
    (void)close(sv[1]);
}

TEST(TimeoutGuardTest, ResultNames) {
    EXPECT_STREQ(to_string(timeout_guard::await_result::ready), "ready");
    EXPECT_STREQ(to_string(timeout_guard::await_result::timed_out), "timed_out");
    EXPECT_STREQ(to_string(timeout_guard::await_result::hang_up), "hang_up");
}

}  // namespace fsend::test
