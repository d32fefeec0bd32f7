#include "test_helpers.h"

namespace fsend::test {

// ============================================================================
// Named registration
// ============================================================================

TEST(LifecycleCallbacksTest, RecognizesSixNames) {
    const std::vector<std::string>& names = lifecycle_callbacks::recognized_names();
    EXPECT_EQ(names.size(), 6u);
    for (const char* name : { "fsend.started", "fsend.bytes_sent", "fsend.complete",
                              "fsend.aborted", "fsend.error", "fsend.cleanup" }) {
        EXPECT_NE(std::find(names.begin(), names.end(), name), names.end()) << name;
    }
}

TEST(LifecycleCallbacksTest, FromNamedWiresEveryHook) {
    std::vector<std::string> fired;
    std::map<std::string, named_callback> hooks;
    hooks[lifecycle_callbacks::NAME_STARTED] = total_callback([&](uint64_t) { fired.emplace_back("started"); });
    hooks[lifecycle_callbacks::NAME_BYTES_SENT] = bytes_sent_callback([&](uint64_t, uint64_t) { fired.emplace_back("bytes_sent"); });
    hooks[lifecycle_callbacks::NAME_COMPLETE] = total_callback([&](uint64_t) { fired.emplace_back("complete"); });
    hooks[lifecycle_callbacks::NAME_ABORTED] = failure_callback([&](const transfer_failure&) { fired.emplace_back("aborted"); });
    hooks[lifecycle_callbacks::NAME_ERROR] = failure_callback([&](const transfer_failure&) { fired.emplace_back("error"); });
    hooks[lifecycle_callbacks::NAME_CLEANUP] = total_callback([&](uint64_t) { fired.emplace_back("cleanup"); });

    const lifecycle_callbacks callbacks = lifecycle_callbacks::from_named(hooks);
    callbacks.started(0);
    callbacks.bytes_sent(1, 1);
    callbacks.complete(1);
    callbacks.aborted(transfer_failure { });
    callbacks.error(transfer_failure { });
    callbacks.cleanup(1);

    EXPECT_EQ(fired, (std::vector<std::string> { "started", "bytes_sent", "complete", "aborted", "error", "cleanup" }));
}

TEST(LifecycleCallbacksTest, OmittedHooksStayUnset) {
    std::map<std::string, named_callback> hooks;
    hooks[lifecycle_callbacks::NAME_CLEANUP] = total_callback([](uint64_t) { });

    const lifecycle_callbacks callbacks = lifecycle_callbacks::from_named(hooks);
    EXPECT_TRUE(callbacks.cleanup);
    EXPECT_FALSE(callbacks.started);
    EXPECT_FALSE(callbacks.bytes_sent);
    EXPECT_FALSE(callbacks.error);
}

TEST(LifecycleCallbacksTest, UnknownNameListsSupportedNames) {
    std::map<std::string, named_callback> hooks;
    hooks["fsend.progress"] = total_callback([](uint64_t) { });

    try {
        (void)lifecycle_callbacks::from_named(hooks);
        FAIL() << "from_named() should have thrown";
    }
    catch (const configuration_error& ex) {
        const std::string message = ex.what();
        EXPECT_NE(message.find("Unknown callback"), std::string::npos) << message;
        EXPECT_NE(message.find("fsend.progress"), std::string::npos) << message;
        EXPECT_NE(message.find("(supported:"), std::string::npos) << message;
        EXPECT_NE(message.find("fsend.bytes_sent"), std::string::npos) << message;
    }
}

TEST(LifecycleCallbacksTest, MismatchedSignatureIsRejected) {
    std::map<std::string, named_callback> hooks;
    hooks[lifecycle_callbacks::NAME_BYTES_SENT] = total_callback([](uint64_t) { });
    EXPECT_THROW(lifecycle_callbacks::from_named(hooks), configuration_error);

    hooks.clear();
    hooks[lifecycle_callbacks::NAME_ERROR] = total_callback([](uint64_t) { });
    EXPECT_THROW(lifecycle_callbacks::from_named(hooks), configuration_error);
}

// ============================================================================
// class lifecycle_notifier
// ============================================================================

TEST(LifecycleNotifierTest, UnsetHooksAreNoOps) {
    lifecycle_notifier notifier { lifecycle_callbacks { } };
    notifier.started();
    notifier.bytes_sent(10, 10);
    EXPECT_EQ(notifier.complete(10), nullptr);
    EXPECT_EQ(notifier.cleanup(10), nullptr);
    EXPECT_TRUE(notifier.is_terminal_fired());
    EXPECT_TRUE(notifier.is_cleanup_fired());
}

TEST(LifecycleNotifierTest, DisconnectFiresAbortedOnly) {
    callback_recorder rec;
    lifecycle_notifier notifier(rec.callbacks());

    transfer_failure failure;
    failure.kind = failure_kind::peer_disconnect;
    failure.error_code = ECONNRESET;
    failure.exception = std::make_exception_ptr(transfer_error(failure_kind::peer_disconnect, ECONNRESET, "reset"));

    notifier.started();
    EXPECT_EQ(notifier.abort(failure), nullptr);
    EXPECT_EQ(rec.events, (std::vector<std::string> { "started", "aborted" }));
    EXPECT_EQ(rec.aborted_with->error_code, ECONNRESET);
}

TEST(LifecycleNotifierTest, ApplicationFailureFiresErrorAndReturnsItsException) {
    callback_recorder rec;
    lifecycle_notifier notifier(rec.callbacks());

    const transfer_failure failure =
        transfer_failure::from_exception(std::make_exception_ptr(std::runtime_error("boom")));

    notifier.started();
    const std::exception_ptr ex = notifier.abort(failure);
    ASSERT_NE(ex, nullptr);
    EXPECT_THROW(std::rethrow_exception(ex), std::runtime_error);
    EXPECT_EQ(rec.events, (std::vector<std::string> { "started", "aborted", "error" }));
    EXPECT_EQ(rec.error_with->message, "boom");
}

TEST(LifecycleNotifierTest, ThrowingTerminalHookIsCapturedNotPropagated) {
    lifecycle_callbacks callbacks;
    callbacks.complete = [](uint64_t) { throw std::runtime_error("complete"); };
    callbacks.cleanup = [](uint64_t) { throw std::logic_error("cleanup"); };
    lifecycle_notifier notifier(std::move(callbacks));

    notifier.started();
    std::exception_ptr ex = nullptr;
    EXPECT_NO_THROW(ex = notifier.complete(5));
    EXPECT_THROW(std::rethrow_exception(ex), std::runtime_error);

    EXPECT_NO_THROW(ex = notifier.cleanup(5));
    EXPECT_THROW(std::rethrow_exception(ex), std::logic_error);
}

TEST(LifecycleNotifierTest, CleanupFiresOnce) {
    callback_recorder rec;
    lifecycle_notifier notifier(rec.callbacks());

    EXPECT_FALSE(notifier.is_cleanup_fired());
    EXPECT_EQ(notifier.cleanup(3), nullptr);
    EXPECT_EQ(notifier.cleanup(4), nullptr);
    EXPECT_EQ(rec.count("cleanup"), 1u);
    EXPECT_EQ(rec.cleanup_with.value(), 3u);
}

TEST(LifecycleNotifierTest, ThrowingStartedPropagates) {
    lifecycle_callbacks callbacks;
    callbacks.started = [](uint64_t) { throw std::runtime_error("started"); };
    lifecycle_notifier notifier(std::move(callbacks));

    EXPECT_THROW(notifier.started(), std::runtime_error);
}

// ============================================================================
// Failure classification
// ============================================================================

TEST(FailureClassificationTest, ErrnoTable) {
    EXPECT_EQ(classify_errno(EPIPE), failure_kind::transient);
    for (const int err : { ECONNRESET, ECONNABORTED, ENOTCONN, EPROTOTYPE, ESHUTDOWN, ETIMEDOUT }) {
        EXPECT_EQ(classify_errno(err), failure_kind::peer_disconnect) << err;
    }
    for (const int err : { EIO, ENOSPC, EBADF, EINVAL, ENOMEM }) {
        EXPECT_EQ(classify_errno(err), failure_kind::application) << err;
    }
}

TEST(FailureClassificationTest, FromException) {
    transfer_failure failure = transfer_failure::from_exception(
        std::make_exception_ptr(transfer_error(failure_kind::transient, EPIPE, "pipe")));
    EXPECT_EQ(failure.kind, failure_kind::peer_disconnect);
    EXPECT_EQ(failure.error_code, EPIPE);
    EXPECT_EQ(failure.message, "pipe");
    EXPECT_TRUE(failure.is_disconnect());

    failure = transfer_failure::from_exception(
        std::make_exception_ptr(std::system_error(ENOTCONN, std::generic_category(), "send")));
    EXPECT_EQ(failure.kind, failure_kind::peer_disconnect);
    EXPECT_EQ(failure.error_code, ENOTCONN);

    failure = transfer_failure::from_exception(
        std::make_exception_ptr(std::system_error(ENOSPC, std::system_category(), "write")));
    EXPECT_EQ(failure.kind, failure_kind::application);

    failure = transfer_failure::from_exception(std::make_exception_ptr(42));
    EXPECT_EQ(failure.kind, failure_kind::application);
    EXPECT_FALSE(failure.is_disconnect());
    EXPECT_NE(failure.exception, nullptr);
}

TEST(FailureClassificationTest, KindNames) {
    EXPECT_STREQ(to_string(failure_kind::peer_disconnect), "peer_disconnect");
    EXPECT_STREQ(to_string(failure_kind::transient), "transient");
    EXPECT_STREQ(to_string(failure_kind::application), "application");
}

}  // namespace fsend::test
