#include "test_helpers.h"

namespace fsend::test {

class NaiveEachTest : public ::testing::Test {
protected:
    temp_dir dir;
};

TEST_F(NaiveEachTest, HandsEveryFileToConsumerInPieces) {
    const std::string a = make_pattern(200 * KB, 1);
    const std::string b = make_pattern(10, 2);
    path_file_source source({ dir.create_file("a", a), dir.create_file("empty", ""), dir.create_file("b", b) });
    callback_recorder rec;

    naive_each fallback(source, rec.callbacks());
    std::string received;
    std::vector<size_t> pieces;
    const uint64_t total = fallback.each([&](const char* data, const size_t size) {
        received.append(data, size);
        pieces.push_back(size);
    });

    EXPECT_EQ(total, a.size() + b.size());
    EXPECT_EQ(received, a + b);
    for (const size_t piece : pieces) {
        EXPECT_LE(piece, transfer_defaults::BUFFER_SIZE);
    }
    EXPECT_EQ(pieces.size(), 4u + 1u);

    EXPECT_EQ(rec.milestones(), (std::vector<std::string> { "started", "complete", "cleanup" }));
    EXPECT_EQ(rec.bytes_sent.size(), pieces.size());
    EXPECT_EQ(rec.bytes_sent_sum(), total);
    EXPECT_EQ(rec.complete_with.value(), total);
    EXPECT_EQ(rec.cleanup_with.value(), total);
    EXPECT_EQ(fallback.outcome(), session_outcome::completed);
}

TEST_F(NaiveEachTest, SmallBufferSize) {
    const std::string a = make_pattern(1000);
    path_file_source source({ dir.create_file("a", a) });
    callback_recorder rec;

    naive_each fallback(source, rec.callbacks(), 64);
    std::string received;
    fallback.each([&](const char* data, const size_t size) {
        EXPECT_LE(size, 64u);
        received.append(data, size);
    });

    EXPECT_EQ(received, a);
    EXPECT_EQ(rec.bytes_sent.size(), (1000u + 63u) / 64u);
}

TEST_F(NaiveEachTest, DisconnectFromConsumerAbortsQuietly) {
    path_file_source source({ dir.create_file("a", make_pattern(300 * KB)) });
    callback_recorder rec;

    naive_each fallback(source, rec.callbacks());
    int calls = 0;
    EXPECT_NO_THROW(fallback.each([&](const char* /*data*/, const size_t /*size*/) {
        if (++calls == 2) {
            throw transfer_error(failure_kind::peer_disconnect, ECONNRESET, "gone");
        }
    }));

    EXPECT_EQ(rec.milestones(), (std::vector<std::string> { "started", "aborted", "cleanup" }));
    EXPECT_EQ(rec.cleanup_with.value(), transfer_defaults::BUFFER_SIZE);
    EXPECT_EQ(fallback.outcome(), session_outcome::aborted);
    ASSERT_TRUE(fallback.failure().has_value());
    EXPECT_EQ(fallback.failure()->error_code, ECONNRESET);
}

TEST_F(NaiveEachTest, BrokenPipeSystemErrorIsADisconnect) {
    path_file_source source({ dir.create_file("a", make_pattern(100)) });
    callback_recorder rec;

    naive_each fallback(source, rec.callbacks());
    EXPECT_NO_THROW(fallback.each([](const char* /*data*/, const size_t /*size*/) {
        throw std::system_error(EPIPE, std::system_category(), "write");
    }));

    EXPECT_EQ(rec.milestones(), (std::vector<std::string> { "started", "aborted", "cleanup" }));
    EXPECT_EQ(rec.aborted_with->kind, failure_kind::peer_disconnect);
}

TEST_F(NaiveEachTest, ApplicationErrorFromConsumerIsRethrown) {
    path_file_source source({ dir.create_file("a", make_pattern(100)) });
    callback_recorder rec;

    naive_each fallback(source, rec.callbacks());
    EXPECT_THROW(fallback.each([](const char* /*data*/, const size_t /*size*/) {
        throw std::runtime_error("consumer broke");
    }), std::runtime_error);

    EXPECT_EQ(rec.events, (std::vector<std::string> { "started", "aborted", "error", "cleanup" }));
    EXPECT_EQ(rec.error_with->message, "consumer broke");
    EXPECT_EQ(rec.cleanup_with.value(), 0u);
}

TEST_F(NaiveEachTest, MissingFileIsAnApplicationError) {
    path_file_source source({ dir.create_file("a", "abc"), (dir.path() / "missing").string() });
    callback_recorder rec;

    naive_each fallback(source, rec.callbacks());
    EXPECT_THROW(fallback.each([](const char* /*data*/, const size_t /*size*/) { }), transfer_error);

    EXPECT_EQ(rec.milestones(), (std::vector<std::string> { "started", "aborted", "error", "cleanup" }));
    EXPECT_EQ(rec.cleanup_with.value(), 3u);
}

TEST_F(NaiveEachTest, ZeroBufferIsRejected) {
    path_file_source source({ });
    EXPECT_THROW(naive_each(source, lifecycle_callbacks { }, 0), configuration_error);
}

}  // namespace fsend::test
