#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <random>
#include <string>

#include "channels/dlq_store.hpp"

namespace courier::channels {
namespace {

namespace fs = std::filesystem;

class DlqStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root_ = fs::temp_directory_path() /
                ("courier_dlq_test_" + std::to_string(rd()) + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        db_path_ = root_ / "nested" / "dlq.db";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    DeadLetterRecord MakeRecord(const std::string& message_id, int retry_count = 3) {
        DeadLetterRecord record{};
        record.at = "2026-01-02T03:04:05.678Z";
        record.provider = "telegram";
        record.chat_id = "chat-1";
        record.message_id = message_id;
        record.sender_id = "assistant";
        record.reply_to = "r-1";
        record.thread_id = "t-1";
        record.retry_count = retry_count;
        record.error = "timeout";
        record.content = "hello";
        record.metadata = {{"kind", "agent_reply"}, {"dispatch_retry", std::to_string(retry_count)}};
        return record;
    }

    fs::path root_;
    fs::path db_path_;
};

TEST_F(DlqStoreTest, CreatesParentDirectories) {
    SqliteDeadLetterStore store(db_path_);
    EXPECT_TRUE(fs::exists(db_path_));
    EXPECT_EQ(fs::path(store.Path()), fs::absolute(db_path_));
}

TEST_F(DlqStoreTest, AppendedRecordReadsBack) {
    SqliteDeadLetterStore store(db_path_);
    store.Append(MakeRecord("m-1", 2));

    auto records = store.List();
    ASSERT_EQ(records.size(), 1u);
    const auto& record = records.front();
    EXPECT_EQ(record.at, "2026-01-02T03:04:05.678Z");
    EXPECT_EQ(record.provider, "telegram");
    EXPECT_EQ(record.chat_id, "chat-1");
    EXPECT_EQ(record.message_id, "m-1");
    EXPECT_EQ(record.sender_id, "assistant");
    EXPECT_EQ(record.reply_to, "r-1");
    EXPECT_EQ(record.thread_id, "t-1");
    EXPECT_EQ(record.retry_count, 2);
    EXPECT_EQ(record.error, "timeout");
    EXPECT_EQ(record.content, "hello");
    EXPECT_EQ(record.metadata.at("kind"), "agent_reply");
    EXPECT_EQ(record.metadata.at("dispatch_retry"), "2");
}

TEST_F(DlqStoreTest, ListsNewestFirstWithinLimit) {
    SqliteDeadLetterStore store(db_path_);
    store.Append(MakeRecord("m-1"));
    store.Append(MakeRecord("m-2"));
    store.Append(MakeRecord("m-3"));

    auto records = store.List(2);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message_id, "m-3");
    EXPECT_EQ(records[1].message_id, "m-2");
}

TEST_F(DlqStoreTest, FillsMissingTimestampAndError) {
    SqliteDeadLetterStore store(db_path_);
    auto record = MakeRecord("m-1");
    record.at.clear();
    record.error.clear();
    store.Append(record);

    auto stored = store.List(1).front();
    EXPECT_FALSE(stored.at.empty());
    EXPECT_EQ(stored.at.back(), 'Z');
    EXPECT_EQ(stored.error, "unknown_error");
}

TEST_F(DlqStoreTest, InvalidUtf8MetadataIsStoredWithReplacement) {
    SqliteDeadLetterStore store(db_path_);
    auto record = MakeRecord("m-1");
    record.metadata["dispatch_error"] = "\xff\xfe";
    record.error = "gateway said \xff";
    ASSERT_NO_THROW(store.Append(record));

    auto records = store.List(1);
    ASSERT_EQ(records.size(), 1u);
    const auto& stored = records.front();
    EXPECT_EQ(stored.message_id, "m-1");
    EXPECT_EQ(stored.metadata.at("kind"), "agent_reply");
    const auto& replaced = stored.metadata.at("dispatch_error");
    EXPECT_NE(replaced.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_EQ(replaced.find('\xff'), std::string::npos);
}

TEST_F(DlqStoreTest, RecordsSurviveReopen) {
    {
        SqliteDeadLetterStore store(db_path_);
        store.Append(MakeRecord("m-1"));
    }
    SqliteDeadLetterStore reopened(db_path_);
    auto records = reopened.List();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records.front().message_id, "m-1");
}

TEST_F(DlqStoreTest, UnopenablePathThrows) {
    fs::create_directories(root_);
    // A directory where the database file should be.
    fs::create_directories(root_ / "taken.db");
    EXPECT_THROW(SqliteDeadLetterStore(root_ / "taken.db"), std::runtime_error);
}

}  // namespace
}  // namespace courier::channels
