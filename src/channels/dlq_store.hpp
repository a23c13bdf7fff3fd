#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct sqlite3;

namespace courier::channels {

struct DeadLetterRecord {
    std::string at;
    std::string provider;
    std::string chat_id;
    std::string message_id;
    std::string sender_id;
    std::string reply_to;
    std::string thread_id;
    int retry_count = 0;
    std::string error;
    std::string content;
    std::unordered_map<std::string, std::string> metadata;
};

// Persistent sink for messages whose retry budget ran out.
// Append throws std::runtime_error when the record cannot be stored.
class DeadLetterSink {
public:
    virtual ~DeadLetterSink() = default;
    virtual void Append(const DeadLetterRecord& record) = 0;
    virtual std::vector<DeadLetterRecord> List(std::size_t limit = 100) = 0;
    virtual std::string Path() const = 0;
};

class SqliteDeadLetterStore : public DeadLetterSink {
public:
    explicit SqliteDeadLetterStore(std::filesystem::path sqlite_path);
    ~SqliteDeadLetterStore() override;

    SqliteDeadLetterStore(const SqliteDeadLetterStore&) = delete;
    SqliteDeadLetterStore& operator=(const SqliteDeadLetterStore&) = delete;

    void Append(const DeadLetterRecord& record) override;
    std::vector<DeadLetterRecord> List(std::size_t limit = 100) override;
    std::string Path() const override { return path_.string(); }

private:
    void Execute(const char* sql);

    std::filesystem::path path_;
    std::mutex mutex_;
    sqlite3* db_ = nullptr;
};

}  // namespace courier::channels
