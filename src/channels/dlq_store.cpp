#include "channels/dlq_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <sqlite3.h>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace courier::channels {
namespace {

constexpr const char* kSchemaSql = R"(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS outbound_dlq (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        at TEXT NOT NULL,
        provider TEXT NOT NULL,
        chat_id TEXT NOT NULL,
        message_id TEXT NOT NULL,
        sender_id TEXT NOT NULL,
        reply_to TEXT NOT NULL,
        thread_id TEXT NOT NULL,
        retry_count INTEGER NOT NULL,
        error TEXT NOT NULL,
        content TEXT NOT NULL,
        metadata_json TEXT NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_outbound_dlq_at
        ON outbound_dlq(at DESC);
    CREATE INDEX IF NOT EXISTS idx_outbound_dlq_provider_chat
        ON outbound_dlq(provider, chat_id, at DESC);
)";

constexpr const char* kInsertSql = R"(
    INSERT INTO outbound_dlq (
        at, provider, chat_id, message_id, sender_id, reply_to, thread_id,
        retry_count, error, content, metadata_json
    ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
)";

constexpr const char* kListSql = R"(
    SELECT at, provider, chat_id, message_id, sender_id, reply_to, thread_id,
           retry_count, error, content, metadata_json
    FROM outbound_dlq
    ORDER BY id DESC
    LIMIT ?
)";

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? std::string(text) : std::string();
}

std::string SerializeMetadata(const std::unordered_map<std::string, std::string>& metadata) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [key, value] : metadata) {
        json[key] = value;
    }
    // Invalid UTF-8 from transport errors must not cost the record.
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::unordered_map<std::string, std::string> ParseMetadata(const std::string& text) {
    std::unordered_map<std::string, std::string> metadata;
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (!json.is_object()) {
        return metadata;
    }
    for (const auto& item : json.items()) {
        if (item.value().is_string()) {
            metadata[item.key()] = item.value().get<std::string>();
        } else {
            metadata[item.key()] = item.value().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
    }
    return metadata;
}

}  // namespace

SqliteDeadLetterStore::SqliteDeadLetterStore(std::filesystem::path sqlite_path)
    : path_(std::filesystem::absolute(
          sqlite_path.empty() ? std::filesystem::path("runtime/dlq/dlq.db") : std::move(sqlite_path))) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("dlq directory create failed: " + ec.message());
    }
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path_.string().c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("dlq open failed: " + message);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        Execute(kSchemaSql);
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteDeadLetterStore::~SqliteDeadLetterStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteDeadLetterStore::Execute(const char* sql) {
    char* error_msg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
        const std::string message = error_msg ? error_msg : "unknown error";
        sqlite3_free(error_msg);
        throw std::runtime_error("dlq sql failed: " + message);
    }
}

void SqliteDeadLetterStore::Append(const DeadLetterRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kInsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("dlq prepare failed: ") + sqlite3_errmsg(db_));
    }
    const auto at = record.at.empty() ? courier::utils::NowIso() : record.at;
    const auto error = record.error.empty() ? std::string("unknown_error") : record.error;
    const auto metadata_json = SerializeMetadata(record.metadata);
    sqlite3_bind_text(stmt, 1, at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.provider.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.chat_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, record.message_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, record.sender_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, record.reply_to.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, record.thread_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 8, std::max(0, record.retry_count));
    sqlite3_bind_text(stmt, 9, error.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 10, record.content.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 11, metadata_json.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("dlq insert failed: ") + sqlite3_errmsg(db_));
    }
}

std::vector<DeadLetterRecord> SqliteDeadLetterStore::List(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeadLetterRecord> records;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kListSql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("dlq prepare failed: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(std::max<std::size_t>(1, limit)));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        DeadLetterRecord record{};
        record.at = ColumnText(stmt, 0);
        record.provider = ColumnText(stmt, 1);
        record.chat_id = ColumnText(stmt, 2);
        record.message_id = ColumnText(stmt, 3);
        record.sender_id = ColumnText(stmt, 4);
        record.reply_to = ColumnText(stmt, 5);
        record.thread_id = ColumnText(stmt, 6);
        record.retry_count = std::max(0, sqlite3_column_int(stmt, 7));
        record.error = ColumnText(stmt, 8);
        record.content = ColumnText(stmt, 9);
        record.metadata = ParseMetadata(ColumnText(stmt, 10));
        records.push_back(std::move(record));
    }
    sqlite3_finalize(stmt);
    return records;
}

}  // namespace courier::channels
