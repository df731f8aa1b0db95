#pragma once

#include "storage/history_store.hpp"

#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

// SQLite-backed history. All methods are safe to call from worker threads.
class HistoryDb : public HistoryStore {
public:
    HistoryDb();
    ~HistoryDb() override;

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    bool append(const HistoryRecord& record) override;
    bool append_speech(const SpeechRecord& record) override;
    std::vector<HistoryRecord> recent(int limit = 10) override;
    std::vector<HistoryRecord> on_date(const std::string& date) override;
    std::vector<SpeechRecord> speech_on_date(const std::string& date) override;
    std::vector<std::string> dates() override;

private:
    bool create_tables();
    bool prepare(const char* sql, sqlite3_stmt** stmt, const char* what);
    std::vector<HistoryRecord> read_sessions(sqlite3_stmt* stmt);

    mutable std::mutex mu_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* insert_speech_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* on_date_stmt_ = nullptr;
    sqlite3_stmt* speech_on_date_stmt_ = nullptr;
    sqlite3_stmt* dates_stmt_ = nullptr;
};
