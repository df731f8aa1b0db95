#include "storage/history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* kSessionColumns =
    "id, timestamp, session_id, trigger_kind, outcome, stop_reason, output_mode, "
    "transcript, corrected_text, final_text, delivered_text, correction_failed, error, "
    "delivery_backend, transcribe_ms, correct_ms, deliver_ms, total_ms, audio_duration_s, "
    "char_count, word_count, speed_ratio";

std::string get_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

void bind_nullable(sqlite3_stmt* stmt, int idx, const std::string& val) {
    if (val.empty()) sqlite3_bind_null(stmt, idx);
    else sqlite3_bind_text(stmt, idx, val.c_str(), -1, SQLITE_TRANSIENT);
}

} // namespace

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    std::lock_guard lock(mu_);

    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    std::string cols = kSessionColumns;
    std::string recent_sql = "SELECT " + cols + " FROM sessions ORDER BY id DESC LIMIT ?";
    std::string on_date_sql = "SELECT " + cols + " FROM sessions "
                              "WHERE substr(timestamp, 1, 10) = ? ORDER BY id ASC";

    return prepare(
               "INSERT INTO sessions (timestamp, session_id, trigger_kind, outcome, stop_reason, "
               "output_mode, transcript, corrected_text, final_text, delivered_text, "
               "correction_failed, error, delivery_backend, transcribe_ms, correct_ms, "
               "deliver_ms, total_ms, audio_duration_s, char_count, word_count, speed_ratio) "
               "VALUES (COALESCE(?, strftime('%Y-%m-%dT%H:%M:%f','now','localtime')), "
               "?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
               &insert_stmt_, "insert") &&
           prepare(
               "INSERT INTO speech_events (timestamp, event_type, input_chars, summarized, "
               "spoken_text, summarize_ms, synth_ms, total_ms, voice, cancelled, reminder_count) "
               "VALUES (COALESCE(?, strftime('%Y-%m-%dT%H:%M:%f','now','localtime')), "
               "?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
               &insert_speech_stmt_, "insert speech") &&
           prepare(recent_sql.c_str(), &recent_stmt_, "recent") &&
           prepare(on_date_sql.c_str(), &on_date_stmt_, "on_date") &&
           prepare(
               "SELECT id, timestamp, event_type, input_chars, summarized, spoken_text, "
               "summarize_ms, synth_ms, total_ms, voice, cancelled, reminder_count "
               "FROM speech_events WHERE substr(timestamp, 1, 10) = ? ORDER BY id ASC",
               &speech_on_date_stmt_, "speech_on_date") &&
           prepare(
               "SELECT day FROM ("
               " SELECT substr(timestamp, 1, 10) AS day FROM sessions"
               " UNION SELECT substr(timestamp, 1, 10) AS day FROM speech_events"
               ") ORDER BY day DESC",
               &dates_stmt_, "dates");
}

void HistoryDb::close() {
    std::lock_guard lock(mu_);
    for (auto** stmt : {&insert_stmt_, &insert_speech_stmt_, &recent_stmt_,
                        &on_date_stmt_, &speech_on_date_stmt_, &dates_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::is_open() const {
    std::lock_guard lock(mu_);
    return db_ != nullptr;
}

bool HistoryDb::append(const HistoryRecord& r) {
    std::lock_guard lock(mu_);
    if (!insert_stmt_) return false;

    auto* s = insert_stmt_;
    sqlite3_reset(s);
    sqlite3_clear_bindings(s);

    bind_nullable(s, 1, r.timestamp);
    sqlite3_bind_int64(s, 2, static_cast<sqlite3_int64>(r.session_id));
    sqlite3_bind_text(s, 3, r.trigger.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 4, r.outcome.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(s, 5, r.stop_reason);
    bind_nullable(s, 6, r.output_mode);
    sqlite3_bind_text(s, 7, r.transcript.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(s, 8, r.corrected_text);
    sqlite3_bind_text(s, 9, r.final_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 10, r.delivered_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(s, 11, r.correction_failed ? 1 : 0);
    bind_nullable(s, 12, r.error);
    bind_nullable(s, 13, r.delivery_backend);
    sqlite3_bind_double(s, 14, r.transcribe_ms);
    sqlite3_bind_double(s, 15, r.correct_ms);
    sqlite3_bind_double(s, 16, r.deliver_ms);
    sqlite3_bind_double(s, 17, r.total_ms);
    sqlite3_bind_double(s, 18, r.audio_duration_s);
    sqlite3_bind_int64(s, 19, r.char_count);
    sqlite3_bind_int64(s, 20, r.word_count);
    sqlite3_bind_double(s, 21, r.speed_ratio);

    if (sqlite3_step(s) != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool HistoryDb::append_speech(const SpeechRecord& r) {
    std::lock_guard lock(mu_);
    if (!insert_speech_stmt_) return false;

    auto* s = insert_speech_stmt_;
    sqlite3_reset(s);
    sqlite3_clear_bindings(s);

    bind_nullable(s, 1, r.timestamp);
    sqlite3_bind_text(s, 2, r.event_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(s, 3, r.input_chars);
    sqlite3_bind_int(s, 4, r.summarized ? 1 : 0);
    sqlite3_bind_text(s, 5, r.spoken_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(s, 6, r.summarize_ms);
    sqlite3_bind_double(s, 7, r.synth_ms);
    sqlite3_bind_double(s, 8, r.total_ms);
    bind_nullable(s, 9, r.voice);
    sqlite3_bind_int(s, 10, r.cancelled ? 1 : 0);
    sqlite3_bind_int64(s, 11, r.reminder_count);

    if (sqlite3_step(s) != SQLITE_DONE) {
        std::println(stderr, "db: speech insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryRecord> HistoryDb::recent(int limit) {
    std::lock_guard lock(mu_);
    if (!recent_stmt_) return {};

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);
    return read_sessions(recent_stmt_);
}

std::vector<HistoryRecord> HistoryDb::on_date(const std::string& date) {
    std::lock_guard lock(mu_);
    if (!on_date_stmt_) return {};

    sqlite3_reset(on_date_stmt_);
    sqlite3_bind_text(on_date_stmt_, 1, date.c_str(), -1, SQLITE_TRANSIENT);
    return read_sessions(on_date_stmt_);
}

std::vector<SpeechRecord> HistoryDb::speech_on_date(const std::string& date) {
    std::lock_guard lock(mu_);
    std::vector<SpeechRecord> out;
    if (!speech_on_date_stmt_) return out;

    auto* s = speech_on_date_stmt_;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, date.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(s) == SQLITE_ROW) {
        SpeechRecord r;
        r.id = sqlite3_column_int64(s, 0);
        r.timestamp = get_text(s, 1);
        r.event_type = get_text(s, 2);
        r.input_chars = sqlite3_column_int64(s, 3);
        r.summarized = sqlite3_column_int(s, 4) != 0;
        r.spoken_text = get_text(s, 5);
        r.summarize_ms = sqlite3_column_double(s, 6);
        r.synth_ms = sqlite3_column_double(s, 7);
        r.total_ms = sqlite3_column_double(s, 8);
        r.voice = get_text(s, 9);
        r.cancelled = sqlite3_column_int(s, 10) != 0;
        r.reminder_count = sqlite3_column_int64(s, 11);
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<std::string> HistoryDb::dates() {
    std::lock_guard lock(mu_);
    std::vector<std::string> out;
    if (!dates_stmt_) return out;

    sqlite3_reset(dates_stmt_);
    while (sqlite3_step(dates_stmt_) == SQLITE_ROW) {
        out.push_back(get_text(dates_stmt_, 0));
    }
    return out;
}

std::vector<HistoryRecord> HistoryDb::read_sessions(sqlite3_stmt* s) {
    std::vector<HistoryRecord> entries;
    while (sqlite3_step(s) == SQLITE_ROW) {
        HistoryRecord r;
        r.id = sqlite3_column_int64(s, 0);
        r.timestamp = get_text(s, 1);
        r.session_id = static_cast<uint64_t>(sqlite3_column_int64(s, 2));
        r.trigger = get_text(s, 3);
        r.outcome = get_text(s, 4);
        r.stop_reason = get_text(s, 5);
        r.output_mode = get_text(s, 6);
        r.transcript = get_text(s, 7);
        r.corrected_text = get_text(s, 8);
        r.final_text = get_text(s, 9);
        r.delivered_text = get_text(s, 10);
        r.correction_failed = sqlite3_column_int(s, 11) != 0;
        r.error = get_text(s, 12);
        r.delivery_backend = get_text(s, 13);
        r.transcribe_ms = sqlite3_column_double(s, 14);
        r.correct_ms = sqlite3_column_double(s, 15);
        r.deliver_ms = sqlite3_column_double(s, 16);
        r.total_ms = sqlite3_column_double(s, 17);
        r.audio_duration_s = sqlite3_column_double(s, 18);
        r.char_count = sqlite3_column_int64(s, 19);
        r.word_count = sqlite3_column_int64(s, 20);
        r.speed_ratio = sqlite3_column_double(s, 21);
        entries.push_back(std::move(r));
    }
    return entries;
}

bool HistoryDb::prepare(const char* sql, sqlite3_stmt** stmt, const char* what) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare {} failed: {}", what, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL,
            session_id INTEGER NOT NULL,
            trigger_kind TEXT NOT NULL,
            outcome TEXT NOT NULL,
            stop_reason TEXT,
            output_mode TEXT,
            transcript TEXT NOT NULL,
            corrected_text TEXT,
            final_text TEXT NOT NULL,
            delivered_text TEXT NOT NULL,
            correction_failed INTEGER NOT NULL DEFAULT 0,
            error TEXT,
            delivery_backend TEXT,
            transcribe_ms REAL,
            correct_ms REAL,
            deliver_ms REAL,
            total_ms REAL,
            audio_duration_s REAL,
            char_count INTEGER,
            word_count INTEGER,
            speed_ratio REAL
        );
        CREATE INDEX IF NOT EXISTS sessions_day ON sessions (substr(timestamp, 1, 10));
        CREATE TABLE IF NOT EXISTS speech_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL,
            event_type TEXT NOT NULL,
            input_chars INTEGER,
            summarized INTEGER NOT NULL DEFAULT 0,
            spoken_text TEXT NOT NULL,
            summarize_ms REAL,
            synth_ms REAL,
            total_ms REAL,
            voice TEXT,
            cancelled INTEGER NOT NULL DEFAULT 0,
            reminder_count INTEGER NOT NULL DEFAULT 0
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
