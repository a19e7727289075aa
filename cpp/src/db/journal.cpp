#include "sloup/db/journal.hpp"

#include <sqlite3.h>
#include <algorithm>
#include <cstring>
#include <ctime>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace sloup::db {

using namespace sloup::core;

namespace {
    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS upload (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            source_path TEXT NOT NULL,
            container TEXT NOT NULL,
            segments_container TEXT NOT NULL,
            object_name TEXT NOT NULL,
            total_size INTEGER NOT NULL,
            segment_size INTEGER NOT NULL,
            segment_count INTEGER NOT NULL,
            started_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS segments (
            seg_index INTEGER PRIMARY KEY,
            status INTEGER NOT NULL,
            remote_path TEXT NOT NULL DEFAULT '',
            etag TEXT NOT NULL DEFAULT '',
            size_bytes INTEGER NOT NULL DEFAULT 0,
            error_code INTEGER NOT NULL DEFAULT 0,
            error_domain INTEGER NOT NULL DEFAULT 0,
            error_aux INTEGER NOT NULL DEFAULT 0,
            finished_at INTEGER NOT NULL
        );
    )SQL";

    [[nodiscard]] Status db_error(int rc) noexcept {
        return make_status(StatusDomain::Journal, StatusCode::Unknown, static_cast<u32>(rc));
    }

    [[nodiscard]] Status exec_sql(sqlite3* db, const char* sql) noexcept {
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            spdlog::error("journal: {}", err_msg ? err_msg : sqlite3_errstr(rc));
            sqlite3_free(err_msg);
            return db_error(rc);
        }
        return ok_status();
    }

    // Used after a failed statement; the caller reports that error.
    void rollback(sqlite3* db) noexcept {
        const Status s = exec_sql(db, "ROLLBACK");
        if (!is_ok(s)) {
            spdlog::warn("journal: rollback failed (aux={})", s.aux);
        }
    }

    std::string column_text(sqlite3_stmt* stmt, int col) {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char*>(text) : std::string();
    }

    Timestamp now() noexcept {
        return static_cast<Timestamp>(std::time(nullptr));
    }
} // namespace

UploadJournal::~UploadJournal() noexcept {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

Status UploadJournal::open(const std::string& path, OpenMode mode) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ != nullptr || path.empty()) {
        return make_status(StatusDomain::Journal, StatusCode::Invalid);
    }

    const int flags = mode == OpenMode::Create ? SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE : SQLITE_OPEN_READWRITE;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db_);
        db_ = nullptr;
        if (rc == SQLITE_CANTOPEN && mode == OpenMode::Existing) {
            return make_status(StatusDomain::Journal, StatusCode::NotFound, static_cast<u32>(rc));
        }
        return db_error(rc);
    }

    if (mode == OpenMode::Existing) {
        return ok_status();
    }

    Status s = exec_sql(db_, "PRAGMA synchronous=NORMAL");
    if (!is_ok(s)) {
        sqlite3_close(db_);
        db_ = nullptr;
        return s;
    }

    s = exec_sql(db_, kSchemaSQL);
    if (!is_ok(s)) {
        sqlite3_close(db_);
        db_ = nullptr;
        return s;
    }
    return ok_status();
}

Status UploadJournal::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ == nullptr) {
        return make_status(StatusDomain::Journal, StatusCode::Invalid);
    }
    const int rc = sqlite3_close(db_);
    db_ = nullptr;
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }
    return ok_status();
}

bool UploadJournal::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

Status UploadJournal::record_upload(const UploadPlan& plan, const std::string& source_path) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ == nullptr) {
        return make_status(StatusDomain::Journal, StatusCode::Invalid);
    }

    Status s = exec_sql(db_, "BEGIN TRANSACTION");
    if (!is_ok(s)) return s;

    s = exec_sql(db_, "DELETE FROM segments");
    if (!is_ok(s)) {
        rollback(db_);
        return s;
    }

    const char* sql = "INSERT OR REPLACE INTO upload (id, source_path, container, segments_container, "
                      "object_name, total_size, segment_size, segment_count, started_at) "
                      "VALUES (1, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        rollback(db_);
        return db_error(rc);
    }

    sqlite3_bind_text(stmt, 1, source_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, plan.container.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, plan.segments_container.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, plan.object_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(plan.total_size));
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(plan.segment_size));
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(plan.segment_count));
    sqlite3_bind_int64(stmt, 8, now());

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        rollback(db_);
        return db_error(rc);
    }

    return exec_sql(db_, "COMMIT");
}

Status UploadJournal::record_segment(const SegmentResult& result) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ == nullptr) {
        return make_status(StatusDomain::Journal, StatusCode::Invalid);
    }

    const char* sql = "INSERT OR REPLACE INTO segments (seg_index, status, remote_path, etag, size_bytes, "
                      "error_code, error_domain, error_aux, finished_at) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    sqlite3_bind_int64(stmt, 1, result.index);
    sqlite3_bind_int(stmt, 2, static_cast<int>(result.status));
    sqlite3_bind_text(stmt, 3, result.remote_object_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, result.etag.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(result.size_bytes));
    sqlite3_bind_int(stmt, 6, static_cast<int>(result.error.code));
    sqlite3_bind_int(stmt, 7, static_cast<int>(result.error.domain));
    sqlite3_bind_int64(stmt, 8, result.error.aux);
    sqlite3_bind_int64(stmt, 9, now());

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error(rc);
    }
    return ok_status();
}

Status UploadJournal::load_upload(JournalUpload* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Journal, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ == nullptr) {
        return make_status(StatusDomain::Journal, StatusCode::Invalid);
    }

    const char* sql = "SELECT source_path, container, segments_container, object_name, total_size, "
                      "segment_size, segment_count, started_at FROM upload WHERE id = 1";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out->source_path = column_text(stmt, 0);
        out->plan.container = column_text(stmt, 1);
        out->plan.segments_container = column_text(stmt, 2);
        out->plan.object_name = column_text(stmt, 3);
        out->plan.total_size = static_cast<u64>(sqlite3_column_int64(stmt, 4));
        out->plan.segment_size = static_cast<u64>(sqlite3_column_int64(stmt, 5));
        out->plan.segment_count = static_cast<u32>(sqlite3_column_int64(stmt, 6));
        out->started_at = sqlite3_column_int64(stmt, 7);
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Journal, StatusCode::NotFound);
    }
    return db_error(rc);
}

Status UploadJournal::load_segments(std::vector<JournalSegment>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Journal, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ == nullptr) {
        return make_status(StatusDomain::Journal, StatusCode::Invalid);
    }

    const char* sql = "SELECT seg_index, status, remote_path, etag, size_bytes, error_code, error_domain, "
                      "error_aux, finished_at FROM segments ORDER BY seg_index";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    out->clear();
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        JournalSegment seg;
        seg.result.index = static_cast<u32>(sqlite3_column_int64(stmt, 0));
        seg.result.status = static_cast<SegmentStatus>(sqlite3_column_int(stmt, 1));
        seg.result.remote_object_path = column_text(stmt, 2);
        seg.result.etag = column_text(stmt, 3);
        seg.result.size_bytes = static_cast<u64>(sqlite3_column_int64(stmt, 4));
        seg.result.error = make_status(static_cast<StatusDomain>(sqlite3_column_int(stmt, 6)),
                                       static_cast<StatusCode>(sqlite3_column_int(stmt, 5)),
                                       static_cast<u32>(sqlite3_column_int64(stmt, 7)));
        seg.finished_at = sqlite3_column_int64(stmt, 8);
        out->push_back(std::move(seg));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error(rc);
    }
    return ok_status();
}

JournalSummary summarize(const JournalUpload& upload, const std::vector<JournalSegment>& segments) {
    JournalSummary out;
    for (const JournalSegment& seg : segments) {
        if (seg.result.status == SegmentStatus::Succeeded) {
            ++out.succeeded;
        } else {
            out.failed.push_back(seg.result.index);
        }
    }
    std::sort(out.failed.begin(), out.failed.end());
    const u32 recorded = static_cast<u32>(segments.size());
    out.not_attempted = recorded < upload.plan.segment_count ? upload.plan.segment_count - recorded : 0;
    return out;
}

} // namespace sloup::db
