#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace acquisition::db::sqlite {

using acquisition::db::ErrorCode;
using acquisition::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
    if (s.empty()) {
        sqlite3_bind_null(st, idx);
        return;
    }
    BindText(st, idx, s);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static model::CredentialRecord ReadCredential(sqlite3_stmt* st) {
    model::CredentialRecord r;
    r.backend_id    = ColText(st, 0);
    r.access_token  = ColText(st, 1);
    r.refresh_token = ColText(st, 2);
    r.expires_at_ms = ColU64(st, 3);
    r.scope         = ColText(st, 4);
    r.updated_at_ms = ColU64(st, 5);
    return r;
}

static model::JobRecord ReadJob(sqlite3_stmt* st) {
    model::JobRecord r;
    r.job_id         = ColText(st, 0);
    r.backend_id     = ColText(st, 1);
    r.track_ref      = ColText(st, 2);
    r.state          = static_cast<acquisition::model::JobState>(ColI32(st, 3));
    r.attempt        = static_cast<uint32_t>(ColI32(st, 4));
    r.reason         = static_cast<acquisition::model::FailureReason>(ColI32(st, 5));
    r.message        = ColText(st, 6);
    r.bytes_written  = ColU64(st, 7);
    r.poll_count     = static_cast<uint32_t>(ColI32(st, 8));
    r.created_at_ms  = ColU64(st, 9);
    r.finished_at_ms = ColU64(st, 10);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
    db.Exec(sql::CREATE_CREDENTIALS);
    db.Exec(sql::CREATE_JOB_ARCHIVE);
    db.Exec(sql::CREATE_JOB_ARCHIVE_BACKEND_INDEX);

    // fail fast on a schema from an incompatible build
    db.Exec("SELECT backend_id,access_token,refresh_token,expires_at_ms,scope,updated_at_ms FROM credentials LIMIT 1;");
    db.Exec("SELECT job_id,backend_id,track_ref,state,attempt,reason,message,bytes_written,poll_count,created_at_ms,finished_at_ms FROM job_archive LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCredential(Transaction& t, const model::CredentialRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_CREDENTIAL, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.backend_id);
    BindText(st, 2, r.access_token);
    BindOptionalText(st, 3, r.refresh_token);
    BindU64(st, 4, r.expires_at_ms);
    BindOptionalText(st, 5, r.scope);
    BindU64(st, 6, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::CredentialRecord>
SqliteRepository::GetCredential(Transaction& t, const std::string& backend_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_CREDENTIAL, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, backend_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadCredential(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::CredentialRecord> SqliteRepository::ListCredentials(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::CredentialRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_ALL_CREDENTIALS, -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW)
        out.push_back(ReadCredential(st));

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteCredential(Transaction& t, const std::string& backend_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_CREDENTIAL, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, backend_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound);
    return result;
}

// ------------------------------------------------------------------
// Job archive
// ------------------------------------------------------------------

Result SqliteRepository::UpsertJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_JOB, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.job_id);
    BindText(st, 2, r.backend_id);
    BindText(st, 3, r.track_ref);
    BindI32(st, 4, static_cast<int>(r.state));
    BindI32(st, 5, static_cast<int>(r.attempt));
    BindI32(st, 6, static_cast<int>(r.reason));
    BindOptionalText(st, 7, r.message);
    BindU64(st, 8, r.bytes_written);
    BindI32(st, 9, static_cast<int>(r.poll_count));
    BindU64(st, 10, r.created_at_ms);
    BindU64(st, 11, r.finished_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::JobRecord>
SqliteRepository::GetJob(Transaction& t, const std::string& job_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_JOB, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, job_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadJob(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::JobRecord> SqliteRepository::ListJobs(Transaction& t, const std::string& backend_id) {
    auto* db = TX(t).Handle();

    std::vector<model::JobRecord> out;
    sqlite3_stmt* st = nullptr;
    const char* query = backend_id.empty() ? sql::SELECT_JOBS : sql::SELECT_JOBS_FOR_BACKEND;
    if (sqlite3_prepare_v2(db, query, -1, &st, nullptr) != SQLITE_OK)
        return out;

    if (!backend_id.empty())
        BindText(st, 1, backend_id);

    while (sqlite3_step(st) == SQLITE_ROW)
        out.push_back(ReadJob(st));

    sqlite3_finalize(st);
    return out;
}

} // namespace acquisition::db::sqlite
