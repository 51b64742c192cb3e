#pragma once

namespace acquisition::db::sql {

/*
  Canonical SQL for the sqlite repository and its schema bootstrap.
*/

static constexpr const char* CREATE_CREDENTIALS =
    "CREATE TABLE IF NOT EXISTS credentials ("
    " backend_id TEXT PRIMARY KEY CHECK(length(backend_id) > 0),"
    " access_token TEXT NOT NULL,"
    " refresh_token TEXT,"
    " expires_at_ms INTEGER NOT NULL DEFAULT 0,"
    " scope TEXT,"
    " updated_at_ms INTEGER NOT NULL);";

static constexpr const char* CREATE_JOB_ARCHIVE =
    "CREATE TABLE IF NOT EXISTS job_archive ("
    " job_id TEXT PRIMARY KEY CHECK(length(job_id) > 0),"
    " backend_id TEXT NOT NULL,"
    " track_ref TEXT NOT NULL,"
    " state INTEGER NOT NULL,"
    " attempt INTEGER NOT NULL,"
    " reason INTEGER NOT NULL,"
    " message TEXT,"
    " bytes_written INTEGER NOT NULL,"
    " poll_count INTEGER NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " finished_at_ms INTEGER NOT NULL);";

static constexpr const char* CREATE_JOB_ARCHIVE_BACKEND_INDEX =
    "CREATE INDEX IF NOT EXISTS job_archive_backend ON job_archive(backend_id, finished_at_ms);";

// credentials

static constexpr const char* UPSERT_CREDENTIAL =
    "INSERT INTO credentials(backend_id,access_token,refresh_token,expires_at_ms,scope,updated_at_ms)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(backend_id) DO UPDATE SET"
    " access_token=excluded.access_token,"
    " refresh_token=excluded.refresh_token,"
    " expires_at_ms=excluded.expires_at_ms,"
    " scope=excluded.scope,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_CREDENTIAL =
    "SELECT backend_id,access_token,refresh_token,expires_at_ms,scope,updated_at_ms"
    " FROM credentials WHERE backend_id=?;";

static constexpr const char* SELECT_ALL_CREDENTIALS =
    "SELECT backend_id,access_token,refresh_token,expires_at_ms,scope,updated_at_ms"
    " FROM credentials ORDER BY backend_id;";

static constexpr const char* DELETE_CREDENTIAL =
    "DELETE FROM credentials WHERE backend_id=?;";

// job archive

static constexpr const char* UPSERT_JOB =
    "INSERT INTO job_archive(job_id,backend_id,track_ref,state,attempt,reason,message,bytes_written,poll_count,created_at_ms,finished_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(job_id) DO UPDATE SET"
    " state=excluded.state,"
    " attempt=excluded.attempt,"
    " reason=excluded.reason,"
    " message=excluded.message,"
    " bytes_written=excluded.bytes_written,"
    " poll_count=excluded.poll_count,"
    " finished_at_ms=excluded.finished_at_ms;";

static constexpr const char* SELECT_JOB =
    "SELECT job_id,backend_id,track_ref,state,attempt,reason,message,bytes_written,poll_count,created_at_ms,finished_at_ms"
    " FROM job_archive WHERE job_id=?;";

static constexpr const char* SELECT_JOBS =
    "SELECT job_id,backend_id,track_ref,state,attempt,reason,message,bytes_written,poll_count,created_at_ms,finished_at_ms"
    " FROM job_archive ORDER BY finished_at_ms DESC, job_id;";

static constexpr const char* SELECT_JOBS_FOR_BACKEND =
    "SELECT job_id,backend_id,track_ref,state,attempt,reason,message,bytes_written,poll_count,created_at_ms,finished_at_ms"
    " FROM job_archive WHERE backend_id=? ORDER BY finished_at_ms DESC, job_id;";

} // namespace acquisition::db::sql
