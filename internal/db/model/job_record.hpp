#pragma once

#include <cstdint>
#include <string>

#include "internal/model/job.hpp"

namespace acquisition::db::model {

/*
  Archived terminal job.

  Written once when a job reaches Completed or Failed so that status
  queries still resolve after the in-memory copy is pruned.
*/
struct JobRecord {
  std::string job_id;
  std::string backend_id;
  std::string track_ref;

  acquisition::model::JobState      state  = acquisition::model::JobState::kUnspecified;
  uint32_t                          attempt = 0;
  acquisition::model::FailureReason reason = acquisition::model::FailureReason::kNone;
  std::string                       message;

  uint64_t bytes_written = 0;
  uint32_t poll_count    = 0;

  uint64_t created_at_ms  = 0;
  uint64_t finished_at_ms = 0;
};

} // namespace acquisition::db::model
