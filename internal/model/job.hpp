#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace acquisition::model {

enum class JobState : std::uint8_t {
  kUnspecified     = 0,
  kQueued          = 1,
  kAuthorizing     = 2,
  kAdmitted        = 3,
  kFetching        = 4,
  kDecrypting      = 5,
  kPollingTransfer = 6,
  kCompleted       = 7,
  kFailed          = 8,
};

enum class FailureReason : std::uint8_t {
  kNone              = 0,
  kAuth              = 1,
  kRateLimited       = 2,
  kTransport         = 3,
  kTimeout           = 4,
  kNotFound          = 5,
  kRemoteFailed      = 6,
  kContractViolation = 7,
  kCancelled         = 8,
};

constexpr bool IsTerminal(JobState state) {
  return state == JobState::kCompleted || state == JobState::kFailed;
}

// Reasons eligible for another attempt under the backoff policy.
constexpr bool IsTransient(FailureReason reason) {
  return reason == FailureReason::kTransport || reason == FailureReason::kRateLimited || reason == FailureReason::kRemoteFailed;
}

constexpr bool CanTransition(JobState from, JobState to) {
  if (from == to) {
    return !IsTerminal(from);
  }
  if (IsTerminal(from)) {
    return false;
  }

  switch (to) {
    case JobState::kFailed:
    case JobState::kAuthorizing:
      return true;
    case JobState::kAdmitted:
      return from == JobState::kAuthorizing;
    case JobState::kFetching:
      return from == JobState::kAdmitted;
    case JobState::kDecrypting:
    case JobState::kPollingTransfer:
      // Admitted covers resuming after re-authorization
      return from == JobState::kFetching || from == JobState::kAdmitted;
    case JobState::kCompleted:
      return from == JobState::kDecrypting || from == JobState::kPollingTransfer;
    case JobState::kUnspecified:
    case JobState::kQueued:
      return false;
  }
  return false;
}

std::string_view ToString(JobState state);
std::string_view ToString(FailureReason reason);

struct JobError {
  FailureReason reason = FailureReason::kNone;
  std::string   message;
};

/*
  Point-in-time view of one job. Safe to hand out, never aliases live state.
*/
struct JobStatus {
  std::string job_id;
  std::string backend_id;
  std::string track_ref;

  JobState      state   = JobState::kUnspecified;
  std::uint32_t attempt = 0;

  std::optional<JobError> last_error;

  std::uint64_t bytes_written = 0;
  std::uint32_t poll_count    = 0;

  util::TimePoint                created_at{};
  util::TimePoint                updated_at{};
  std::optional<util::TimePoint> finished_at;
};

} // namespace acquisition::model
