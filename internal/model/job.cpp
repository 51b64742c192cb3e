#include "job.hpp"

namespace acquisition::model {

std::string_view ToString(JobState state) {
  switch (state) {
    case JobState::kQueued:
      return "queued";
    case JobState::kAuthorizing:
      return "authorizing";
    case JobState::kAdmitted:
      return "admitted";
    case JobState::kFetching:
      return "fetching";
    case JobState::kDecrypting:
      return "decrypting";
    case JobState::kPollingTransfer:
      return "polling_transfer";
    case JobState::kCompleted:
      return "completed";
    case JobState::kFailed:
      return "failed";
    case JobState::kUnspecified:
      break;
  }
  return "unspecified";
}

std::string_view ToString(FailureReason reason) {
  switch (reason) {
    case FailureReason::kAuth:
      return "auth";
    case FailureReason::kRateLimited:
      return "rate_limited";
    case FailureReason::kTransport:
      return "transport";
    case FailureReason::kTimeout:
      return "timeout";
    case FailureReason::kNotFound:
      return "not_found";
    case FailureReason::kRemoteFailed:
      return "remote_failed";
    case FailureReason::kContractViolation:
      return "contract_violation";
    case FailureReason::kCancelled:
      return "cancelled";
    case FailureReason::kNone:
      break;
  }
  return "none";
}

} // namespace acquisition::model
