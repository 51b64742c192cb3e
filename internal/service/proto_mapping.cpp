#include "proto_mapping.hpp"

#include "internal/util/time.hpp"

namespace acquisition::service {

namespace v1 = acquisition::engine::v1;

v1::JobState ToProto(model::JobState state) {
  switch (state) {
    case model::JobState::kQueued:
      return v1::JOB_STATE_QUEUED;
    case model::JobState::kAuthorizing:
      return v1::JOB_STATE_AUTHORIZING;
    case model::JobState::kAdmitted:
      return v1::JOB_STATE_ADMITTED;
    case model::JobState::kFetching:
      return v1::JOB_STATE_FETCHING;
    case model::JobState::kDecrypting:
      return v1::JOB_STATE_DECRYPTING;
    case model::JobState::kPollingTransfer:
      return v1::JOB_STATE_POLLING_TRANSFER;
    case model::JobState::kCompleted:
      return v1::JOB_STATE_COMPLETED;
    case model::JobState::kFailed:
      return v1::JOB_STATE_FAILED;
    case model::JobState::kUnspecified:
      break;
  }
  return v1::JOB_STATE_UNSPECIFIED;
}

v1::FailureReason ToProto(model::FailureReason reason) {
  switch (reason) {
    case model::FailureReason::kAuth:
      return v1::FAILURE_REASON_AUTH;
    case model::FailureReason::kRateLimited:
      return v1::FAILURE_REASON_RATE_LIMITED;
    case model::FailureReason::kTransport:
      return v1::FAILURE_REASON_TRANSPORT;
    case model::FailureReason::kTimeout:
      return v1::FAILURE_REASON_TIMEOUT;
    case model::FailureReason::kNotFound:
      return v1::FAILURE_REASON_NOT_FOUND;
    case model::FailureReason::kRemoteFailed:
      return v1::FAILURE_REASON_REMOTE_FAILED;
    case model::FailureReason::kContractViolation:
      return v1::FAILURE_REASON_CONTRACT_VIOLATION;
    case model::FailureReason::kCancelled:
      return v1::FAILURE_REASON_CANCELLED;
    case model::FailureReason::kNone:
      break;
  }
  return v1::FAILURE_REASON_UNSPECIFIED;
}

v1::JobStatus ToProto(const model::JobStatus& status) {
  v1::JobStatus out;
  out.set_job_id(status.job_id);
  out.set_backend_id(status.backend_id);
  out.set_track_ref(status.track_ref);
  out.set_state(ToProto(status.state));
  out.set_attempt(status.attempt);
  if (status.last_error) {
    out.mutable_last_error()->set_reason(ToProto(status.last_error->reason));
    out.mutable_last_error()->set_message(status.last_error->message);
  }
  out.set_bytes_written(status.bytes_written);
  out.set_poll_count(status.poll_count);
  *out.mutable_created_at() = util::ToProto(status.created_at);
  *out.mutable_updated_at() = util::ToProto(status.updated_at);
  if (status.finished_at) {
    *out.mutable_finished_at() = util::ToProto(*status.finished_at);
  }
  return out;
}

v1::CredentialSummary ToProto(const model::CredentialSummary& summary) {
  v1::CredentialSummary out;
  out.set_backend_id(summary.backend_id);
  out.set_present(summary.present);
  out.set_usable(summary.usable);
  out.set_has_refresh_token(summary.has_refresh_token);
  if (summary.expires_at) {
    *out.mutable_expires_at() = util::ToProto(*summary.expires_at);
  }
  out.set_scope(summary.scope);
  out.set_refresh_count(summary.refresh_count);
  return out;
}

model::Credential FromProto(const std::string& backend_id, const v1::Credential& credential) {
  model::Credential out;
  out.backend_id   = backend_id;
  out.access_token = credential.access_token();
  if (!credential.refresh_token().empty()) {
    out.refresh_token = credential.refresh_token();
  }
  if (credential.has_expires_at()) {
    out.expires_at = util::FromProto(credential.expires_at());
  }
  out.scope = credential.scope();
  return out;
}

} // namespace acquisition::service
