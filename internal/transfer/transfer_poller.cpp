#include "transfer_poller.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace acquisition::transfer {

namespace {

std::string Normalize(std::string_view remote) {
  std::string out;
  out.reserve(remote.size());
  for (char c : remote) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc) || c == '_' || c == '-') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(uc)));
  }
  return out;
}

bool IsFailureWord(std::string_view word) {
  return word == "failed" || word == "errored" || word == "rejected" || word == "cancelled" || word == "canceled" || word == "timedout" ||
         word == "aborted";
}

} // namespace

std::string_view ToString(TransferState state) {
  switch (state) {
    case TransferState::kInitiated:
      return "initiated";
    case TransferState::kQueued:
      return "queued";
    case TransferState::kTransferring:
      return "transferring";
    case TransferState::kCompleted:
      return "completed";
    case TransferState::kFailed:
      return "failed";
    case TransferState::kNotFound:
      return "not_found";
  }
  return "unknown";
}

std::optional<TransferState> TransferPoller::MapRemoteStatus(std::string_view remote) {
  const auto status = Normalize(remote);

  if (status == "requested" || status == "queued" || status == "queued,locally" || status == "queued,remotely") {
    return TransferState::kQueued;
  }
  if (status == "initializing" || status == "inprogress") {
    return TransferState::kTransferring;
  }
  if (status == "succeeded" || status == "completed" || status == "completed,succeeded") {
    return TransferState::kCompleted;
  }
  if (status == "notfound" || status == "gone") {
    return TransferState::kNotFound;
  }
  if (IsFailureWord(status)) {
    return TransferState::kFailed;
  }
  if (status.starts_with("completed,") && IsFailureWord(std::string_view(status).substr(10))) {
    return TransferState::kFailed;
  }
  return std::nullopt;
}

TransferPoller::TransferPoller(std::shared_ptr<transport::TransportAdapter> adapter) : adapter_(std::move(adapter)) {
  if (!adapter_) {
    throw std::invalid_argument("transfer poller requires a transport adapter");
  }
}

PeerTransferHandle TransferPoller::Initiate(const std::string& job_id, const std::string& peer_ref, const std::string& remote_file_ref) const {
  PeerTransferHandle handle;
  handle.job_id          = job_id;
  handle.peer_ref        = peer_ref;
  handle.remote_file_ref = remote_file_ref;
  handle.remote_state    = TransferState::kInitiated;
  return handle;
}

TransferState TransferPoller::Poll(PeerTransferHandle& handle, const model::Credential& credential) const {
  if (IsTerminal(handle.remote_state)) {
    throw util::InvalidState("poll on terminal transfer " + handle.remote_file_ref + " (" + std::string(ToString(handle.remote_state)) + ")");
  }

  transport::RemoteTransferStatus status;
  try {
    status = adapter_->PollTransferStatus(credential, handle.peer_ref, handle.remote_file_ref);
  } catch (const util::NotFound& e) {
    ++handle.poll_count;
    handle.remote_state       = TransferState::kNotFound;
    handle.remote_error       = e.what();
    handle.remote_status_text = "notfound";
    return handle.remote_state;
  }

  ++handle.poll_count;
  handle.remote_status_text = status.state;
  if (status.size_bytes != 0) {
    handle.size_bytes = status.size_bytes;
  }
  if (!status.local_path.empty()) {
    handle.local_path = status.local_path;
  }
  handle.bytes_transferred = std::max(handle.bytes_transferred, status.bytes_transferred);

  auto next = MapRemoteStatus(status.state).value_or(handle.remote_state);

  if (next == TransferState::kInitiated || next == TransferState::kQueued) {
    if (handle.remote_state == TransferState::kTransferring || status.bytes_transferred > 0) {
      next = TransferState::kTransferring;
    }
  }

  if (next == TransferState::kFailed) {
    handle.remote_error = status.error_message.empty() ? status.state : status.error_message;
  }

  handle.remote_state = next;
  if (next == TransferState::kInitiated || next == TransferState::kQueued) {
    ++handle.queued_polls;
  } else {
    handle.queued_polls = 0;
  }

  return handle.remote_state;
}

} // namespace acquisition::transfer
