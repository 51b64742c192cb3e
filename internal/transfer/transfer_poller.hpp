#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/credential.hpp"
#include "internal/transport/transport_adapter.hpp"

namespace acquisition::transfer {

enum class TransferState : std::uint8_t {
  kInitiated    = 0,
  kQueued       = 1,
  kTransferring = 2,
  kCompleted    = 3,
  kFailed       = 4,
  kNotFound     = 5,
};

constexpr bool IsTerminal(TransferState state) {
  return state == TransferState::kCompleted || state == TransferState::kFailed || state == TransferState::kNotFound;
}

std::string_view ToString(TransferState state);

/*
  One asynchronous transfer. remote_state is a snapshot, authoritative
  only right after a poll.
*/
struct PeerTransferHandle {
  std::string job_id;
  std::string peer_ref;
  std::string remote_file_ref;

  TransferState remote_state = TransferState::kInitiated;

  std::uint32_t poll_count = 0;

  // consecutive polls spent in Initiated/Queued
  std::uint32_t queued_polls = 0;

  std::uint64_t bytes_transferred = 0;
  std::uint64_t size_bytes        = 0;

  std::string local_path;
  std::string remote_error;
  std::string remote_status_text;
};

/*
  TransferPoller

  Drives one peer transfer through status queries. The caller decides
  when to poll; the poller never schedules itself.
*/
class TransferPoller {
 public:
  explicit TransferPoller(std::shared_ptr<transport::TransportAdapter> adapter);

  PeerTransferHandle Initiate(const std::string& job_id, const std::string& peer_ref, const std::string& remote_file_ref) const;

  // One status query. Throws util::InvalidState on a terminal handle;
  // util::AuthDenied and util::TransportError propagate.
  TransferState Poll(PeerTransferHandle& handle, const model::Credential& credential) const;

  // nullopt for vocabulary we do not recognise
  static std::optional<TransferState> MapRemoteStatus(std::string_view remote);

 private:
  std::shared_ptr<transport::TransportAdapter> adapter_;
};

} // namespace acquisition::transfer
