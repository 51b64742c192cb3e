#include <cassert>
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/transfer/transfer_poller.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_transport.hpp"

namespace {

using acquisition::model::Credential;
using acquisition::testing::FakeTransport;
using acquisition::transfer::PeerTransferHandle;
using acquisition::transfer::TransferPoller;
using acquisition::transfer::TransferState;
using acquisition::transport::RemoteTransferStatus;

RemoteTransferStatus Status(const std::string& state, std::uint64_t transferred = 0, const std::string& local_path = {}) {
  RemoteTransferStatus status;
  status.state             = state;
  status.bytes_transferred = transferred;
  status.size_bytes        = 1000;
  status.local_path        = local_path;
  return status;
}

std::shared_ptr<FakeTransport> Scripted(std::deque<RemoteTransferStatus> script) {
  auto adapter     = std::make_shared<FakeTransport>("peer");
  auto remaining   = std::make_shared<std::deque<RemoteTransferStatus>>(std::move(script));
  adapter->on_poll = [remaining](const Credential&, const std::string&, const std::string&) {
    if (remaining->empty()) throw std::logic_error("poll script exhausted");
    auto next = remaining->front();
    remaining->pop_front();
    return next;
  };
  return adapter;
}

void TestStatusVocabulary() {
  using S = TransferState;
  assert(TransferPoller::MapRemoteStatus("Requested") == S::kQueued);
  assert(TransferPoller::MapRemoteStatus("Queued, Locally") == S::kQueued);
  assert(TransferPoller::MapRemoteStatus("Queued, Remotely") == S::kQueued);
  assert(TransferPoller::MapRemoteStatus("Initializing") == S::kTransferring);
  assert(TransferPoller::MapRemoteStatus("InProgress") == S::kTransferring);
  assert(TransferPoller::MapRemoteStatus("in-progress") == S::kTransferring);
  assert(TransferPoller::MapRemoteStatus("Completed, Succeeded") == S::kCompleted);
  assert(TransferPoller::MapRemoteStatus("succeeded") == S::kCompleted);
  assert(TransferPoller::MapRemoteStatus("Completed, Errored") == S::kFailed);
  assert(TransferPoller::MapRemoteStatus("Completed, Cancelled") == S::kFailed);
  assert(TransferPoller::MapRemoteStatus("Completed, TimedOut") == S::kFailed);
  assert(TransferPoller::MapRemoteStatus("Rejected") == S::kFailed);
  assert(TransferPoller::MapRemoteStatus("Not Found") == S::kNotFound);
  assert(!TransferPoller::MapRemoteStatus("Negotiating").has_value());
  assert(!TransferPoller::MapRemoteStatus("").has_value());
}

void TestFivePollSequenceToCompletion() {
  auto           adapter = Scripted({Status("Queued, Locally"), Status("Initializing"), Status("InProgress", 300), Status("InProgress", 700),
                                     Status("Completed, Succeeded", 1000, "/downloads/song.flac")});
  TransferPoller poller(adapter);

  auto handle = poller.Initiate("job-1", "peer-a", "song.flac");
  assert(handle.remote_state == TransferState::kInitiated);

  assert(poller.Poll(handle, {}) == TransferState::kQueued);
  assert(handle.queued_polls == 1);
  assert(poller.Poll(handle, {}) == TransferState::kTransferring);
  assert(handle.queued_polls == 0);
  assert(poller.Poll(handle, {}) == TransferState::kTransferring);
  assert(poller.Poll(handle, {}) == TransferState::kTransferring);
  assert(handle.bytes_transferred == 700);
  assert(poller.Poll(handle, {}) == TransferState::kCompleted);

  assert(handle.poll_count == 5);
  assert(handle.local_path == "/downloads/song.flac");
  assert(handle.size_bytes == 1000);
  assert(adapter->poll_calls == 5);
}

void TestQueuedAfterTransferringStaysTransferring() {
  auto           adapter = Scripted({Status("InProgress", 10), Status("Queued"), Status("Queued", 20)});
  TransferPoller poller(adapter);

  auto handle = poller.Initiate("job-2", "peer", "file");
  assert(poller.Poll(handle, {}) == TransferState::kTransferring);
  assert(poller.Poll(handle, {}) == TransferState::kTransferring);
  assert(poller.Poll(handle, {}) == TransferState::kTransferring);
  assert(handle.queued_polls == 0);
  // progress never goes backwards
  assert(handle.bytes_transferred == 20);
}

void TestUnknownStatusKeepsPreviousState() {
  auto           adapter = Scripted({Status("Queued"), Status("Negotiating"), Status("Queued")});
  TransferPoller poller(adapter);

  auto handle = poller.Initiate("job-3", "peer", "file");
  assert(poller.Poll(handle, {}) == TransferState::kQueued);
  assert(poller.Poll(handle, {}) == TransferState::kQueued);
  assert(handle.remote_status_text == "Negotiating");
  assert(poller.Poll(handle, {}) == TransferState::kQueued);
  assert(handle.queued_polls == 3);
}

void TestFailureRecordsRemoteError() {
  auto failed          = Status("Completed, Errored");
  failed.error_message = "peer went offline";
  auto           adapter = Scripted({failed});
  TransferPoller poller(adapter);

  auto handle = poller.Initiate("job-4", "peer", "file");
  assert(poller.Poll(handle, {}) == TransferState::kFailed);
  assert(handle.remote_error == "peer went offline");
}

void TestNotFoundFromAdapter() {
  auto adapter     = std::make_shared<FakeTransport>("peer");
  adapter->on_poll = [](const Credential&, const std::string&, const std::string& file) -> RemoteTransferStatus {
    throw acquisition::util::NotFound("no transfer for " + file);
  };
  TransferPoller poller(adapter);

  auto handle = poller.Initiate("job-5", "peer", "file");
  assert(poller.Poll(handle, {}) == TransferState::kNotFound);
  assert(handle.poll_count == 1);

  bool threw = false;
  try {
    poller.Poll(handle, {});
  } catch (const acquisition::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "polling a terminal transfer must fail");
  assert(adapter->poll_calls == 1);
}

void TestTransportErrorsPropagate() {
  auto adapter     = std::make_shared<FakeTransport>("peer");
  adapter->on_poll = [](const Credential&, const std::string&, const std::string&) -> RemoteTransferStatus {
    throw acquisition::util::TransportError("503");
  };
  TransferPoller poller(adapter);

  auto handle = poller.Initiate("job-6", "peer", "file");
  bool threw  = false;
  try {
    poller.Poll(handle, {});
  } catch (const acquisition::util::TransportError&) {
    threw = true;
  }
  assert(threw);
  assert(handle.poll_count == 0);
  assert(handle.remote_state == TransferState::kInitiated);
}

void TestRequiresAdapter() {
  bool threw = false;
  try {
    TransferPoller poller(nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestStatusVocabulary();
  TestFivePollSequenceToCompletion();
  TestQueuedAfterTransferringStaysTransferring();
  TestUnknownStatusKeepsPreviousState();
  TestFailureRecordsRemoteError();
  TestNotFoundFromAdapter();
  TestTransportErrorsPropagate();
  TestRequiresAdapter();

  std::cout << "acquisition_unit_transfer_poller: pass\n";
  return 0;
}
