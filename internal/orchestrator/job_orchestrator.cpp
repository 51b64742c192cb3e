#include "job_orchestrator.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace acquisition::orchestrator {

using model::FailureReason;
using model::JobState;
using observability::IntField;
using observability::StringField;

namespace {

double ElapsedMs(util::SteadyTimePoint since) {
  return std::chrono::duration<double, std::milli>(util::SteadyClock::now() - since).count();
}

model::JobStatus FromRecord(const db::model::JobRecord& record) {
  model::JobStatus status;
  status.job_id        = record.job_id;
  status.backend_id    = record.backend_id;
  status.track_ref     = record.track_ref;
  status.state         = record.state;
  status.attempt       = record.attempt;
  status.bytes_written = record.bytes_written;
  status.poll_count    = record.poll_count;
  status.created_at    = util::FromUnixMillis(record.created_at_ms);
  if (record.reason != FailureReason::kNone) {
    status.last_error = model::JobError{record.reason, record.message};
  }
  if (record.finished_at_ms != 0) {
    status.finished_at = util::FromUnixMillis(record.finished_at_ms);
    status.updated_at  = *status.finished_at;
  } else {
    status.updated_at = status.created_at;
  }
  return status;
}

/*
  Runs a backend call against the job's time limit. Without a deadline the
  call runs inline. With one it runs on its own thread and the caller stops
  waiting at the deadline; the late result is dropped. `call` must own
  everything it touches.
*/
template <typename Call>
std::invoke_result_t<Call&> CallBefore(const std::optional<util::SteadyTimePoint>& deadline, Call call) {
  using Result = std::invoke_result_t<Call&>;

  if (!deadline) {
    return call();
  }

  struct Outcome {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    done = false;
    std::optional<Result>   value;
    std::exception_ptr      error;
  };
  auto outcome = std::make_shared<Outcome>();

  std::thread([outcome, call = std::move(call)]() mutable {
    std::optional<Result> value;
    std::exception_ptr    error;
    try {
      value.emplace(call());
    } catch (...) {
      // handed to the waiting worker, rethrown there
      error = std::current_exception();
    }
    {
      std::lock_guard lock(outcome->mutex);
      outcome->value = std::move(value);
      outcome->error = error;
      outcome->done  = true;
    }
    outcome->cv.notify_all();
  }).detach();

  std::unique_lock lock(outcome->mutex);
  if (!outcome->cv.wait_until(lock, *deadline, [&] { return outcome->done; })) {
    throw util::DeadlineExceeded("backend call still running at the job deadline");
  }
  if (outcome->error) {
    std::rethrow_exception(outcome->error);
  }
  return std::move(*outcome->value);
}

db::model::JobRecord ToRecord(const model::JobStatus& status) {
  db::model::JobRecord record;
  record.job_id         = status.job_id;
  record.backend_id     = status.backend_id;
  record.track_ref      = status.track_ref;
  record.state          = status.state;
  record.attempt        = status.attempt;
  record.bytes_written  = status.bytes_written;
  record.poll_count     = status.poll_count;
  record.created_at_ms  = util::ToUnixMillis(status.created_at);
  record.finished_at_ms = status.finished_at ? util::ToUnixMillis(*status.finished_at) : 0;
  if (status.last_error) {
    record.reason  = status.last_error->reason;
    record.message = status.last_error->message;
  }
  return record;
}

} // namespace

JobOrchestrator::JobOrchestrator(OrchestratorOptions options, std::shared_ptr<credential::CredentialStore> credentials,
                                 std::shared_ptr<rate::RateGovernor> governor, std::shared_ptr<db::Repository> repository)
    : options_(std::move(options)), credentials_(std::move(credentials)), governor_(std::move(governor)), repository_(std::move(repository)) {
  if (!credentials_ || !governor_) {
    throw std::invalid_argument("JobOrchestrator requires a credential store and a rate governor");
  }
}

JobOrchestrator::~JobOrchestrator() {
  Stop();
}

std::string JobOrchestrator::DedupKey(const std::string& backend_id, const std::string& track_ref) {
  return backend_id + '\n' + track_ref;
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void JobOrchestrator::RegisterBackend(const model::BackendProfile& profile, std::shared_ptr<transport::TransportAdapter> adapter) {
  if (!adapter) {
    throw std::invalid_argument("backend " + profile.backend_id + " registered without a transport adapter");
  }

  std::unique_lock lock(lanes_mutex_);
  if (lanes_.contains(profile.backend_id)) {
    throw util::AlreadyExists("backend already registered: " + profile.backend_id);
  }

  credentials_->RegisterBackend(profile.backend_id, profile.credentials, adapter);
  governor_->Configure(profile.backend_id, profile.min_interval, profile.burst_allowance);

  auto lane       = std::make_unique<Lane>();
  lane->profile   = profile;
  lane->adapter   = adapter;
  lane->scheduler = std::make_shared<JobScheduler>();
  if (std::holds_alternative<model::PeerTransferDelivery>(profile.delivery)) {
    lane->poller = std::make_shared<transfer::TransferPoller>(adapter);
  }

  if (running_) {
    for (std::uint32_t i = 0; i < std::max<std::uint32_t>(1, options_.workers_per_backend); ++i) {
      lane->workers.push_back(std::make_unique<JobWorker>(profile.backend_id, lane->scheduler, this));
      lane->workers.back()->Start();
    }
  }

  ACQUISITION_LOG_INFO("backend registered",
                       {StringField("backend", profile.backend_id),
                        StringField("delivery", std::holds_alternative<model::PeerTransferDelivery>(profile.delivery) ? "peer_transfer"
                                                                                                                         : "encrypted_stream"),
                        IntField("min_interval_ms", profile.min_interval.count()), IntField("burst", profile.burst_allowance)});

  lanes_.emplace(profile.backend_id, std::move(lane));
}

bool JobOrchestrator::HasBackend(const std::string& backend_id) const {
  return FindLane(backend_id) != nullptr;
}

void JobOrchestrator::Start() {
  std::unique_lock lock(lanes_mutex_);
  if (stopped_) {
    throw util::InvalidState("engine stopped");
  }
  if (running_) {
    return;
  }
  running_ = true;

  for (auto& [backend_id, lane] : lanes_) {
    for (std::uint32_t i = 0; i < std::max<std::uint32_t>(1, options_.workers_per_backend); ++i) {
      lane->workers.push_back(std::make_unique<JobWorker>(backend_id, lane->scheduler, this));
      lane->workers.back()->Start();
    }
  }
}

/*
  Stop is final: pending jobs end Failed: Cancelled and every sink is closed.
*/
void JobOrchestrator::Stop() {
  {
    std::unique_lock lock(lanes_mutex_);
    running_ = false;
    stopped_ = true;
  }

  std::vector<std::shared_ptr<Job>> pending;
  {
    std::shared_lock lock(jobs_mutex_);
    for (const auto& [key, job_id] : active_) {
      auto it = jobs_.find(job_id);
      if (it != jobs_.end()) {
        pending.push_back(it->second);
      }
    }
  }

  // wake jobs blocked in admission
  for (auto& job : pending) {
    job->stop.request_stop();
  }

  {
    std::shared_lock lock(lanes_mutex_);
    for (auto& [backend_id, lane] : lanes_) {
      lane->scheduler->Shutdown();
      for (auto& worker : lane->workers) {
        worker->Stop();
      }
      lane->workers.clear();
    }
  }

  for (auto& job : pending) {
    Finish(*job, JobState::kFailed, model::JobError{FailureReason::kCancelled, "engine stopped"});
  }
}

// ------------------------------------------------------------------
// Public API
// ------------------------------------------------------------------

SubmitResult JobOrchestrator::Submit(const std::string& backend_id, const std::string& track_ref, std::shared_ptr<storage::OutputSink> sink) {
  if (track_ref.empty()) {
    throw std::invalid_argument("track_ref must not be empty");
  }
  if (!sink) {
    throw std::invalid_argument("output sink must not be null");
  }

  auto* lane = FindLane(backend_id);
  if (!lane) {
    throw util::NotFound("unknown backend: " + backend_id);
  }

  std::string job_id;
  {
    std::unique_lock lock(jobs_mutex_);

    // checked under jobs_mutex_ so Stop() either sees this job or we see the flag
    if (stopped_) {
      throw util::InvalidState("engine stopped");
    }

    const auto key = DedupKey(backend_id, track_ref);
    if (auto it = active_.find(key); it != active_.end()) {
      return SubmitResult{it->second, false};
    }

    auto job = std::make_shared<Job>();
    job_id   = util::GenerateJobId();

    const auto now         = util::Now();
    job->status.job_id     = job_id;
    job->status.backend_id = backend_id;
    job->status.track_ref  = track_ref;
    job->status.state      = JobState::kQueued;
    job->status.created_at = now;
    job->status.updated_at = now;
    job->sink              = std::move(sink);
    job->submitted_steady  = util::SteadyClock::now();
    if (options_.job_timeout) {
      job->deadline = job->submitted_steady + *options_.job_timeout;
    }

    jobs_.emplace(job_id, std::move(job));
    active_.emplace(key, job_id);
  }

  ACQUISITION_LOG_INFO("job submitted", {StringField("job_id", job_id), StringField("backend", backend_id), StringField("track", track_ref)});

  PublishActiveJobs(backend_id);
  lane->scheduler->Enqueue(job_id);

  return SubmitResult{job_id, true};
}

model::JobStatus JobOrchestrator::Status(const std::string& job_id) const {
  if (auto job = FindJob(job_id)) {
    std::lock_guard lock(job->mutex);
    return job->status;
  }

  if (repository_) {
    auto tx     = repository_->Begin();
    auto record = repository_->GetJob(*tx, job_id);
    tx->Commit();
    if (record) {
      return FromRecord(*record);
    }
  }

  throw util::NotFound("job not found: " + job_id);
}

model::JobStatus JobOrchestrator::Cancel(const std::string& job_id) {
  auto job = FindJob(job_id);
  if (!job) {
    // archived jobs are terminal; cancelling them is a no-op
    return Status(job_id);
  }

  model::JobStatus snapshot;
  {
    std::lock_guard lock(job->mutex);
    snapshot = job->status;
  }
  if (model::IsTerminal(snapshot.state)) {
    return snapshot;
  }

  job->stop.request_stop();
  if (auto* lane = FindLane(snapshot.backend_id)) {
    lane->scheduler->Expedite(job_id);
  }

  ACQUISITION_LOG_INFO("job cancellation requested", {StringField("job_id", job_id), StringField("backend", snapshot.backend_id)});
  return snapshot;
}

std::vector<model::JobStatus> JobOrchestrator::List(const std::string& backend_id) const {
  std::vector<model::JobStatus> out;
  {
    std::shared_lock lock(jobs_mutex_);
    out.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) {
      std::lock_guard job_lock(job->mutex);
      if (backend_id.empty() || job->status.backend_id == backend_id) {
        out.push_back(job->status);
      }
    }
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at > b.created_at; });
  return out;
}

std::optional<model::JobStatus> JobOrchestrator::WaitForTerminal(const std::string& job_id, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(terminal_mutex_);

  std::optional<model::JobStatus> last;
  const bool                      done = terminal_cv_.wait_for(lock, timeout, [&] {
    last = Status(job_id);
    return model::IsTerminal(last->state);
  });

  if (!done) {
    return std::nullopt;
  }
  return last;
}

// ------------------------------------------------------------------
// Step execution
// ------------------------------------------------------------------

std::shared_ptr<JobOrchestrator::Job> JobOrchestrator::FindJob(const std::string& job_id) const {
  std::shared_lock lock(jobs_mutex_);
  auto             it = jobs_.find(job_id);
  return it == jobs_.end() ? nullptr : it->second;
}

JobOrchestrator::Lane* JobOrchestrator::FindLane(const std::string& backend_id) const {
  std::shared_lock lock(lanes_mutex_);
  auto             it = lanes_.find(backend_id);
  return it == lanes_.end() ? nullptr : it->second.get();
}

void JobOrchestrator::RunStep(const std::string& job_id) {
  auto job = FindJob(job_id);
  if (!job) {
    return;
  }

  std::string backend_id;
  {
    std::lock_guard lock(job->mutex);
    if (model::IsTerminal(job->status.state)) {
      return;
    }
    backend_id = job->status.backend_id;
  }

  auto* lane = FindLane(backend_id);
  if (!lane) {
    Finish(*job, JobState::kFailed, model::JobError{FailureReason::kNotFound, "backend no longer registered: " + backend_id});
    return;
  }

  while (true) {
    if (Interrupted(*job)) {
      return;
    }

    auto next = Execute(*job, *lane);
    if (next.inline_continue) {
      continue;
    }
    if (next.ready_at) {
      lane->scheduler->Enqueue(job_id, ClampToDeadline(*job, *next.ready_at));
      // Cancel() may have missed the entry while this step ran
      if (job->stop.stop_requested()) {
        lane->scheduler->Expedite(job_id);
      }
    }
    return;
  }
}

bool JobOrchestrator::Interrupted(Job& job) {
  if (job.stop.stop_requested()) {
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kCancelled, "cancelled"});
    return true;
  }
  if (job.deadline && util::SteadyClock::now() >= *job.deadline) {
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kTimeout, "job exceeded its time limit"});
    return true;
  }
  return false;
}

std::string_view JobOrchestrator::PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kAuthorize:
      return "authorize";
    case Phase::kFetch:
      return "fetch";
    case Phase::kChunk:
      return "chunk";
    case Phase::kPoll:
      return "poll";
  }
  return "unknown";
}

JobOrchestrator::Next JobOrchestrator::Execute(Job& job, Lane& lane) {
  std::uint32_t attempt = 0;
  {
    std::lock_guard lock(job.mutex);
    attempt = job.status.attempt;
  }

  observability::SpanScope span("acquisition.job.step");
  span.SetAttribute("job.id", job.status.job_id);
  span.SetAttribute("job.backend", job.status.backend_id);
  span.SetAttribute("job.phase", PhaseName(job.phase));
  span.SetAttribute("job.attempt", static_cast<std::int64_t>(attempt));

  const auto failed = [&](const std::exception& e) { span.RecordException(e.what()); };

  try {
    switch (job.phase) {
      case Phase::kAuthorize:
        return Authorize(job, lane);
      case Phase::kFetch:
        return Fetch(job, lane);
      case Phase::kChunk:
        return FetchChunk(job, lane);
      case Phase::kPoll:
        return PollTransfer(job, lane);
    }
    throw util::InvalidState("unknown job phase");
  } catch (const util::AuthDenied& e) {
    failed(e);
    return HandleAuthDenied(job, e.what());
  } catch (const util::AuthExpired& e) {
    failed(e);
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kAuth, e.what()});
  } catch (const util::AdmissionCancelled&) {
    span.AddEvent("admission cancelled");
    // Interrupted() tells cancellation from deadline expiry
    return Next::Continue();
  } catch (const util::DeadlineExceeded& e) {
    failed(e);
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kTimeout, std::string("job exceeded its time limit: ") + e.what()});
  } catch (const util::RateLimited& e) {
    failed(e);
    return FailAttempt(job, FailureReason::kRateLimited, e.what());
  } catch (const util::TransportError& e) {
    failed(e);
    return FailAttempt(job, FailureReason::kTransport, e.what());
  } catch (const util::NotFound& e) {
    failed(e);
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kNotFound, e.what()});
  } catch (const util::OutOfSequenceChunk& e) {
    failed(e);
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kContractViolation, e.what()});
  } catch (const util::DecryptionContextMisuse& e) {
    failed(e);
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kContractViolation, e.what()});
  } catch (const util::Unsupported& e) {
    failed(e);
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kContractViolation, e.what()});
  } catch (const util::InvalidState& e) {
    failed(e);
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kContractViolation, e.what()});
  } catch (const std::exception& e) {
    failed(e);
    // output sink I/O
    return FailAttempt(job, FailureReason::kTransport, e.what());
  }
  return Next::Done();
}

JobOrchestrator::Next JobOrchestrator::Authorize(Job& job, Lane& lane) {
  {
    std::lock_guard lock(job.mutex);
    if (job.status.attempt == 0) {
      job.status.attempt = 1;
    }
  }
  Transition(job, JobState::kAuthorizing);

  credentials_->EnsureValid(lane.profile.backend_id);

  job.phase = job.resume_phase.value_or(Phase::kFetch);
  job.resume_phase.reset();
  return Next::Continue();
}

model::Credential JobOrchestrator::Admit(Job& job, Lane& lane) {
  const auto& backend_id = lane.profile.backend_id;

  const auto started = util::SteadyClock::now();
  governor_->Admit(backend_id, job.stop.get_token(), job.deadline);
  observability::Metrics::Instance().ObserveAdmissionWaitMs(backend_id, ElapsedMs(started));

  auto credential = credentials_->EnsureValid(backend_id);

  bool authorizing = false;
  {
    std::lock_guard lock(job.mutex);
    authorizing = job.status.state == JobState::kAuthorizing;
  }
  if (authorizing) {
    Transition(job, JobState::kAdmitted);
  }
  return credential;
}

JobOrchestrator::Next JobOrchestrator::Fetch(Job& job, Lane& lane) {
  auto credential = Admit(job, lane);
  Transition(job, JobState::kFetching);

  const auto& track_ref = job.status.track_ref;

  return std::visit(
      [&](const auto& delivery) -> Next {
        using Delivery = std::decay_t<decltype(delivery)>;

        if constexpr (std::is_same_v<Delivery, model::EncryptedStreamDelivery>) {
          auto metadata = CallBefore(job.deadline, [adapter = lane.adapter, credential, track = track_ref] {
            return adapter->FetchMetadata(credential, track);
          });
          if (job.stop.stop_requested()) {
            return Next::Continue();
          }

          job.total_bytes    = metadata.size_bytes;
          job.stream         = crypto::ChunkDecryptor::Begin(track_ref, delivery, metadata.key_material);
          job.next_chunk     = 0;
          job.chunk_failures = 0;

          Transition(job, JobState::kDecrypting);
          job.phase = Phase::kChunk;
          return Next::Now();
        } else {
          auto ref = CallBefore(job.deadline, [adapter = lane.adapter, credential, track = track_ref] {
            return adapter->InitiateTransfer(credential, track);
          });
          if (job.stop.stop_requested()) {
            return Next::Continue();
          }

          job.transfer    = lane.poller->Initiate(job.status.job_id, ref.peer_ref, ref.remote_file_ref);
          job.poll_errors = 0;

          Transition(job, JobState::kPollingTransfer);
          job.phase = Phase::kPoll;
          return Next::At(util::SteadyClock::now() + delivery.poll_interval);
        }
      },
      lane.profile.delivery);
}

JobOrchestrator::Next JobOrchestrator::FetchChunk(Job& job, Lane& lane) {
  const auto& delivery = std::get<model::EncryptedStreamDelivery>(lane.profile.delivery);
  auto&       stream   = *job.stream;

  const std::uint64_t offset = job.next_chunk * stream.chunk_size;
  if (job.total_bytes != 0 && offset >= job.total_bytes) {
    return Complete(job);
  }

  std::uint64_t length = stream.chunk_size;
  if (job.total_bytes != 0) {
    length = std::min(length, job.total_bytes - offset);
  }

  auto credential = Admit(job, lane);
  Transition(job, JobState::kDecrypting);

  transport::Bytes encrypted;
  try {
    encrypted = CallBefore(job.deadline, [adapter = lane.adapter, credential, track = job.status.track_ref, range = transport::ByteRange{offset, length}] {
      return adapter->FetchEncryptedBytes(credential, track, range);
    });
    // a range cut short before the known end of the track
    if (job.total_bytes != 0 && encrypted.size() < length) {
      throw util::TransportError("short read at offset " + std::to_string(offset) + ": " + std::to_string(encrypted.size()) + " of " +
                                 std::to_string(length) + " bytes");
    }
  } catch (const util::TransportError& e) {
    if (job.stop.stop_requested()) {
      return Next::Continue();
    }
    if (++job.chunk_failures > delivery.chunk_retry_limit) {
      return FailAttempt(job, FailureReason::kTransport, "chunk " + std::to_string(job.next_chunk) + ": " + e.what());
    }
    ACQUISITION_LOG_WARN("retrying chunk", {StringField("job_id", job.status.job_id), IntField("chunk", static_cast<std::int64_t>(job.next_chunk)),
                                            IntField("failures", job.chunk_failures), StringField("error", e.what())});
    return Next::Now();
  }

  if (job.stop.stop_requested()) {
    return Next::Continue();
  }

  auto plain = crypto::ChunkDecryptor::Decrypt(stream, job.next_chunk, encrypted);
  job.sink->Write(plain.data(), plain.size());

  job.chunk_failures = 0;
  ++job.next_chunk;
  {
    std::lock_guard lock(job.mutex);
    job.status.bytes_written = job.sink->BytesWritten();
    job.status.updated_at    = util::Now();
  }

  // a short chunk ends the stream only when the size is unknown
  const bool last = job.total_bytes != 0 ? offset + encrypted.size() >= job.total_bytes : encrypted.size() < stream.chunk_size;
  if (last) {
    return Complete(job);
  }
  return Next::Now();
}

JobOrchestrator::Next JobOrchestrator::PollTransfer(Job& job, Lane& lane) {
  const auto& delivery = std::get<model::PeerTransferDelivery>(lane.profile.delivery);
  auto&       handle   = *job.transfer;

  auto credential = Admit(job, lane);
  Transition(job, JobState::kPollingTransfer);

  const auto next_poll = [&] { return Next::At(util::SteadyClock::now() + delivery.poll_interval); };

  transfer::TransferState state;
  try {
    // polls a copy so a call abandoned at the deadline never touches the job
    auto [polled_state, polled] = CallBefore(job.deadline, [poller = lane.poller, handle, credential]() mutable {
      auto next = poller->Poll(handle, credential);
      return std::make_pair(next, handle);
    });
    state  = polled_state;
    handle = std::move(polled);
  } catch (const util::TransportError& e) {
    if (job.stop.stop_requested()) {
      return Next::Continue();
    }
    if (++job.poll_errors > options_.poll_error_limit) {
      return FailAttempt(job, FailureReason::kTransport, std::string("transfer status unavailable: ") + e.what());
    }
    ACQUISITION_LOG_WARN("transfer status query failed",
                         {StringField("job_id", job.status.job_id), IntField("errors", job.poll_errors), StringField("error", e.what())});
    return next_poll();
  }

  if (job.stop.stop_requested()) {
    return Next::Continue();
  }

  job.poll_errors = 0;
  {
    std::lock_guard lock(job.mutex);
    ++job.status.poll_count;
    job.status.updated_at = util::Now();
  }

  switch (state) {
    case transfer::TransferState::kCompleted:
      if (!handle.local_path.empty()) {
        job.sink->SetRemoteLocation(handle.local_path);
      }
      return Complete(job);

    case transfer::TransferState::kNotFound:
      Finish(job, JobState::kFailed,
             model::JobError{FailureReason::kNotFound, "transfer of " + handle.remote_file_ref + " from " + handle.peer_ref + " is gone"});
      return Next::Done();

    case transfer::TransferState::kFailed:
      return FailAttempt(job, FailureReason::kRemoteFailed, "remote transfer failed: " + handle.remote_error);

    case transfer::TransferState::kInitiated:
    case transfer::TransferState::kQueued:
      if (delivery.max_queued_polls > 0 && handle.queued_polls >= delivery.max_queued_polls) {
        return FailAttempt(job, FailureReason::kTimeout, "transfer still queued after " + std::to_string(handle.queued_polls) + " polls");
      }
      return next_poll();

    case transfer::TransferState::kTransferring:
      return next_poll();
  }
  return next_poll();
}

JobOrchestrator::Next JobOrchestrator::Complete(Job& job) {
  job.sink->Commit();
  Finish(job, JobState::kCompleted, std::nullopt);
  return Next::Done();
}

// ------------------------------------------------------------------
// Failure handling
// ------------------------------------------------------------------

JobOrchestrator::Next JobOrchestrator::HandleAuthDenied(Job& job, const std::string& message) {
  if (job.reauthorized) {
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kAuth, "denied after re-authorization: " + message});
    return Next::Done();
  }

  job.reauthorized = true;
  credentials_->Invalidate(job.status.backend_id);

  job.resume_phase = job.phase == Phase::kAuthorize ? Phase::kFetch : job.phase;
  job.phase        = Phase::kAuthorize;

  ACQUISITION_LOG_WARN("authorization denied, re-authorizing",
                       {StringField("job_id", job.status.job_id), StringField("backend", job.status.backend_id), StringField("error", message)});
  return Next::Continue();
}

JobOrchestrator::Next JobOrchestrator::FailAttempt(Job& job, FailureReason reason, const std::string& message) {
  if (job.stop.stop_requested()) {
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kCancelled, "cancelled"});
    return Next::Done();
  }

  std::uint32_t attempt = 0;
  {
    std::lock_guard lock(job.mutex);
    attempt = job.status.attempt;
  }

  bool retryable = model::IsTransient(reason);
  if (reason == FailureReason::kTimeout) {
    retryable = job.timeout_retries_used < options_.timeout_retries;
  }

  if (!retryable || attempt >= options_.max_attempts) {
    Finish(job, JobState::kFailed, model::JobError{reason, message});
    return Next::Done();
  }

  if (reason == FailureReason::kTimeout) {
    ++job.timeout_retries_used;
  }

  try {
    job.sink->Reset();
  } catch (const std::exception& e) {
    Finish(job, JobState::kFailed, model::JobError{FailureReason::kTransport, std::string("output reset failed: ") + e.what()});
    return Next::Done();
  }

  ResetAttempt(job);

  const auto delay = Backoff(attempt);
  {
    std::lock_guard lock(job.mutex);
    job.status.attempt       = attempt + 1;
    job.status.last_error    = model::JobError{reason, message};
    job.status.bytes_written = 0;
    job.status.updated_at    = util::Now();
  }

  ACQUISITION_LOG_WARN("job attempt failed, retrying",
                       {StringField("job_id", job.status.job_id), StringField("backend", job.status.backend_id),
                        StringField("reason", model::ToString(reason)), IntField("attempt", attempt),
                        observability::DurationField("backoff", delay), StringField("error", message)});

  return Next::At(util::SteadyClock::now() + delay);
}

void JobOrchestrator::ResetAttempt(Job& job) {
  job.phase = Phase::kAuthorize;
  job.resume_phase.reset();
  job.reauthorized   = false;
  job.total_bytes    = 0;
  job.next_chunk     = 0;
  job.chunk_failures = 0;
  job.poll_errors    = 0;
  job.stream.reset();
  job.transfer.reset();
}

std::chrono::milliseconds JobOrchestrator::Backoff(std::uint32_t failed_attempt) const {
  const auto   exponent = failed_attempt > 0 ? failed_attempt - 1 : 0;
  const double scaled   = static_cast<double>(options_.backoff_initial.count()) * std::pow(options_.backoff_multiplier, exponent);
  const double capped   = std::min(scaled, static_cast<double>(options_.backoff_max.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

util::SteadyTimePoint JobOrchestrator::ClampToDeadline(const Job& job, util::SteadyTimePoint t) const {
  if (job.deadline && t > *job.deadline) {
    return *job.deadline;
  }
  return t;
}

// ------------------------------------------------------------------
// State
// ------------------------------------------------------------------

void JobOrchestrator::Transition(Job& job, JobState to) {
  std::lock_guard lock(job.mutex);

  const auto from = job.status.state;
  if (from == to) {
    return;
  }
  if (!model::CanTransition(from, to)) {
    throw util::InvalidState("illegal job transition " + std::string(model::ToString(from)) + " -> " + std::string(model::ToString(to)));
  }

  job.status.state      = to;
  job.status.updated_at = util::Now();

  ACQUISITION_LOG_INFO("job transition", {StringField("job_id", job.status.job_id), StringField("backend", job.status.backend_id),
                                          StringField("from", model::ToString(from)), StringField("to", model::ToString(to)),
                                          IntField("attempt", job.status.attempt)});
}

void JobOrchestrator::Finish(Job& job, JobState state, std::optional<model::JobError> error) {
  {
    std::lock_guard lock(job.mutex);
    if (model::IsTerminal(job.status.state)) {
      return;
    }
  }

  if (state == JobState::kFailed && job.sink) {
    job.sink->Abort();
  }

  model::JobStatus snapshot;
  {
    std::lock_guard lock(job.mutex);

    const auto now         = util::Now();
    job.status.state       = state;
    job.status.updated_at  = now;
    job.status.finished_at = now;
    if (error) {
      job.status.last_error = error;
    }
    if (job.sink) {
      job.status.bytes_written = state == JobState::kCompleted ? job.sink->BytesWritten() : 0;
    }
    snapshot = job.status;
  }

  {
    std::unique_lock lock(jobs_mutex_);
    auto             it = active_.find(DedupKey(snapshot.backend_id, snapshot.track_ref));
    if (it != active_.end() && it->second == snapshot.job_id) {
      active_.erase(it);
    }
  }

  Archive(snapshot);
  Retain(snapshot.job_id);

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordJobOutcome(snapshot.backend_id, error ? model::ToString(error->reason) : std::string_view("completed"));
  metrics.ObserveJobDurationMs(snapshot.backend_id, ElapsedMs(job.submitted_steady));
  PublishActiveJobs(snapshot.backend_id);

  if (state == JobState::kCompleted) {
    ACQUISITION_LOG_INFO("job completed", {StringField("job_id", snapshot.job_id), StringField("backend", snapshot.backend_id),
                                           IntField("attempt", snapshot.attempt), IntField("bytes", static_cast<std::int64_t>(snapshot.bytes_written))});
  } else if (error && error->reason == FailureReason::kCancelled) {
    ACQUISITION_LOG_INFO("job cancelled", {StringField("job_id", snapshot.job_id), StringField("backend", snapshot.backend_id),
                                           StringField("error", error->message)});
  } else {
    ACQUISITION_LOG_ERROR("job failed", {StringField("job_id", snapshot.job_id), StringField("backend", snapshot.backend_id),
                                         StringField("reason", error ? model::ToString(error->reason) : "unknown"),
                                         IntField("attempt", snapshot.attempt), StringField("error", error ? error->message : "")});
  }

  {
    std::lock_guard lock(terminal_mutex_);
  }
  terminal_cv_.notify_all();
}

void JobOrchestrator::Archive(const model::JobStatus& status) {
  if (!repository_) {
    return;
  }

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->UpsertJob(*tx, ToRecord(status));
    if (!result) {
      tx->Rollback();
      ACQUISITION_LOG_ERROR("failed to archive job", {StringField("job_id", status.job_id), StringField("error", result.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    ACQUISITION_LOG_ERROR("failed to archive job", {StringField("job_id", status.job_id), StringField("error", e.what())});
  }
}

void JobOrchestrator::Retain(const std::string& job_id) {
  std::unique_lock lock(jobs_mutex_);
  retained_.push_back(job_id);
  while (retained_.size() > options_.max_retained_jobs) {
    jobs_.erase(retained_.front());
    retained_.pop_front();
  }
}

void JobOrchestrator::PublishActiveJobs(const std::string& backend_id) const {
  std::int64_t count = 0;
  {
    std::shared_lock lock(jobs_mutex_);
    for (const auto& [key, job_id] : active_) {
      if (key.compare(0, backend_id.size() + 1, backend_id + '\n') == 0) {
        ++count;
      }
    }
  }
  observability::Metrics::Instance().SetActiveJobs(backend_id, count);
}

} // namespace acquisition::orchestrator
