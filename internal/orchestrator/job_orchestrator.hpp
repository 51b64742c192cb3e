#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/credential/credential_store.hpp"
#include "internal/crypto/chunk_decryptor.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/backend.hpp"
#include "internal/model/job.hpp"
#include "internal/orchestrator/job_scheduler.hpp"
#include "internal/orchestrator/job_worker.hpp"
#include "internal/orchestrator/orchestrator_options.hpp"
#include "internal/rate/rate_governor.hpp"
#include "internal/storage/output_sink.hpp"
#include "internal/transfer/transfer_poller.hpp"
#include "internal/transport/transport_adapter.hpp"

namespace acquisition::orchestrator {

struct SubmitResult {
  std::string job_id;
  bool        created = false;
};

/*
  JobOrchestrator

  Owns every acquisition job from submission to its terminal state:

    Queued → Authorizing → Admitted → Fetching → {Decrypting | PollingTransfer} → Completed
    Failed from any non-terminal state

  Each backend gets its own lane (delayed queue + workers). A job runs one
  step at a time and is re-queued with a ready time between steps, so
  poll intervals, backoff and chunk boundaries never hold a worker.

  At most one non-terminal job exists per (backend, track); duplicate
  submissions return the existing job.
*/
class JobOrchestrator {
 public:
  JobOrchestrator(OrchestratorOptions options, std::shared_ptr<credential::CredentialStore> credentials,
                  std::shared_ptr<rate::RateGovernor> governor, std::shared_ptr<db::Repository> repository);
  ~JobOrchestrator();

  JobOrchestrator(const JobOrchestrator&)            = delete;
  JobOrchestrator& operator=(const JobOrchestrator&) = delete;

  // Registers the backend with the credential store and rate governor too.
  void RegisterBackend(const model::BackendProfile& profile, std::shared_ptr<transport::TransportAdapter> adapter);

  bool HasBackend(const std::string& backend_id) const;

  // Stop is final: Start() and Submit() afterwards throw util::InvalidState.
  void Start();
  void Stop();

  SubmitResult Submit(const std::string& backend_id, const std::string& track_ref, std::shared_ptr<storage::OutputSink> sink);

  // Throws util::NotFound for ids neither in memory nor archived.
  model::JobStatus Status(const std::string& job_id) const;

  // Cooperative; the job fails with Cancelled at its next suspension point.
  model::JobStatus Cancel(const std::string& job_id);

  // Jobs held in memory; empty backend_id lists all.
  std::vector<model::JobStatus> List(const std::string& backend_id = {}) const;

  std::optional<model::JobStatus> WaitForTerminal(const std::string& job_id, std::chrono::milliseconds timeout) const;

  // worker entry point
  void RunStep(const std::string& job_id);

 private:
  enum class Phase {
    kAuthorize,
    kFetch,
    kChunk,
    kPoll,
  };

  struct Job {
    mutable std::mutex mutex;
    model::JobStatus   status;

    std::shared_ptr<storage::OutputSink> sink;
    std::stop_source                     stop;

    std::optional<util::SteadyTimePoint> deadline;

    // working state, touched only by the worker running the job
    Phase                 phase = Phase::kAuthorize;
    std::optional<Phase>  resume_phase;
    bool                  reauthorized         = false;
    std::uint32_t         timeout_retries_used = 0;
    util::SteadyTimePoint submitted_steady{};

    std::optional<crypto::EncryptedStreamContext> stream;
    std::uint64_t                                 total_bytes    = 0;
    std::uint64_t                                 next_chunk     = 0;
    std::uint32_t                                 chunk_failures = 0;

    std::optional<transfer::PeerTransferHandle> transfer;
    std::uint32_t                               poll_errors = 0;
  };

  struct Lane {
    model::BackendProfile                        profile;
    std::shared_ptr<transport::TransportAdapter> adapter;
    std::shared_ptr<JobScheduler>                scheduler;
    std::shared_ptr<transfer::TransferPoller>    poller;
    std::vector<std::unique_ptr<JobWorker>>      workers;
  };

  // Result of one step: re-queue at a time, or done.
  struct Next {
    std::optional<util::SteadyTimePoint> ready_at;
    bool                                 inline_continue = false;

    static Next Now() {
      return Next{util::SteadyClock::now(), false};
    }
    static Next At(util::SteadyTimePoint t) {
      return Next{t, false};
    }
    static Next Continue() {
      return Next{std::nullopt, true};
    }
    static Next Done() {
      return Next{};
    }
  };

  std::shared_ptr<Job> FindJob(const std::string& job_id) const;
  Lane*                FindLane(const std::string& backend_id) const;

  Next Execute(Job& job, Lane& lane);
  Next Authorize(Job& job, Lane& lane);
  Next Fetch(Job& job, Lane& lane);
  Next FetchChunk(Job& job, Lane& lane);
  Next PollTransfer(Job& job, Lane& lane);

  model::Credential Admit(Job& job, Lane& lane);
  Next              Complete(Job& job);

  // Retries if the reason and budget allow, otherwise fails the job.
  Next FailAttempt(Job& job, model::FailureReason reason, const std::string& message);
  Next HandleAuthDenied(Job& job, const std::string& message);
  void Finish(Job& job, model::JobState state, std::optional<model::JobError> error);

  void Transition(Job& job, model::JobState to);
  void ResetAttempt(Job& job);
  bool Interrupted(Job& job);

  std::chrono::milliseconds Backoff(std::uint32_t failed_attempt) const;
  util::SteadyTimePoint     ClampToDeadline(const Job& job, util::SteadyTimePoint t) const;

  void Archive(const model::JobStatus& status);
  void Retain(const std::string& job_id);
  void PublishActiveJobs(const std::string& backend_id) const;

  static std::string_view PhaseName(Phase phase);
  static std::string      DedupKey(const std::string& backend_id, const std::string& track_ref);

  OrchestratorOptions                          options_;
  std::shared_ptr<credential::CredentialStore> credentials_;
  std::shared_ptr<rate::RateGovernor>          governor_;
  std::shared_ptr<db::Repository>              repository_;

  mutable std::shared_mutex                              lanes_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Lane>> lanes_;
  bool                                                   running_ = false;

  // set once by Stop(); read without lanes_mutex_ by Submit()
  std::atomic<bool> stopped_{false};

  mutable std::shared_mutex                             jobs_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Job>> jobs_;
  std::unordered_map<std::string, std::string>          active_;
  std::deque<std::string>                               retained_;

  mutable std::mutex              terminal_mutex_;
  mutable std::condition_variable terminal_cv_;
};

} // namespace acquisition::orchestrator
