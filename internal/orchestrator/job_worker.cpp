#include "job_worker.hpp"

#include "internal/observability/logging.hpp"
#include "job_orchestrator.hpp"

namespace acquisition::orchestrator {

JobWorker::JobWorker(std::string backend_id, std::shared_ptr<JobScheduler> scheduler, JobOrchestrator* orchestrator)
    : backend_id_(std::move(backend_id)), scheduler_(std::move(scheduler)), orchestrator_(orchestrator) {
}

JobWorker::~JobWorker() {
  Stop();
}

void JobWorker::Start() {
  running_ = true;
  thread_  = std::thread(&JobWorker::Run, this);
}

void JobWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void JobWorker::Run() {
  while (running_) {
    auto job_id = scheduler_->Dequeue();
    if (!job_id) break;

    try {
      orchestrator_->RunStep(*job_id);
    } catch (const std::exception& e) {
      ACQUISITION_LOG_ERROR("job step failed", {observability::StringField("backend", backend_id_),
                                                observability::StringField("job_id", *job_id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace acquisition::orchestrator
