#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "job_scheduler.hpp"

namespace acquisition::orchestrator {

class JobOrchestrator;

/*
  Lane worker. Pulls ready jobs off one backend's scheduler and runs
  a single step of each.
*/
class JobWorker {
 public:
  JobWorker(std::string backend_id, std::shared_ptr<JobScheduler> scheduler, JobOrchestrator* orchestrator);
  ~JobWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::string                   backend_id_;
  std::shared_ptr<JobScheduler> scheduler_;
  JobOrchestrator*              orchestrator_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace acquisition::orchestrator
