#include "job_scheduler.hpp"

namespace acquisition::orchestrator {

void JobScheduler::Enqueue(const std::string& job_id, util::SteadyTimePoint ready_at) {
  {
    std::lock_guard lock(mutex_);
    queue_.insert(Entry{ready_at, next_seq_++, job_id});
  }
  cv_.notify_all();
}

void JobScheduler::Expedite(const std::string& job_id) {
  {
    std::lock_guard lock(mutex_);
    const auto      now = util::SteadyClock::now();
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
      if (it->job_id != job_id) continue;
      if (it->ready_at <= now) return;

      Entry entry    = *it;
      entry.ready_at = now;
      queue_.erase(it);
      queue_.insert(std::move(entry));
      break;
    }
  }
  cv_.notify_all();
}

std::optional<std::string> JobScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  while (true) {
    if (shutdown_) return std::nullopt;

    if (queue_.empty()) {
      cv_.wait(lock);
      continue;
    }

    const auto ready_at = queue_.begin()->ready_at;
    if (ready_at <= util::SteadyClock::now()) {
      auto node = queue_.extract(queue_.begin());
      return std::move(node.value().job_id);
    }

    cv_.wait_until(lock, ready_at);
  }
}

void JobScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t JobScheduler::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace acquisition::orchestrator
