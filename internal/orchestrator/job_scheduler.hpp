#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "internal/util/time.hpp"

namespace acquisition::orchestrator {

/*
  Thread-safe delayed queue for one backend lane.

  Entries become visible to Dequeue() once their ready time has passed;
  equal ready times keep submission order.
*/
class JobScheduler {
 public:
  void Enqueue(const std::string& job_id, util::SteadyTimePoint ready_at = util::SteadyClock::now());

  // Makes a delayed entry ready now (cancellation).
  void Expedite(const std::string& job_id);

  // blocking wait; nullopt after Shutdown()
  std::optional<std::string> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  struct Entry {
    util::SteadyTimePoint ready_at;
    std::uint64_t         seq = 0;
    std::string           job_id;

    bool operator<(const Entry& other) const {
      if (ready_at != other.ready_at) return ready_at < other.ready_at;
      return seq < other.seq;
    }
  };

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::set<Entry>         queue_;
  std::uint64_t           next_seq_ = 0;
  bool                    shutdown_ = false;
};

} // namespace acquisition::orchestrator
