#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>

#include "internal/rate/rate_budget.hpp"

namespace acquisition::rate {

/*
  RateGovernor

  Per-backend admission control. A call to Admit() blocks until the
  backend's budget allows one more dispatch, records the dispatch and
  returns its time. Backends are independent: a waiter on one backend
  never delays another.

  Waiters on the same backend are served in arrival order. A waiter that
  is cancelled (stop token or deadline) leaves the queue without
  consuming a slot.
*/
class RateGovernor {
 public:
  // Idempotent; changed values take effect for the next admission and
  // restore the burst allowance.
  void Configure(const std::string& backend_id, std::chrono::milliseconds min_interval, std::uint32_t burst_allowance);

  // Throws util::AdmissionCancelled on stop request or deadline expiry.
  util::SteadyTimePoint Admit(const std::string& backend_id, std::stop_token stop = {},
                              std::optional<util::SteadyTimePoint> deadline = std::nullopt);

  RateBudget Snapshot(const std::string& backend_id) const;

 private:
  struct Lane {
    mutable std::mutex          mutex;
    std::condition_variable_any cv;

    RateBudget budget;
    bool       configured = false;

    std::deque<std::uint64_t> tickets;
    std::uint64_t             next_ticket = 0;

    // bumped on every change a waiter may care about
    std::uint64_t version = 0;
  };

  Lane&       LaneFor(const std::string& backend_id);
  const Lane* FindLane(const std::string& backend_id) const;

  mutable std::mutex                                     lanes_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Lane>> lanes_;
};

} // namespace acquisition::rate
