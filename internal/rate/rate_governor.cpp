#include "rate_governor.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace acquisition::rate {

RateGovernor::Lane& RateGovernor::LaneFor(const std::string& backend_id) {
  std::lock_guard lock(lanes_mutex_);
  auto&           lane = lanes_[backend_id];
  if (!lane) {
    lane                    = std::make_unique<Lane>();
    lane->budget.backend_id = backend_id;
  }
  return *lane;
}

const RateGovernor::Lane* RateGovernor::FindLane(const std::string& backend_id) const {
  std::lock_guard lock(lanes_mutex_);
  auto            it = lanes_.find(backend_id);
  return it == lanes_.end() ? nullptr : it->second.get();
}

void RateGovernor::Configure(const std::string& backend_id, std::chrono::milliseconds min_interval, std::uint32_t burst_allowance) {
  auto& lane = LaneFor(backend_id);
  {
    std::lock_guard lock(lane.mutex);
    if (lane.configured && lane.budget.min_interval == min_interval && lane.budget.burst_allowance == burst_allowance) {
      return;
    }
    lane.budget.min_interval    = std::max(min_interval, std::chrono::milliseconds::zero());
    lane.budget.burst_allowance = burst_allowance;
    lane.budget.burst_remaining = burst_allowance;
    lane.configured             = true;
    ++lane.version;
  }
  lane.cv.notify_all();
}

util::SteadyTimePoint RateGovernor::Admit(const std::string& backend_id, std::stop_token stop, std::optional<util::SteadyTimePoint> deadline) {
  auto& lane = LaneFor(backend_id);

  std::unique_lock lock(lane.mutex);
  const auto       ticket = lane.next_ticket++;
  lane.tickets.push_back(ticket);
  ++lane.budget.waiters;

  auto leave = [&] {
    lane.tickets.erase(std::find(lane.tickets.begin(), lane.tickets.end(), ticket));
    --lane.budget.waiters;
    ++lane.version;
    lane.cv.notify_all();
  };

  while (true) {
    const auto now = util::SteadyClock::now();

    if (stop.stop_requested()) {
      leave();
      throw util::AdmissionCancelled("admission to " + backend_id + " cancelled");
    }
    if (deadline && now >= *deadline) {
      leave();
      throw util::AdmissionCancelled("admission to " + backend_id + " exceeded its deadline");
    }

    std::optional<util::SteadyTimePoint> wake_at;
    if (lane.tickets.front() == ticket) {
      auto& budget = lane.budget;
      if (budget.burst_remaining > 0) {
        --budget.burst_remaining;
      } else if (budget.last_dispatch_at && now < *budget.last_dispatch_at + budget.min_interval) {
        wake_at = *budget.last_dispatch_at + budget.min_interval;
      }

      if (!wake_at) {
        budget.last_dispatch_at = budget.last_dispatch_at ? std::max(*budget.last_dispatch_at, now) : now;
        lane.tickets.pop_front();
        --budget.waiters;
        ++lane.version;
        lane.cv.notify_all();
        return *budget.last_dispatch_at;
      }
    }

    if (deadline && (!wake_at || *deadline < *wake_at)) {
      wake_at = deadline;
    }

    const auto seen    = lane.version;
    auto       changed = [&] { return lane.version != seen; };
    if (wake_at) {
      lane.cv.wait_until(lock, stop, *wake_at, changed);
    } else {
      lane.cv.wait(lock, stop, changed);
    }
  }
}

RateBudget RateGovernor::Snapshot(const std::string& backend_id) const {
  const auto* lane = FindLane(backend_id);
  if (!lane) {
    RateBudget budget;
    budget.backend_id = backend_id;
    return budget;
  }
  std::lock_guard lock(lane->mutex);
  return lane->budget;
}

} // namespace acquisition::rate
