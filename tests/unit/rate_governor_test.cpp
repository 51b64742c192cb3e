#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "internal/rate/rate_governor.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using acquisition::rate::RateGovernor;
using acquisition::util::AdmissionCancelled;
using acquisition::util::SteadyClock;
using acquisition::util::SteadyTimePoint;

void TestAdmissionsAreSpacedByMinInterval() {
  RateGovernor governor;
  governor.Configure("spaced", 50ms, 0);

  std::vector<SteadyTimePoint> dispatched;
  for (int i = 0; i < 3; ++i) {
    dispatched.push_back(governor.Admit("spaced"));
  }

  assert(dispatched[1] - dispatched[0] >= 50ms);
  assert(dispatched[2] - dispatched[1] >= 50ms);

  auto budget = governor.Snapshot("spaced");
  assert(budget.last_dispatch_at.has_value());
  assert(*budget.last_dispatch_at == dispatched[2]);
  assert(budget.waiters == 0);
}

void TestBurstSkipsInterval() {
  RateGovernor governor;
  governor.Configure("bursty", 200ms, 2);

  const auto started = SteadyClock::now();
  governor.Admit("bursty");
  governor.Admit("bursty");
  assert(SteadyClock::now() - started < 150ms);
  assert(governor.Snapshot("bursty").burst_remaining == 0);

  // burst spent: the next one waits a full interval after the last dispatch
  const auto last  = *governor.Snapshot("bursty").last_dispatch_at;
  const auto third = governor.Admit("bursty");
  assert(third - last >= 200ms);
}

void TestReconfigureRestoresBurstButIdenticalConfigureDoesNot() {
  RateGovernor governor;
  governor.Configure("cfg", 10ms, 1);
  governor.Admit("cfg");
  assert(governor.Snapshot("cfg").burst_remaining == 0);

  governor.Configure("cfg", 10ms, 1);
  assert(governor.Snapshot("cfg").burst_remaining == 0);

  governor.Configure("cfg", 20ms, 1);
  assert(governor.Snapshot("cfg").burst_remaining == 1);
  assert(governor.Snapshot("cfg").min_interval == 20ms);
}

void TestBackendsAreIndependent() {
  RateGovernor governor;
  governor.Configure("slow", 10s, 0);
  governor.Configure("fast", 0ms, 0);

  governor.Admit("slow");

  std::atomic<bool> slow_admitted{false};
  std::stop_source  stop;
  std::thread       waiter([&] {
    try {
      governor.Admit("slow", stop.get_token());
      slow_admitted = true;
    } catch (const AdmissionCancelled&) {
      // expected
    }
  });

  // the slow lane is blocked for ten seconds; the fast one is not
  const auto started = SteadyClock::now();
  for (int i = 0; i < 5; ++i) {
    governor.Admit("fast");
  }
  assert(SteadyClock::now() - started < 1s);

  stop.request_stop();
  waiter.join();
  assert(!slow_admitted);
}

void TestCancelledWaiterLeavesQueueWithoutConsumingSlot() {
  RateGovernor governor;
  governor.Configure("cancel", 300ms, 0);
  const auto first = governor.Admit("cancel");

  std::stop_source stop;
  std::atomic<bool> cancelled{false};
  std::thread      waiter([&] {
    try {
      governor.Admit("cancel", stop.get_token());
    } catch (const AdmissionCancelled&) {
      cancelled = true;
    }
  });

  std::this_thread::sleep_for(50ms);
  assert(governor.Snapshot("cancel").waiters == 1);
  stop.request_stop();
  waiter.join();

  assert(cancelled);
  auto budget = governor.Snapshot("cancel");
  assert(budget.waiters == 0);
  assert(*budget.last_dispatch_at == first);

  // the next admission is still spaced from the last real dispatch only
  const auto next = governor.Admit("cancel");
  assert(next - first >= 300ms);
  assert(next - first < 2s);
}

void TestDeadlineExpiresAdmission() {
  RateGovernor governor;
  governor.Configure("deadline", 10s, 0);
  governor.Admit("deadline");

  bool threw = false;
  try {
    governor.Admit("deadline", {}, SteadyClock::now() + 50ms);
  } catch (const AdmissionCancelled&) {
    threw = true;
  }
  assert(threw);
  assert(governor.Snapshot("deadline").waiters == 0);
}

void TestWaitersAreServedInArrivalOrder() {
  RateGovernor governor;
  governor.Configure("fifo", 200ms, 0);
  governor.Admit("fifo");

  std::mutex       mutex;
  std::vector<int> order;

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&, i] {
      governor.Admit("fifo");
      std::lock_guard lock(mutex);
      order.push_back(i);
    });
    // make arrival order deterministic
    while (governor.Snapshot("fifo").waiters < static_cast<std::size_t>(i + 1)) {
      std::this_thread::sleep_for(1ms);
    }
  }
  for (auto& t : threads) t.join();

  assert((order == std::vector<int>{0, 1, 2, 3}));
}

} // namespace

int main() {
  TestAdmissionsAreSpacedByMinInterval();
  TestBurstSkipsInterval();
  TestReconfigureRestoresBurstButIdenticalConfigureDoesNot();
  TestBackendsAreIndependent();
  TestCancelledWaiterLeavesQueueWithoutConsumingSlot();
  TestDeadlineExpiresAdmission();
  TestWaitersAreServedInArrivalOrder();

  std::cout << "acquisition_unit_rate_governor: pass\n";
  return 0;
}
