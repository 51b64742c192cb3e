#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace acquisition::rate {

/*
  Admission budget of one backend. Mutated only by the RateGovernor.
*/
struct RateBudget {
  std::string backend_id;

  std::chrono::milliseconds min_interval{0};

  // never regresses
  std::optional<util::SteadyTimePoint> last_dispatch_at;

  std::uint32_t burst_allowance = 0;
  std::uint32_t burst_remaining = 0;

  // admissions currently waiting, diagnostic
  std::size_t waiters = 0;
};

} // namespace acquisition::rate
