#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace acquisition::orchestrator {

struct OrchestratorOptions {
  std::uint32_t workers_per_backend = 1;

  // total attempts per job, the first one included
  std::uint32_t             max_attempts = 3;
  std::chrono::milliseconds backoff_initial{1000};
  double                    backoff_multiplier = 2.0;
  std::chrono::milliseconds backoff_max{30'000};

  // ceiling across all attempts; not retried once spent
  std::optional<std::chrono::milliseconds> job_timeout;

  // retries granted to attempts that hit the queued-poll cap
  std::uint32_t timeout_retries = 1;

  // consecutive failed status queries tolerated within one attempt
  std::uint32_t poll_error_limit = 3;

  std::size_t max_retained_jobs = 1024;
};

} // namespace acquisition::orchestrator
