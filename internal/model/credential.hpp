#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace acquisition::model {

struct Credential {
  std::string backend_id;
  std::string access_token;

  std::optional<std::string>     refresh_token;
  std::optional<util::TimePoint> expires_at;

  std::string scope;
};

// Token-free view of a backend's credential state.
struct CredentialSummary {
  std::string backend_id;

  bool present           = false;
  bool usable            = false;
  bool has_refresh_token = false;

  std::optional<util::TimePoint> expires_at;
  std::string                    scope;

  std::uint64_t refresh_count = 0;
};

} // namespace acquisition::model
