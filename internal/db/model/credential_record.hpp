#pragma once

#include <cstdint>
#include <string>

namespace acquisition::db::model {

/*
  Persistent credential row, one per backend.

  Empty refresh_token means none; expires_at_ms = 0 means no expiry.
*/
struct CredentialRecord {
  std::string backend_id;
  std::string access_token;
  std::string refresh_token;

  uint64_t expires_at_ms = 0;

  std::string scope;

  uint64_t updated_at_ms = 0;
};

} // namespace acquisition::db::model
