#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"
#include "internal/model/backend.hpp"
#include "internal/model/credential.hpp"
#include "internal/transport/transport_adapter.hpp"

namespace acquisition::credential {

/*
  CredentialStore

  Owns the live credential of every registered backend. Callers never
  hold a credential beyond one operation; they ask EnsureValid() again.

  Concurrent refreshes of one backend coalesce into a single call to the
  adapter; every waiter observes its outcome. Credentials are persisted
  through the repository and loaded lazily on first use.
*/
class CredentialStore {
 public:
  explicit CredentialStore(std::shared_ptr<db::Repository> repository);

  void RegisterBackend(const std::string& backend_id, model::CredentialPolicy policy, std::shared_ptr<transport::TransportAdapter> adapter);

  bool HasBackend(const std::string& backend_id) const;

  /*
    Returns a credential usable for at least the refresh margin.

    Throws:
      util::NotFound        unknown backend
      util::AuthExpired     nothing usable and no way to obtain it
      util::TransportError  refresh could not reach the backend
  */
  model::Credential EnsureValid(const std::string& backend_id);

  // Replaces the stored credential. Persist failure is an error.
  void Store(const std::string& backend_id, model::Credential credential);

  // Marks the access token unusable, e.g. after the backend rejected it.
  // The refresh token, if any, is kept.
  void Invalidate(const std::string& backend_id);

  model::CredentialSummary Describe(const std::string& backend_id);

 private:
  using Outcome = std::shared_future<model::Credential>;

  struct Entry {
    std::mutex mutex;

    model::CredentialPolicy                     policy;
    std::shared_ptr<transport::TransportAdapter> adapter;

    bool                             loaded = false;
    std::optional<model::Credential> current;
    bool                             invalidated = false;

    std::optional<Outcome> inflight;

    std::uint64_t refresh_count = 0;
  };

  Entry& Lookup(const std::string& backend_id) const;

  // requires entry.mutex held
  void LoadLocked(const std::string& backend_id, Entry& entry);
  bool IsUsableLocked(const Entry& entry) const;

  model::Credential Obtain(const std::string& backend_id, Entry& entry, std::optional<model::Credential> previous);
  void              Persist(const model::Credential& credential);

  std::shared_ptr<db::Repository> repository_;

  mutable std::shared_mutex                               entries_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace acquisition::credential
