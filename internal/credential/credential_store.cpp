#include "credential_store.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace acquisition::credential {

namespace {

db::model::CredentialRecord ToRecord(const model::Credential& credential) {
  db::model::CredentialRecord record;
  record.backend_id    = credential.backend_id;
  record.access_token  = credential.access_token;
  record.refresh_token = credential.refresh_token.value_or("");
  record.expires_at_ms = credential.expires_at ? util::ToUnixMillis(*credential.expires_at) : 0;
  record.scope         = credential.scope;
  record.updated_at_ms = util::ToUnixMillis(util::Now());
  return record;
}

model::Credential FromRecord(const db::model::CredentialRecord& record) {
  model::Credential credential;
  credential.backend_id   = record.backend_id;
  credential.access_token = record.access_token;
  if (!record.refresh_token.empty()) {
    credential.refresh_token = record.refresh_token;
  }
  if (record.expires_at_ms != 0) {
    credential.expires_at = util::FromUnixMillis(record.expires_at_ms);
  }
  credential.scope = record.scope;
  return credential;
}

} // namespace

CredentialStore::CredentialStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void CredentialStore::RegisterBackend(const std::string& backend_id, model::CredentialPolicy policy,
                                      std::shared_ptr<transport::TransportAdapter> adapter) {
  if (!adapter) {
    throw std::invalid_argument("backend " + backend_id + " registered without a transport adapter");
  }

  std::unique_lock lock(entries_mutex_);
  if (entries_.contains(backend_id)) {
    throw util::AlreadyExists("backend already registered: " + backend_id);
  }
  auto entry     = std::make_unique<Entry>();
  entry->policy  = policy;
  entry->adapter = std::move(adapter);
  entries_.emplace(backend_id, std::move(entry));
}

bool CredentialStore::HasBackend(const std::string& backend_id) const {
  std::shared_lock lock(entries_mutex_);
  return entries_.contains(backend_id);
}

CredentialStore::Entry& CredentialStore::Lookup(const std::string& backend_id) const {
  std::shared_lock lock(entries_mutex_);
  auto             it = entries_.find(backend_id);
  if (it == entries_.end()) {
    throw util::NotFound("unknown backend: " + backend_id);
  }
  return *it->second;
}

void CredentialStore::LoadLocked(const std::string& backend_id, Entry& entry) {
  if (entry.loaded) {
    return;
  }

  if (repository_) {
    auto tx     = repository_->Begin();
    auto record = repository_->GetCredential(*tx, backend_id);
    tx->Commit();
    if (record) {
      entry.current = FromRecord(*record);
    }
  }
  entry.loaded = true;
}

bool CredentialStore::IsUsableLocked(const Entry& entry) const {
  if (!entry.current || entry.invalidated || entry.current->access_token.empty()) {
    return false;
  }
  if (!entry.current->expires_at) {
    return true;
  }
  return util::Now() + entry.policy.refresh_margin < *entry.current->expires_at;
}

model::Credential CredentialStore::EnsureValid(const std::string& backend_id) {
  auto& entry = Lookup(backend_id);

  std::promise<model::Credential>  promise;
  Outcome                          outcome;
  std::optional<model::Credential> previous;
  bool                             leader = false;
  {
    std::lock_guard lock(entry.mutex);
    LoadLocked(backend_id, entry);

    if (IsUsableLocked(entry)) {
      return *entry.current;
    }

    if (entry.inflight) {
      outcome = *entry.inflight;
    } else {
      outcome        = promise.get_future().share();
      entry.inflight = outcome;
      previous       = entry.current;
      leader         = true;
    }
  }

  if (!leader) {
    return outcome.get();
  }

  try {
    auto fresh = Obtain(backend_id, entry, std::move(previous));
    {
      std::lock_guard lock(entry.mutex);
      entry.current     = fresh;
      entry.invalidated = false;
      ++entry.refresh_count;
      entry.inflight.reset();
    }
    promise.set_value(fresh);
    return fresh;
  } catch (...) {
    {
      std::lock_guard lock(entry.mutex);
      entry.inflight.reset();
    }
    promise.set_exception(std::current_exception());
    throw;
  }
}

model::Credential CredentialStore::Obtain(const std::string& backend_id, Entry& entry, std::optional<model::Credential> previous) {
  auto&       adapter = *entry.adapter;
  const auto& policy  = entry.policy;

  std::optional<model::Credential> fresh;

  if (previous && previous->refresh_token && !previous->refresh_token->empty()) {
    ACQUISITION_LOG_WARN("refreshing credential", {observability::StringField("backend", backend_id)});
    try {
      fresh = adapter.Refresh(*previous);
    } catch (const util::AuthDenied& e) {
      if (!policy.allow_reauthenticate) {
        throw util::AuthExpired("refresh denied for backend " + backend_id + ": " + e.what());
      }
      ACQUISITION_LOG_WARN("refresh denied, re-authenticating",
                           {observability::StringField("backend", backend_id), observability::StringField("error", e.what())});
    }
  } else if (!policy.allow_reauthenticate) {
    throw util::AuthExpired("no usable credential for backend " + backend_id);
  }

  if (!fresh) {
    ACQUISITION_LOG_WARN("authenticating", {observability::StringField("backend", backend_id)});
    try {
      fresh = adapter.Authenticate(previous ? previous->scope : std::string{});
    } catch (const util::AuthDenied& e) {
      throw util::AuthExpired("authentication denied for backend " + backend_id + ": " + e.what());
    }
  }

  fresh->backend_id = backend_id;
  if (fresh->access_token.empty()) {
    throw util::AuthExpired("backend " + backend_id + " returned an empty access token");
  }
  if (previous) {
    if (!fresh->refresh_token) {
      fresh->refresh_token = previous->refresh_token;
    }
    if (fresh->scope.empty()) {
      fresh->scope = previous->scope;
    }
  }

  // the fresh token is usable even if it could not be saved
  try {
    Persist(*fresh);
  } catch (const std::exception& e) {
    ACQUISITION_LOG_ERROR("failed to persist refreshed credential",
                          {observability::StringField("backend", backend_id), observability::StringField("error", e.what())});
  }

  return *fresh;
}

void CredentialStore::Persist(const model::Credential& credential) {
  if (!repository_) {
    return;
  }

  auto tx     = repository_->Begin();
  auto result = repository_->UpsertCredential(*tx, ToRecord(credential));
  if (!result) {
    tx->Rollback();
    throw std::runtime_error("credential persist failed for " + credential.backend_id + ": " + result.message);
  }
  tx->Commit();
}

void CredentialStore::Store(const std::string& backend_id, model::Credential credential) {
  auto& entry = Lookup(backend_id);
  if (credential.access_token.empty()) {
    throw std::invalid_argument("access token must not be empty");
  }
  credential.backend_id = backend_id;

  std::lock_guard lock(entry.mutex);
  Persist(credential);

  entry.current     = std::move(credential);
  entry.invalidated = false;
  entry.loaded      = true;

  ACQUISITION_LOG_INFO("credential stored", {observability::StringField("backend", backend_id)});
}

void CredentialStore::Invalidate(const std::string& backend_id) {
  auto& entry = Lookup(backend_id);

  std::lock_guard lock(entry.mutex);
  LoadLocked(backend_id, entry);
  entry.invalidated = true;

  ACQUISITION_LOG_WARN("credential invalidated", {observability::StringField("backend", backend_id)});
}

model::CredentialSummary CredentialStore::Describe(const std::string& backend_id) {
  auto& entry = Lookup(backend_id);

  std::lock_guard lock(entry.mutex);
  LoadLocked(backend_id, entry);

  model::CredentialSummary summary;
  summary.backend_id    = backend_id;
  summary.refresh_count = entry.refresh_count;
  if (entry.current) {
    summary.present           = true;
    summary.usable            = IsUsableLocked(entry);
    summary.has_refresh_token = entry.current->refresh_token && !entry.current->refresh_token->empty();
    summary.expires_at        = entry.current->expires_at;
    summary.scope             = entry.current->scope;
  }
  return summary;
}

} // namespace acquisition::credential
