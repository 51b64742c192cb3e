#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/credential/credential_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_transport.hpp"

namespace {

using namespace std::chrono_literals;
using acquisition::credential::CredentialStore;
using acquisition::db::memory::MemoryRepository;
using acquisition::model::Credential;
using acquisition::model::CredentialPolicy;
using acquisition::testing::FakeTransport;
using acquisition::util::AuthDenied;
using acquisition::util::AuthExpired;

Credential Token(const std::string& access, std::optional<std::string> refresh = std::nullopt,
                 std::optional<acquisition::util::TimePoint> expires_at = std::nullopt) {
  Credential credential;
  credential.access_token  = access;
  credential.refresh_token = std::move(refresh);
  credential.expires_at    = expires_at;
  return credential;
}

template <typename Fn>
bool ThrowsAuthExpired(Fn&& fn) {
  try {
    fn();
  } catch (const AuthExpired&) {
    return true;
  }
  return false;
}

void TestStoredCredentialIsReturnedWithoutAdapterCalls() {
  auto            repository = std::make_shared<MemoryRepository>();
  auto            adapter    = std::make_shared<FakeTransport>("b");
  CredentialStore store(repository);
  store.RegisterBackend("b", CredentialPolicy{}, adapter);

  store.Store("b", Token("access-1", "refresh-1", acquisition::util::Now() + 1h));
  auto credential = store.EnsureValid("b");

  assert(credential.access_token == "access-1");
  assert(credential.backend_id == "b");
  assert(adapter->refresh_calls == 0);
  assert(adapter->authenticate_calls == 0);
}

void TestExpiringCredentialIsRefreshedAndPersisted() {
  auto            repository = std::make_shared<MemoryRepository>();
  auto            adapter    = std::make_shared<FakeTransport>("b");
  CredentialStore store(repository);

  CredentialPolicy policy;
  policy.refresh_margin = 60s;
  store.RegisterBackend("b", policy, adapter);

  adapter->on_refresh = [](const Credential& previous) {
    assert(previous.refresh_token == std::string("refresh-1"));
    // backend omits refresh token and scope: both carry over
    return Token("access-2", std::nullopt, acquisition::util::Now() + 1h);
  };

  auto stored  = Token("access-1", "refresh-1", acquisition::util::Now() + 30s);
  stored.scope = "library";
  store.Store("b", stored);

  auto fresh = store.EnsureValid("b");
  assert(fresh.access_token == "access-2");
  assert(fresh.refresh_token == std::string("refresh-1"));
  assert(fresh.scope == "library");
  assert(adapter->refresh_calls == 1);

  auto tx     = repository->Begin();
  auto record = repository->GetCredential(*tx, "b");
  tx->Commit();
  assert(record.has_value());
  assert(record->access_token == "access-2");
  assert(record->refresh_token == "refresh-1");

  auto summary = store.Describe("b");
  assert(summary.present && summary.usable && summary.has_refresh_token);
  assert(summary.refresh_count == 1);
}

void TestConcurrentRefreshesCoalesce() {
  auto            adapter = std::make_shared<FakeTransport>("b");
  CredentialStore store(std::make_shared<MemoryRepository>());
  store.RegisterBackend("b", CredentialPolicy{}, adapter);

  adapter->on_refresh = [](const Credential&) {
    std::this_thread::sleep_for(100ms);
    return Token("coalesced", std::nullopt, acquisition::util::Now() + 1h);
  };
  store.Store("b", Token("stale", "refresh", acquisition::util::Now() - 1s));

  std::vector<std::thread>  threads;
  std::atomic<int>          matches{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (store.EnsureValid("b").access_token == "coalesced") ++matches;
    });
  }
  for (auto& t : threads) t.join();

  assert(matches == 8);
  assert(adapter->refresh_calls == 1);
}

void TestRefreshFailureReachesEveryWaiterAndIsNotCached() {
  auto            adapter = std::make_shared<FakeTransport>("b");
  CredentialStore store(std::make_shared<MemoryRepository>());
  store.RegisterBackend("b", CredentialPolicy{}, adapter);

  std::atomic<int> calls{0};
  adapter->on_refresh = [&](const Credential&) -> Credential {
    if (calls++ == 0) {
      std::this_thread::sleep_for(100ms);
      throw acquisition::util::TransportError("backend unreachable");
    }
    return Token("recovered", std::nullopt, acquisition::util::Now() + 1h);
  };
  store.Store("b", Token("stale", "refresh", acquisition::util::Now() - 1s));

  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      try {
        (void)store.EnsureValid("b");
      } catch (const acquisition::util::TransportError&) {
        ++failures;
      }
    });
    if (i == 0) std::this_thread::sleep_for(20ms);
  }
  for (auto& t : threads) t.join();

  assert(failures == 4);
  assert(adapter->refresh_calls == 1);

  // next caller tries again
  assert(store.EnsureValid("b").access_token == "recovered");
  assert(adapter->refresh_calls == 2);
}

void TestDeniedRefreshWithoutReauthenticationIsAuthExpired() {
  auto            adapter = std::make_shared<FakeTransport>("b");
  CredentialStore store(std::make_shared<MemoryRepository>());
  store.RegisterBackend("b", CredentialPolicy{}, adapter);

  adapter->on_refresh      = [](const Credential&) -> Credential { throw AuthDenied("refresh token revoked"); };
  adapter->on_authenticate = [](const std::string&) { return Token("should-not-be-used"); };
  store.Store("b", Token("stale", "refresh", acquisition::util::Now() - 1s));

  assert(ThrowsAuthExpired([&] { (void)store.EnsureValid("b"); }));
  assert(adapter->authenticate_calls == 0);
}

void TestDeniedRefreshFallsBackToAuthenticate() {
  auto            adapter = std::make_shared<FakeTransport>("b");
  CredentialStore store(std::make_shared<MemoryRepository>());

  CredentialPolicy policy;
  policy.allow_reauthenticate = true;
  store.RegisterBackend("b", policy, adapter);

  std::string seen_scope;
  adapter->on_refresh      = [](const Credential&) -> Credential { throw AuthDenied("revoked"); };
  adapter->on_authenticate = [&](const std::string& scope) {
    seen_scope = scope;
    return Token("from-login", "new-refresh");
  };

  auto stored  = Token("stale", "refresh", acquisition::util::Now() - 1s);
  stored.scope = "streaming";
  store.Store("b", stored);

  auto fresh = store.EnsureValid("b");
  assert(fresh.access_token == "from-login");
  assert(fresh.refresh_token == std::string("new-refresh"));
  assert(seen_scope == "streaming");
  assert(adapter->refresh_calls == 1);
  assert(adapter->authenticate_calls == 1);
}

void TestMissingCredentialWithoutReauthentication() {
  auto            adapter = std::make_shared<FakeTransport>("b");
  CredentialStore store(std::make_shared<MemoryRepository>());
  store.RegisterBackend("b", CredentialPolicy{}, adapter);

  assert(ThrowsAuthExpired([&] { (void)store.EnsureValid("b"); }));
  assert(!store.Describe("b").present);
}

void TestEmptyTokenFromBackendIsAuthExpired() {
  auto            adapter = std::make_shared<FakeTransport>("b");
  CredentialStore store(std::make_shared<MemoryRepository>());

  CredentialPolicy policy;
  policy.allow_reauthenticate = true;
  store.RegisterBackend("b", policy, adapter);
  adapter->on_authenticate = [](const std::string&) { return Token(""); };

  assert(ThrowsAuthExpired([&] { (void)store.EnsureValid("b"); }));
}

void TestInvalidateKeepsRefreshToken() {
  auto            adapter = std::make_shared<FakeTransport>("b");
  CredentialStore store(std::make_shared<MemoryRepository>());
  store.RegisterBackend("b", CredentialPolicy{}, adapter);

  adapter->on_refresh = [](const Credential& previous) {
    assert(previous.refresh_token == std::string("refresh"));
    return Token("after-invalidate");
  };
  store.Store("b", Token("rejected-by-backend", "refresh"));

  store.Invalidate("b");
  auto summary = store.Describe("b");
  assert(summary.present && !summary.usable && summary.has_refresh_token);

  assert(store.EnsureValid("b").access_token == "after-invalidate");
  assert(store.Describe("b").usable);
}

void TestCredentialsLoadLazilyFromRepository() {
  auto repository = std::make_shared<MemoryRepository>();
  {
    auto            adapter = std::make_shared<FakeTransport>("b");
    CredentialStore first(repository);
    first.RegisterBackend("b", CredentialPolicy{}, adapter);
    first.Store("b", Token("persisted", "refresh"));
  }

  auto            adapter = std::make_shared<FakeTransport>("b");
  CredentialStore second(repository);
  second.RegisterBackend("b", CredentialPolicy{}, adapter);

  assert(second.EnsureValid("b").access_token == "persisted");
  assert(adapter->refresh_calls == 0);
}

void TestRegistrationAndLookupErrors() {
  CredentialStore store(std::make_shared<MemoryRepository>());
  auto            adapter = std::make_shared<FakeTransport>("b");
  store.RegisterBackend("b", CredentialPolicy{}, adapter);
  assert(store.HasBackend("b"));
  assert(!store.HasBackend("missing"));

  bool duplicate = false;
  try {
    store.RegisterBackend("b", CredentialPolicy{}, adapter);
  } catch (const acquisition::util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);

  bool null_adapter = false;
  try {
    store.RegisterBackend("c", CredentialPolicy{}, nullptr);
  } catch (const std::invalid_argument&) {
    null_adapter = true;
  }
  assert(null_adapter);

  bool unknown = false;
  try {
    (void)store.EnsureValid("missing");
  } catch (const acquisition::util::NotFound&) {
    unknown = true;
  }
  assert(unknown);

  bool empty_token = false;
  try {
    store.Store("b", Token(""));
  } catch (const std::invalid_argument&) {
    empty_token = true;
  }
  assert(empty_token);
}

} // namespace

int main() {
  TestStoredCredentialIsReturnedWithoutAdapterCalls();
  TestExpiringCredentialIsRefreshedAndPersisted();
  TestConcurrentRefreshesCoalesce();
  TestRefreshFailureReachesEveryWaiterAndIsNotCached();
  TestDeniedRefreshWithoutReauthenticationIsAuthExpired();
  TestDeniedRefreshFallsBackToAuthenticate();
  TestMissingCredentialWithoutReauthentication();
  TestEmptyTokenFromBackendIsAuthExpired();
  TestInvalidateKeepsRefreshToken();
  TestCredentialsLoadLazilyFromRepository();
  TestRegistrationAndLookupErrors();

  std::cout << "acquisition_unit_credential_store: pass\n";
  return 0;
}
