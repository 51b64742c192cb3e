#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace acquisition::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertCredential(Transaction&, const model::CredentialRecord&) override;
  std::optional<model::CredentialRecord> GetCredential(Transaction&, const std::string&) override;
  std::vector<model::CredentialRecord> ListCredentials(Transaction&) override;
  Result DeleteCredential(Transaction&, const std::string&) override;

  Result UpsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::vector<model::JobRecord> ListJobs(Transaction&, const std::string& backend_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::CredentialRecord> credentials;
    std::unordered_map<std::string, model::JobRecord> jobs;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
