#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/credential_record.hpp"
#include "internal/db/model/job_record.hpp"

namespace acquisition::db {

/*
  Repository abstraction.

  - All writes require a Transaction
  - Reads inside a transaction see its writes

  The DB is the source of truth for:
    persisted credentials (loaded lazily by the credential store)
    the archive of terminal jobs
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Credentials
  // ---------------------------------------------------------------------

  virtual Result UpsertCredential(Transaction&, const model::CredentialRecord&) = 0;

  virtual std::optional<model::CredentialRecord> GetCredential(Transaction&, const std::string& backend_id) = 0;

  virtual std::vector<model::CredentialRecord> ListCredentials(Transaction&) = 0;

  virtual Result DeleteCredential(Transaction&, const std::string& backend_id) = 0;

  // ---------------------------------------------------------------------
  // Job archive
  // ---------------------------------------------------------------------

  virtual Result UpsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& job_id) = 0;

  // empty backend_id lists every backend, newest first
  virtual std::vector<model::JobRecord> ListJobs(Transaction&, const std::string& backend_id) = 0;
};

} // namespace acquisition::db
