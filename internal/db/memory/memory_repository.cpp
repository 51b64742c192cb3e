#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace acquisition::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertCredential(Transaction& t, const model::CredentialRecord& r) {
  if (r.backend_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "backend_id must not be empty");
  TX(t).Mutable().credentials[r.backend_id] = r;
  return Result::Ok();
}

std::optional<model::CredentialRecord> MemoryRepository::GetCredential(Transaction& t, const std::string& backend_id) {
  const auto& s  = TX(t).View();
  auto        it = s.credentials.find(backend_id);
  if (it == s.credentials.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CredentialRecord> MemoryRepository::ListCredentials(Transaction& t) {
  const auto&                          s = TX(t).View();
  std::vector<model::CredentialRecord> records;
  records.reserve(s.credentials.size());
  for (const auto& [_, record] : s.credentials) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.backend_id < b.backend_id; });
  return records;
}

Result MemoryRepository::DeleteCredential(Transaction& t, const std::string& backend_id) {
  auto& s = TX(t).Mutable();
  if (s.credentials.erase(backend_id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result MemoryRepository::UpsertJob(Transaction& t, const model::JobRecord& r) {
  if (r.job_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "job_id must not be empty");
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.job_id);
  if (it == s.jobs.end()) {
    s.jobs.emplace(r.job_id, r);
    return Result::Ok();
  }

  // identity columns are immutable, matching the sqlite upsert
  auto& existing          = it->second;
  existing.state          = r.state;
  existing.attempt        = r.attempt;
  existing.reason         = r.reason;
  existing.message        = r.message;
  existing.bytes_written  = r.bytes_written;
  existing.poll_count     = r.poll_count;
  existing.finished_at_ms = r.finished_at_ms;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& job_id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(job_id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t, const std::string& backend_id) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, record] : TX(t).View().jobs)
    if (backend_id.empty() || record.backend_id == backend_id) out.push_back(record);

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.finished_at_ms != b.finished_at_ms) return a.finished_at_ms > b.finished_at_ms;
    return a.job_id < b.job_id;
  });
  return out;
}

} // namespace acquisition::db::memory
