#pragma once

#include <string>

#include "acquisition/engine/v1.hpp"
#include "internal/model/credential.hpp"
#include "internal/model/job.hpp"

namespace acquisition::service {

/*
  Model <-> wire conversions.
*/

acquisition::engine::v1::JobState      ToProto(model::JobState state);
acquisition::engine::v1::FailureReason ToProto(model::FailureReason reason);

acquisition::engine::v1::JobStatus         ToProto(const model::JobStatus& status);
acquisition::engine::v1::CredentialSummary ToProto(const model::CredentialSummary& summary);

model::Credential FromProto(const std::string& backend_id, const acquisition::engine::v1::Credential& credential);

} // namespace acquisition::service
