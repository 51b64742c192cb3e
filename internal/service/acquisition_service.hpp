#pragma once

#include "acquisition/engine/v1.hpp"
#include "service_context.hpp"

namespace acquisition::service {

class AcquisitionService {
 public:
  explicit AcquisitionService(ServiceContext ctx);

  acquisition::engine::v1::SubmitResponse Submit(const acquisition::engine::v1::SubmitRequest& req);

  acquisition::engine::v1::GetStatusResponse GetStatus(const acquisition::engine::v1::GetStatusRequest& req);

  acquisition::engine::v1::CancelResponse Cancel(const acquisition::engine::v1::CancelRequest& req);

  acquisition::engine::v1::ListJobsResponse ListJobs(const acquisition::engine::v1::ListJobsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace acquisition::service
