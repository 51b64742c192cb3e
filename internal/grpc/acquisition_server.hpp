#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "acquisition/engine/v1.hpp"
#include "internal/service/acquisition_service.hpp"

namespace acquisition::grpc {

class AcquisitionServer final : public acquisition::engine::v1::AcquisitionService::Service {
 public:
  explicit AcquisitionServer(std::shared_ptr<acquisition::service::AcquisitionService> svc);

  ::grpc::Status Submit(::grpc::ServerContext*, const acquisition::engine::v1::SubmitRequest*,
                        acquisition::engine::v1::SubmitResponse*) override;

  ::grpc::Status GetStatus(::grpc::ServerContext*, const acquisition::engine::v1::GetStatusRequest*,
                           acquisition::engine::v1::GetStatusResponse*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*, const acquisition::engine::v1::CancelRequest*,
                        acquisition::engine::v1::CancelResponse*) override;

  ::grpc::Status ListJobs(::grpc::ServerContext*, const acquisition::engine::v1::ListJobsRequest*,
                          acquisition::engine::v1::ListJobsResponse*) override;

 private:
  std::shared_ptr<acquisition::service::AcquisitionService> service_;
};

} // namespace acquisition::grpc
