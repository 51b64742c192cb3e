#include "acquisition_server.hpp"

#include "grpc_error.hpp"

namespace acquisition::grpc {

using namespace acquisition::engine::v1;

AcquisitionServer::AcquisitionServer(std::shared_ptr<acquisition::service::AcquisitionService> svc) : service_(std::move(svc)) {
}

::grpc::Status AcquisitionServer::Submit(::grpc::ServerContext*, const SubmitRequest* req, SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AcquisitionServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AcquisitionServer::Cancel(::grpc::ServerContext*, const CancelRequest* req, CancelResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AcquisitionServer::ListJobs(::grpc::ServerContext*, const ListJobsRequest* req, ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace acquisition::grpc
