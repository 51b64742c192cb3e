#include "credential_server.hpp"

#include "grpc_error.hpp"

namespace acquisition::grpc {

using namespace acquisition::engine::v1;

CredentialServer::CredentialServer(std::shared_ptr<acquisition::service::CredentialService> svc) : service_(std::move(svc)) {
}

::grpc::Status CredentialServer::StoreCredential(::grpc::ServerContext*, const StoreCredentialRequest* req, google::protobuf::Empty*) {
  try {
    service_->Store(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CredentialServer::InvalidateCredential(::grpc::ServerContext*, const InvalidateCredentialRequest* req,
                                                      google::protobuf::Empty*) {
  try {
    service_->Invalidate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CredentialServer::GetCredentialStatus(::grpc::ServerContext*, const GetCredentialStatusRequest* req,
                                                     GetCredentialStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace acquisition::grpc
