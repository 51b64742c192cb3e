#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "acquisition/engine/v1.hpp"
#include "internal/service/credential_service.hpp"

namespace acquisition::grpc {

class CredentialServer final : public acquisition::engine::v1::CredentialService::Service {
 public:
  explicit CredentialServer(std::shared_ptr<acquisition::service::CredentialService> svc);

  ::grpc::Status StoreCredential(::grpc::ServerContext*, const acquisition::engine::v1::StoreCredentialRequest*,
                                 google::protobuf::Empty*) override;

  ::grpc::Status InvalidateCredential(::grpc::ServerContext*, const acquisition::engine::v1::InvalidateCredentialRequest*,
                                      google::protobuf::Empty*) override;

  ::grpc::Status GetCredentialStatus(::grpc::ServerContext*, const acquisition::engine::v1::GetCredentialStatusRequest*,
                                     acquisition::engine::v1::GetCredentialStatusResponse*) override;

 private:
  std::shared_ptr<acquisition::service::CredentialService> service_;
};

} // namespace acquisition::grpc
