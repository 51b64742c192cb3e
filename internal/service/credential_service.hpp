#pragma once

#include "acquisition/engine/v1.hpp"
#include "service_context.hpp"

namespace acquisition::service {

/*
  Credential administration. Token material flows in only; status
  responses never carry it.
*/
class CredentialService {
 public:
  explicit CredentialService(ServiceContext ctx);

  void Store(const acquisition::engine::v1::StoreCredentialRequest& req);

  void Invalidate(const acquisition::engine::v1::InvalidateCredentialRequest& req);

  acquisition::engine::v1::GetCredentialStatusResponse GetStatus(const acquisition::engine::v1::GetCredentialStatusRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace acquisition::service
