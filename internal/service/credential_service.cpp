#include "credential_service.hpp"

#include <stdexcept>

#include "internal/credential/credential_store.hpp"
#include "proto_mapping.hpp"
#include "rpc_observer.hpp"

namespace acquisition::service {

using namespace acquisition::engine::v1;

namespace {

void RequireBackend(const std::string& backend_id) {
  if (backend_id.empty()) {
    throw std::invalid_argument("backend_id is required");
  }
}

} // namespace

CredentialService::CredentialService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.credentials) {
    throw std::invalid_argument("CredentialService requires a credential store");
  }
}

void CredentialService::Store(const StoreCredentialRequest& req) {
  ObserveRpc("CredentialService/StoreCredential", req.backend_id(), [&] {
    RequireBackend(req.backend_id());
    if (!req.has_credential()) {
      throw std::invalid_argument("credential is required");
    }
    ctx_.credentials->Store(req.backend_id(), FromProto(req.backend_id(), req.credential()));
  });
}

void CredentialService::Invalidate(const InvalidateCredentialRequest& req) {
  ObserveRpc("CredentialService/InvalidateCredential", req.backend_id(), [&] {
    RequireBackend(req.backend_id());
    ctx_.credentials->Invalidate(req.backend_id());
  });
}

GetCredentialStatusResponse CredentialService::GetStatus(const GetCredentialStatusRequest& req) {
  return ObserveRpc("CredentialService/GetCredentialStatus", req.backend_id(), [&] {
    RequireBackend(req.backend_id());

    GetCredentialStatusResponse resp;
    *resp.mutable_summary() = ToProto(ctx_.credentials->Describe(req.backend_id()));
    return resp;
  });
}

} // namespace acquisition::service
