#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace acquisition::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace acquisition::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const Unsupported*>(&e)) {
    return {::grpc::StatusCode::UNIMPLEMENTED, e.what()};
  }
  if (dynamic_cast<const AuthExpired*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace acquisition::grpc
