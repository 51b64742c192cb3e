#include "transport_adapter.hpp"

#include "internal/util/errors.hpp"

namespace acquisition::transport {

namespace {

[[noreturn]] void ThrowUnsupported(const TransportAdapter& adapter, const char* capability) {
  throw util::Unsupported("backend " + adapter.BackendId() + " does not support " + capability);
}

} // namespace

model::Credential TransportAdapter::Authenticate(const std::string&) {
  ThrowUnsupported(*this, "authenticate");
}

model::Credential TransportAdapter::Refresh(const model::Credential&) {
  ThrowUnsupported(*this, "refresh");
}

TrackMetadata TransportAdapter::FetchMetadata(const model::Credential&, const std::string&) {
  ThrowUnsupported(*this, "fetchMetadata");
}

Bytes TransportAdapter::FetchEncryptedBytes(const model::Credential&, const std::string&, ByteRange) {
  ThrowUnsupported(*this, "fetchEncryptedBytes");
}

TransferRef TransportAdapter::InitiateTransfer(const model::Credential&, const std::string&) {
  ThrowUnsupported(*this, "initiateTransfer");
}

RemoteTransferStatus TransportAdapter::PollTransferStatus(const model::Credential&, const std::string&, const std::string&) {
  ThrowUnsupported(*this, "pollTransferStatus");
}

} // namespace acquisition::transport
