#include "grpc_relay_sink.hpp"

#include "internal/util/errors.hpp"

namespace nsi::transport {

GrpcRelaySink::GrpcRelaySink(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds call_timeout)
    : stub_(nsi::requester::v1::ProviderRelay::NewStub(channel)), call_timeout_(call_timeout) {
}

std::shared_ptr<GrpcRelaySink> GrpcRelaySink::Connect(const std::string& address, std::chrono::milliseconds call_timeout) {
  if (address.empty()) {
    throw util::InvalidArgument("relay address is empty");
  }
  auto channel = ::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials());
  return std::make_shared<GrpcRelaySink>(std::move(channel), call_timeout);
}

EmitReceipt GrpcRelaySink::Emit(const nsi::requester::v1::Envelope& envelope) {
  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + call_timeout_);

  nsi::requester::v1::ForwardResponse response;
  const auto                          status = stub_->Forward(&context, envelope, &response);
  if (!status.ok()) {
    throw util::TransportError("relay forward of " + envelope.header().correlation_id() +
                               " failed: " + status.error_message());
  }
  return EmitReceipt{response.connection_id()};
}

} // namespace nsi::transport
