#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "message_sink.hpp"
#include "nsi/requester/v1.hpp"

namespace nsi::transport {

/*
  Forwards envelopes to a ProviderRelay service, which owns the
  provider-facing SOAP/TLS transport.
*/
class GrpcRelaySink final : public MessageSink {
 public:
  GrpcRelaySink(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds call_timeout);

  static std::shared_ptr<GrpcRelaySink> Connect(const std::string& address, std::chrono::milliseconds call_timeout);

  EmitReceipt Emit(const nsi::requester::v1::Envelope& envelope) override;

 private:
  std::unique_ptr<nsi::requester::v1::ProviderRelay::Stub> stub_;
  std::chrono::milliseconds                                call_timeout_;
};

} // namespace nsi::transport
