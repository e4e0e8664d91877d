#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/core/protocol_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/requester_server.hpp"
#include "internal/service/requester_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/transport/log_sink.hpp"
#include "internal/util/errors.hpp"
#include "nsi/requester/v1.hpp"

namespace {

namespace v1 = nsi::requester::v1;

class DownSink final : public nsi::transport::MessageSink {
 public:
  nsi::transport::EmitReceipt Emit(const v1::Envelope&) override {
    throw nsi::util::TransportError("relay down");
  }
};

nsi::grpc::RequesterServer BuildServer(std::shared_ptr<nsi::transport::MessageSink> sink = nullptr) {
  if (!sink) sink = std::make_shared<nsi::transport::LogSink>();

  nsi::service::ServiceContext ctx;
  ctx.engine = std::make_shared<nsi::core::ProtocolEngine>(
      std::make_shared<nsi::db::memory::MemoryRepository>(), std::move(sink), nsi::codec::MessageCodec(),
      nsi::fsm::ConnectionStateMachine(), std::make_shared<nsi::correlation::CorrelationTracker>(),
      std::make_shared<nsi::timeout::TimeoutManager>());

  return nsi::grpc::RequesterServer(std::make_shared<nsi::service::RequesterService>(ctx));
}

v1::ReserveRequest MakeReserve() {
  v1::ReserveRequest req;
  req.set_description("grpc");
  auto* params = req.mutable_params();
  params->set_source_stp("urn:ogf:network:example.net:2013:a");
  params->set_dest_stp("urn:ogf:network:example.net:2013:b");
  params->set_source_vlan(100);
  params->set_dest_vlan(200);
  params->set_bandwidth_mbps(10);
  return req;
}

void TestReserveReturnsStatus() {
  auto server = BuildServer();

  auto                  req = MakeReserve();
  v1::IntentResponse    resp;
  ::grpc::ServerContext ctx;

  const auto status = server.Reserve(&ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.correlation_id().empty());
  assert(resp.status().reservation_state() == v1::RESERVATION_STATE_CHECKING);
  assert(resp.status().version() == 2);

  v1::ListConnectionsRequest list_req;
  v1::ListConnectionsResponse list_resp;
  ::grpc::ServerContext       list_ctx;
  assert(server.ListConnections(&list_ctx, &list_req, &list_resp).ok());
  assert(list_resp.connections_size() == 1);
}

void TestMissingConnectionReturnsNotFound() {
  auto server = BuildServer();

  v1::ConnectionRequest req;
  req.set_connection_id("missing-connection");
  v1::IntentResponse    resp;
  ::grpc::ServerContext ctx;

  assert(server.Provision(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestEmptyIdReturnsInvalidArgument() {
  auto server = BuildServer();

  v1::ConnectionRequest req;
  v1::ConnectionStatus  resp;
  ::grpc::ServerContext ctx;

  assert(server.GetConnection(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  v1::IntentResponse    intent;
  ::grpc::ServerContext rereserve_ctx;
  assert(server.Rereserve(&rereserve_ctx, &req, &intent).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestIllegalIntentReturnsFailedPrecondition() {
  auto server = BuildServer();

  auto                  reserve = MakeReserve();
  v1::IntentResponse    reserved;
  ::grpc::ServerContext reserve_ctx;
  assert(server.Reserve(&reserve_ctx, &reserve, &reserved).ok());

  v1::ConnectionRequest req;
  req.set_connection_id(reserved.status().connection_id());
  v1::IntentResponse    resp;
  ::grpc::ServerContext ctx;

  const auto status = server.ReserveCommit(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  v1::ListAnomaliesResponse anomalies;
  ::grpc::ServerContext     anomalies_ctx;
  assert(server.ListAnomalies(&anomalies_ctx, &req, &anomalies).ok());
  assert(anomalies.anomalies_size() == 1);
  assert(anomalies.anomalies(0).kind() == "InvalidTransition");
}

void TestUnreachableRelayReturnsUnavailable() {
  auto server = BuildServer(std::make_shared<DownSink>());

  auto                  req = MakeReserve();
  v1::IntentResponse    resp;
  ::grpc::ServerContext ctx;

  assert(server.Reserve(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAVAILABLE);
}

void TestDeliverUnknownCorrelationIsDiscarded() {
  auto server = BuildServer();

  v1::Envelope envelope;
  envelope.mutable_header()->set_correlation_id("urn:uuid:nobody");
  envelope.mutable_confirm()->set_operation(v1::OPERATION_RESERVE);
  v1::DeliverResponse   resp;
  ::grpc::ServerContext ctx;

  assert(server.DeliverProviderMessage(&ctx, &envelope, &resp).ok());
  assert(resp.outcome() == v1::DeliverResponse::OUTCOME_DISCARDED);

  v1::Envelope          empty;
  ::grpc::ServerContext bad_ctx;
  assert(server.DeliverProviderMessage(&bad_ctx, &empty, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestErrorMapping() {
  assert(nsi::grpc::ToStatus(nsi::util::ConflictingOperation("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(nsi::grpc::ToStatus(nsi::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(nsi::grpc::ToStatus(nsi::util::ProtocolDefect("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestReserveReturnsStatus();
  TestMissingConnectionReturnsNotFound();
  TestEmptyIdReturnsInvalidArgument();
  TestIllegalIntentReturnsFailedPrecondition();
  TestUnreachableRelayReturnsUnavailable();
  TestDeliverUnknownCorrelationIsDiscarded();
  TestErrorMapping();

  std::cout << "nsi_requester_unit_grpc_status: pass\n";
  return 0;
}
