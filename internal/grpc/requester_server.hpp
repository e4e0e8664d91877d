#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/requester_service.hpp"
#include "nsi/requester/v1.hpp"

namespace nsi::grpc {

class RequesterServer final : public nsi::requester::v1::RequesterService::Service {
 public:
  explicit RequesterServer(std::shared_ptr<nsi::service::RequesterService> svc);

  ::grpc::Status Reserve(::grpc::ServerContext* ctx, const nsi::requester::v1::ReserveRequest* req,
                         nsi::requester::v1::IntentResponse* resp) override;

  ::grpc::Status Rereserve(::grpc::ServerContext* ctx, const nsi::requester::v1::ConnectionRequest* req,
                           nsi::requester::v1::IntentResponse* resp) override;

  ::grpc::Status ReserveCommit(::grpc::ServerContext* ctx, const nsi::requester::v1::ConnectionRequest* req,
                               nsi::requester::v1::IntentResponse* resp) override;

  ::grpc::Status ReserveAbort(::grpc::ServerContext* ctx, const nsi::requester::v1::ConnectionRequest* req,
                              nsi::requester::v1::IntentResponse* resp) override;

  ::grpc::Status Provision(::grpc::ServerContext* ctx, const nsi::requester::v1::ConnectionRequest* req,
                           nsi::requester::v1::IntentResponse* resp) override;

  ::grpc::Status Release(::grpc::ServerContext* ctx, const nsi::requester::v1::ConnectionRequest* req,
                         nsi::requester::v1::IntentResponse* resp) override;

  ::grpc::Status Terminate(::grpc::ServerContext* ctx, const nsi::requester::v1::ConnectionRequest* req,
                           nsi::requester::v1::IntentResponse* resp) override;

  ::grpc::Status ForceTerminate(::grpc::ServerContext* ctx, const nsi::requester::v1::ConnectionRequest* req,
                                nsi::requester::v1::IntentResponse* resp) override;

  ::grpc::Status Query(::grpc::ServerContext* ctx, const nsi::requester::v1::ConnectionRequest* req,
                       nsi::requester::v1::IntentResponse* resp) override;

  ::grpc::Status DeliverProviderMessage(::grpc::ServerContext* ctx, const nsi::requester::v1::Envelope* req,
                                        nsi::requester::v1::DeliverResponse* resp) override;

  ::grpc::Status GetConnection(::grpc::ServerContext* ctx, const nsi::requester::v1::ConnectionRequest* req,
                               nsi::requester::v1::ConnectionStatus* resp) override;

  ::grpc::Status ListConnections(::grpc::ServerContext* ctx, const nsi::requester::v1::ListConnectionsRequest* req,
                                 nsi::requester::v1::ListConnectionsResponse* resp) override;

  ::grpc::Status ListAnomalies(::grpc::ServerContext* ctx, const nsi::requester::v1::ConnectionRequest* req,
                               nsi::requester::v1::ListAnomaliesResponse* resp) override;

 private:
  std::shared_ptr<nsi::service::RequesterService> service_;
};

} // namespace nsi::grpc
