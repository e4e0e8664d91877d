#pragma once

#include "nsi/requester/v1.hpp"
#include "service_context.hpp"

namespace nsi::service {

class RequesterService {
 public:
  explicit RequesterService(ServiceContext ctx);

  nsi::requester::v1::IntentResponse Reserve(const nsi::requester::v1::ReserveRequest& req);
  nsi::requester::v1::IntentResponse Rereserve(const nsi::requester::v1::ConnectionRequest& req);
  nsi::requester::v1::IntentResponse ReserveCommit(const nsi::requester::v1::ConnectionRequest& req);
  nsi::requester::v1::IntentResponse ReserveAbort(const nsi::requester::v1::ConnectionRequest& req);
  nsi::requester::v1::IntentResponse Provision(const nsi::requester::v1::ConnectionRequest& req);
  nsi::requester::v1::IntentResponse Release(const nsi::requester::v1::ConnectionRequest& req);
  nsi::requester::v1::IntentResponse Terminate(const nsi::requester::v1::ConnectionRequest& req);
  nsi::requester::v1::IntentResponse ForceTerminate(const nsi::requester::v1::ConnectionRequest& req);
  nsi::requester::v1::IntentResponse Query(const nsi::requester::v1::ConnectionRequest& req);

  nsi::requester::v1::DeliverResponse DeliverProviderMessage(const nsi::requester::v1::Envelope& envelope);

  nsi::requester::v1::ConnectionStatus        GetConnection(const nsi::requester::v1::ConnectionRequest& req);
  nsi::requester::v1::ListConnectionsResponse ListConnections(const nsi::requester::v1::ListConnectionsRequest& req);
  nsi::requester::v1::ListAnomaliesResponse   ListAnomalies(const nsi::requester::v1::ConnectionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace nsi::service
