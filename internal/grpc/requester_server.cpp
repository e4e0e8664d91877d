#include "requester_server.hpp"

#include "grpc_error.hpp"

namespace nsi::grpc {

using namespace nsi::requester::v1;

RequesterServer::RequesterServer(std::shared_ptr<nsi::service::RequesterService> svc) : service_(std::move(svc)) {
}

::grpc::Status RequesterServer::Reserve(::grpc::ServerContext*, const ReserveRequest* req, IntentResponse* resp) {
  try {
    *resp = service_->Reserve(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::Rereserve(::grpc::ServerContext*, const ConnectionRequest* req, IntentResponse* resp) {
  try {
    *resp = service_->Rereserve(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::ReserveCommit(::grpc::ServerContext*, const ConnectionRequest* req, IntentResponse* resp) {
  try {
    *resp = service_->ReserveCommit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::ReserveAbort(::grpc::ServerContext*, const ConnectionRequest* req, IntentResponse* resp) {
  try {
    *resp = service_->ReserveAbort(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::Provision(::grpc::ServerContext*, const ConnectionRequest* req, IntentResponse* resp) {
  try {
    *resp = service_->Provision(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::Release(::grpc::ServerContext*, const ConnectionRequest* req, IntentResponse* resp) {
  try {
    *resp = service_->Release(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::Terminate(::grpc::ServerContext*, const ConnectionRequest* req, IntentResponse* resp) {
  try {
    *resp = service_->Terminate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::ForceTerminate(::grpc::ServerContext*, const ConnectionRequest* req, IntentResponse* resp) {
  try {
    *resp = service_->ForceTerminate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::Query(::grpc::ServerContext*, const ConnectionRequest* req, IntentResponse* resp) {
  try {
    *resp = service_->Query(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::DeliverProviderMessage(::grpc::ServerContext*, const Envelope* req, DeliverResponse* resp) {
  try {
    *resp = service_->DeliverProviderMessage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::GetConnection(::grpc::ServerContext*, const ConnectionRequest* req, ConnectionStatus* resp) {
  try {
    *resp = service_->GetConnection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::ListConnections(::grpc::ServerContext*, const ListConnectionsRequest* req, ListConnectionsResponse* resp) {
  try {
    *resp = service_->ListConnections(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RequesterServer::ListAnomalies(::grpc::ServerContext*, const ConnectionRequest* req, ListAnomaliesResponse* resp) {
  try {
    *resp = service_->ListAnomalies(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace nsi::grpc
