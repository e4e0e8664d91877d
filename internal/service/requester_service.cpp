#include "requester_service.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "internal/codec/status_codec.hpp"
#include "internal/core/protocol_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace nsi::service {

using namespace nsi::requester::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view connection_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!connection_id.empty()) {
    span.SetAttribute("nsi.connection_id", connection_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    NSI_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                 observability::StringField("connection_id", connection_id)});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

const std::string& RequireConnectionId(const ConnectionRequest& req) {
  if (req.connection_id().empty()) {
    throw util::InvalidArgument("connection_id is required");
  }
  return req.connection_id();
}

IntentResponse ToResponse(core::ProtocolEngine& engine, const core::IntentResult& result) {
  IntentResponse resp;
  resp.set_correlation_id(result.correlation_id);
  *resp.mutable_status() = codec::ToProto(engine.GetConnection(result.connection_id));
  return resp;
}

DeliverResponse::Outcome ToProto(core::InboundStatus status) {
  switch (status) {
    case core::InboundStatus::kApplied:
      return DeliverResponse::OUTCOME_APPLIED;
    case core::InboundStatus::kRejected:
      return DeliverResponse::OUTCOME_REJECTED;
    case core::InboundStatus::kDiscarded:
      return DeliverResponse::OUTCOME_DISCARDED;
  }
  return DeliverResponse::OUTCOME_UNSPECIFIED;
}

} // namespace

RequesterService::RequesterService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

IntentResponse RequesterService::Reserve(const ReserveRequest& req) {
  return ObserveRpc("RequesterService.Reserve", "", [&] {
    if (!req.has_params()) {
      throw util::InvalidArgument("reserve: service parameters are required");
    }
    core::ReserveParams params;
    params.description = req.description();
    params.params      = codec::FromProto(req.params());
    return ToResponse(*ctx_.engine, ctx_.engine->Reserve(params));
  });
}

IntentResponse RequesterService::Rereserve(const ConnectionRequest& req) {
  return ObserveRpc("RequesterService.Rereserve", req.connection_id(),
                    [&] { return ToResponse(*ctx_.engine, ctx_.engine->Rereserve(RequireConnectionId(req))); });
}

IntentResponse RequesterService::ReserveCommit(const ConnectionRequest& req) {
  return ObserveRpc("RequesterService.ReserveCommit", req.connection_id(),
                    [&] { return ToResponse(*ctx_.engine, ctx_.engine->ReserveCommit(RequireConnectionId(req))); });
}

IntentResponse RequesterService::ReserveAbort(const ConnectionRequest& req) {
  return ObserveRpc("RequesterService.ReserveAbort", req.connection_id(),
                    [&] { return ToResponse(*ctx_.engine, ctx_.engine->ReserveAbort(RequireConnectionId(req))); });
}

IntentResponse RequesterService::Provision(const ConnectionRequest& req) {
  return ObserveRpc("RequesterService.Provision", req.connection_id(),
                    [&] { return ToResponse(*ctx_.engine, ctx_.engine->Provision(RequireConnectionId(req))); });
}

IntentResponse RequesterService::Release(const ConnectionRequest& req) {
  return ObserveRpc("RequesterService.Release", req.connection_id(),
                    [&] { return ToResponse(*ctx_.engine, ctx_.engine->Release(RequireConnectionId(req))); });
}

IntentResponse RequesterService::Terminate(const ConnectionRequest& req) {
  return ObserveRpc("RequesterService.Terminate", req.connection_id(),
                    [&] { return ToResponse(*ctx_.engine, ctx_.engine->Terminate(RequireConnectionId(req))); });
}

IntentResponse RequesterService::ForceTerminate(const ConnectionRequest& req) {
  return ObserveRpc("RequesterService.ForceTerminate", req.connection_id(),
                    [&] { return ToResponse(*ctx_.engine, ctx_.engine->ForceTerminate(RequireConnectionId(req))); });
}

IntentResponse RequesterService::Query(const ConnectionRequest& req) {
  return ObserveRpc("RequesterService.Query", req.connection_id(),
                    [&] { return ToResponse(*ctx_.engine, ctx_.engine->Query(RequireConnectionId(req))); });
}

DeliverResponse RequesterService::DeliverProviderMessage(const Envelope& envelope) {
  return ObserveRpc("RequesterService.DeliverProviderMessage", envelope.header().correlation_id(), [&] {
    const auto result = ctx_.engine->OnProviderMessage(envelope);

    DeliverResponse resp;
    resp.set_outcome(ToProto(result.status));
    resp.set_connection_id(result.connection_id);
    return resp;
  });
}

ConnectionStatus RequesterService::GetConnection(const ConnectionRequest& req) {
  return ObserveRpc("RequesterService.GetConnection", req.connection_id(),
                    [&] { return codec::ToProto(ctx_.engine->GetConnection(RequireConnectionId(req))); });
}

ListConnectionsResponse RequesterService::ListConnections(const ListConnectionsRequest& req) {
  return ObserveRpc("RequesterService.ListConnections", "", [&] {
    ListConnectionsResponse resp;
    for (const auto& connection : ctx_.engine->ListConnections(req.include_archived())) {
      *resp.add_connections() = codec::ToProto(connection);
    }
    return resp;
  });
}

ListAnomaliesResponse RequesterService::ListAnomalies(const ConnectionRequest& req) {
  return ObserveRpc("RequesterService.ListAnomalies", req.connection_id(), [&] {
    std::optional<std::string> filter;
    if (!req.connection_id().empty()) {
      filter = req.connection_id();
    }

    ListAnomaliesResponse resp;
    for (const auto& anomaly : ctx_.engine->ListAnomalies(filter)) {
      *resp.add_anomalies() = codec::ToProto(anomaly);
    }
    return resp;
  });
}

} // namespace nsi::service
