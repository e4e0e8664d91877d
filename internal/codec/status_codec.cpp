#include "status_codec.hpp"

#include "internal/codec/message_codec.hpp"
#include "internal/util/time.hpp"

namespace nsi::codec {

namespace v1 = nsi::requester::v1;

// Enum values line up one to one with the model.
v1::ReservationState ToProto(model::ReservationState state) {
  return static_cast<v1::ReservationState>(static_cast<int>(state));
}

v1::ProvisionState ToProto(model::ProvisionState state) {
  return static_cast<v1::ProvisionState>(static_cast<int>(state));
}

v1::LifecycleState ToProto(model::LifecycleState state) {
  return static_cast<v1::LifecycleState>(static_cast<int>(state));
}

v1::DataPlaneState ToProto(model::DataPlaneState state) {
  return static_cast<v1::DataPlaneState>(static_cast<int>(state));
}

v1::ConnectionStatus ToProto(const model::Connection& connection) {
  v1::ConnectionStatus out;
  out.set_connection_id(connection.connection_id);
  out.set_provider_connection_id(connection.provider_connection_id);
  out.set_global_reservation_id(connection.global_reservation_id);
  out.set_description(connection.description);

  auto* params = out.mutable_params();
  params->set_source_stp(connection.params.source_stp);
  params->set_dest_stp(connection.params.dest_stp);
  params->set_source_vlan(connection.params.source_vlan);
  params->set_dest_vlan(connection.params.dest_vlan);
  params->set_bandwidth_mbps(connection.params.bandwidth_mbps);
  if (connection.params.start_time) *params->mutable_start_time() = util::ToProto(*connection.params.start_time);
  if (connection.params.end_time) *params->mutable_end_time() = util::ToProto(*connection.params.end_time);

  const auto& s = connection.states;
  out.set_reservation_state(ToProto(s.reservation));
  out.set_provision_state(ToProto(s.provision));
  out.set_lifecycle_state(ToProto(s.lifecycle));
  out.set_data_plane_state(ToProto(s.data_plane));
  out.set_committed(s.committed);
  out.set_stalled_operation(ToProto(connection.stalled_operation));

  out.set_version(connection.version);
  *out.mutable_created_at() = util::ToProto(connection.created_at);
  *out.mutable_updated_at() = util::ToProto(connection.updated_at);
  if (connection.archived_at) *out.mutable_archived_at() = util::ToProto(*connection.archived_at);
  return out;
}

v1::AnomalyRecord ToProto(const model::Anomaly& anomaly) {
  v1::AnomalyRecord out;
  out.set_connection_id(anomaly.connection_id);
  out.set_kind(std::string(model::ToString(anomaly.kind)));
  out.set_operation(ToProto(anomaly.operation));
  out.set_correlation_id(anomaly.correlation_id);
  out.set_reservation_state(ToProto(anomaly.states.reservation));
  out.set_provision_state(ToProto(anomaly.states.provision));
  out.set_lifecycle_state(ToProto(anomaly.states.lifecycle));
  out.set_detail(anomaly.detail);
  *out.mutable_recorded_at() = util::ToProto(anomaly.recorded_at);
  return out;
}

model::ServiceParameters FromProto(const v1::ServiceParameters& params) {
  model::ServiceParameters out;
  out.source_stp     = params.source_stp();
  out.dest_stp       = params.dest_stp();
  out.source_vlan    = params.source_vlan();
  out.dest_vlan      = params.dest_vlan();
  out.bandwidth_mbps = params.bandwidth_mbps();
  if (params.has_start_time()) out.start_time = util::FromProto(params.start_time());
  if (params.has_end_time()) out.end_time = util::FromProto(params.end_time());
  return out;
}

} // namespace nsi::codec
