#pragma once

#include "internal/model/anomaly.hpp"
#include "internal/model/connection.hpp"
#include "nsi/requester/v1.hpp"

namespace nsi::codec {

/*
  Read-only projections exposed to operators.
*/
nsi::requester::v1::ConnectionStatus ToProto(const model::Connection& connection);
nsi::requester::v1::AnomalyRecord    ToProto(const model::Anomaly& anomaly);

model::ServiceParameters FromProto(const nsi::requester::v1::ServiceParameters& params);

nsi::requester::v1::ReservationState ToProto(model::ReservationState state);
nsi::requester::v1::ProvisionState   ToProto(model::ProvisionState state);
nsi::requester::v1::LifecycleState   ToProto(model::LifecycleState state);
nsi::requester::v1::DataPlaneState   ToProto(model::DataPlaneState state);

} // namespace nsi::codec
