#include "message_codec.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace nsi::codec {

namespace v1 = nsi::requester::v1;

v1::Operation ToProto(model::OperationKind kind) {
  switch (kind) {
    case model::OperationKind::kReserve:
      return v1::OPERATION_RESERVE;
    case model::OperationKind::kReserveCommit:
      return v1::OPERATION_RESERVE_COMMIT;
    case model::OperationKind::kReserveAbort:
      return v1::OPERATION_RESERVE_ABORT;
    case model::OperationKind::kProvision:
      return v1::OPERATION_PROVISION;
    case model::OperationKind::kRelease:
      return v1::OPERATION_RELEASE;
    case model::OperationKind::kTerminate:
      return v1::OPERATION_TERMINATE;
    case model::OperationKind::kQuery:
      return v1::OPERATION_QUERY;
    default:
      return v1::OPERATION_UNSPECIFIED;
  }
}

model::OperationKind FromProto(v1::Operation op) {
  switch (op) {
    case v1::OPERATION_RESERVE:
      return model::OperationKind::kReserve;
    case v1::OPERATION_RESERVE_COMMIT:
      return model::OperationKind::kReserveCommit;
    case v1::OPERATION_RESERVE_ABORT:
      return model::OperationKind::kReserveAbort;
    case v1::OPERATION_PROVISION:
      return model::OperationKind::kProvision;
    case v1::OPERATION_RELEASE:
      return model::OperationKind::kRelease;
    case v1::OPERATION_TERMINATE:
      return model::OperationKind::kTerminate;
    case v1::OPERATION_QUERY:
      return model::OperationKind::kQuery;
    default:
      return model::OperationKind::kUnspecified;
  }
}

MessageCodec::MessageCodec(CodecOptions options) : options_(std::move(options)) {
}

v1::Envelope MessageCodec::EncodeRequest(const model::Connection& connection, const model::PendingOperation& op) const {
  if (!model::IsKnown(op.kind)) {
    throw util::ProtocolDefect("encode: unknown operation kind " + std::to_string(static_cast<int>(op.kind)));
  }

  v1::Envelope envelope;

  auto* header = envelope.mutable_header();
  header->set_correlation_id(op.correlation_id);
  header->set_requester_nsa(options_.requester_nsa);
  header->set_provider_nsa(options_.provider_nsa);
  header->set_reply_to(options_.reply_to);

  auto* request = envelope.mutable_request();
  request->set_operation(ToProto(op.kind));
  request->set_connection_id(connection.provider_connection_id);

  if (op.kind == model::OperationKind::kReserve) {
    request->set_global_reservation_id(connection.global_reservation_id);
    request->set_description(connection.description);

    const auto& params   = connection.params;
    auto*       criteria = request->mutable_criteria();
    criteria->set_source_stp(model::StpWithVlan(params.source_stp, params.source_vlan));
    criteria->set_dest_stp(model::StpWithVlan(params.dest_stp, params.dest_vlan));
    criteria->set_bandwidth_mbps(params.bandwidth_mbps);
    if (params.start_time) *criteria->mutable_start_time() = util::ToProto(*params.start_time);
    if (params.end_time) *criteria->mutable_end_time() = util::ToProto(*params.end_time);
  } else if (connection.provider_connection_id.empty()) {
    throw util::InvalidState(std::string(model::ToString(op.kind)) + " needs a provider connection id; connection " +
                             connection.connection_id + " has none");
  }

  return envelope;
}

ProviderMessage MessageCodec::Decode(const v1::Envelope& envelope) const {
  ProviderMessage message;
  message.correlation_id = envelope.header().correlation_id();

  auto require_operation = [](v1::Operation op, const char* what) {
    auto kind = FromProto(op);
    if (!model::IsKnown(kind)) {
      throw util::InvalidArgument(std::string(what) + " carries unknown operation " + std::to_string(static_cast<int>(op)));
    }
    return kind;
  };

  switch (envelope.body_case()) {
    case v1::Envelope::kConfirm: {
      const auto& confirm   = envelope.confirm();
      message.type          = MessageType::kConfirm;
      message.operation     = require_operation(confirm.operation(), "confirm");
      message.connection_id = confirm.connection_id();
      if (confirm.has_data_plane()) {
        message.data_plane_active = confirm.data_plane().active();
      }
      break;
    }

    case v1::Envelope::kFault: {
      const auto& fault     = envelope.fault();
      message.type          = MessageType::kFault;
      message.operation     = require_operation(fault.operation(), "fault");
      message.connection_id = fault.connection_id();
      message.reason        = fault.error_id().empty() ? fault.text() : fault.error_id() + ": " + fault.text();
      break;
    }

    case v1::Envelope::kNotification: {
      const auto& notification = envelope.notification();
      message.type             = MessageType::kNotification;
      message.connection_id    = notification.connection_id();
      if (message.connection_id.empty()) {
        throw util::InvalidArgument("notification without connection id");
      }

      switch (notification.event_case()) {
        case v1::Notification::kDataPlaneStateChange:
          message.notification      = fsm::NotificationType::kDataPlaneStateChange;
          message.data_plane_active = notification.data_plane_state_change().status().active();
          break;
        case v1::Notification::kErrorEvent:
          message.notification = fsm::NotificationType::kErrorEvent;
          message.text         = notification.error_event().event().empty()
                                     ? notification.error_event().text()
                                     : notification.error_event().event() + ": " + notification.error_event().text();
          break;
        case v1::Notification::kPassedEndTime:
          message.notification = fsm::NotificationType::kPassedEndTime;
          break;
        case v1::Notification::kReserveTimeout:
          message.notification = fsm::NotificationType::kReserveTimeout;
          break;
        default:
          throw util::InvalidArgument("notification without event");
      }
      return message;
    }

    case v1::Envelope::kRequest:
      throw util::InvalidArgument("requests are never delivered to a requester");

    default:
      throw util::InvalidArgument("envelope without body");
  }

  if (message.correlation_id.empty()) {
    throw util::InvalidArgument("reply without correlation id");
  }
  return message;
}

v1::Envelope MessageCodec::Parse(const std::string& bytes) {
  v1::Envelope envelope;
  if (!envelope.ParseFromString(bytes)) {
    throw util::InvalidArgument("malformed envelope payload");
  }
  return envelope;
}

std::string MessageCodec::Serialize(const v1::Envelope& envelope) {
  std::string bytes;
  if (!envelope.SerializeToString(&bytes)) {
    throw util::InvalidArgument("envelope could not be serialized");
  }
  return bytes;
}

} // namespace nsi::codec
