#pragma once

#include <optional>
#include <string>

#include "internal/fsm/connection_state_machine.hpp"
#include "internal/model/connection.hpp"
#include "internal/model/operation.hpp"
#include "internal/model/pending_operation.hpp"
#include "nsi/requester/v1.hpp"

namespace nsi::codec {

// Addressing stamped on every outbound header.
struct CodecOptions {
  std::string requester_nsa;
  std::string provider_nsa;
  std::string reply_to;
};

enum class MessageType : std::uint8_t {
  kConfirm      = 0,
  kFault        = 1,
  kNotification = 2,
};

/*
  Decoded inbound envelope.

  Confirm and fault carry the correlation id of the request they answer;
  notifications are unsolicited and are routed by connection id instead.
*/
struct ProviderMessage {
  MessageType          type = MessageType::kConfirm;
  std::string          correlation_id;
  model::OperationKind operation = model::OperationKind::kUnspecified;

  // Provider-assigned connection id as carried in the body.
  std::string connection_id;

  std::optional<bool> data_plane_active; // confirm, dataPlaneStateChange
  std::string         reason;            // fault

  fsm::NotificationType notification = fsm::NotificationType::kDataPlaneStateChange;
  std::string           text;            // errorEvent
};

/*
  Maps between the protobuf wire envelope and engine-side values.

  Decoding validates structure only (body present, ids set, operation
  known). Whether a message makes sense for a connection is decided by the
  state machine.
*/
class MessageCodec {
 public:
  explicit MessageCodec(CodecOptions options = {});

  nsi::requester::v1::Envelope EncodeRequest(const model::Connection& connection, const model::PendingOperation& op) const;

  ProviderMessage Decode(const nsi::requester::v1::Envelope& envelope) const;

  static nsi::requester::v1::Envelope Parse(const std::string& bytes);
  static std::string                  Serialize(const nsi::requester::v1::Envelope& envelope);

  const CodecOptions& Options() const {
    return options_;
  }

 private:
  CodecOptions options_;
};

nsi::requester::v1::Operation ToProto(model::OperationKind kind);
model::OperationKind          FromProto(nsi::requester::v1::Operation op);

} // namespace nsi::codec
