#pragma once

#include <string>

#include "nsi/requester/v1.hpp"

namespace nsi::transport {

// What the transport learned while handing an envelope over.
struct EmitReceipt {
  // Provider connection id from the synchronous acknowledgement; empty if none.
  std::string provider_connection_id;
};

/*
  Outbound side of the provider exchange.

  Emit hands an envelope to the transport and returns once it is accepted
  for delivery; the reply arrives later through the engine's inbound path.
  Implementations throw util::TransportError when the envelope could not
  be handed over.
*/
class MessageSink {
 public:
  virtual ~MessageSink() = default;

  virtual EmitReceipt Emit(const nsi::requester::v1::Envelope& envelope) = 0;
};

} // namespace nsi::transport
