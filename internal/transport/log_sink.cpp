#include "log_sink.hpp"

#include "internal/codec/message_codec.hpp"
#include "internal/observability/logging.hpp"

namespace nsi::transport {

LogSink::LogSink(std::size_t retain) : retain_(retain) {
}

EmitReceipt LogSink::Emit(const nsi::requester::v1::Envelope& envelope) {
  const auto& request = envelope.request();
  NSI_LOG_INFO("outbound envelope",
               {observability::StringField("correlation_id", envelope.header().correlation_id()),
                observability::StringField("operation", model::ToString(codec::FromProto(request.operation()))),
                observability::StringField("provider_connection_id", request.connection_id())});

  std::lock_guard lock(mutex_);
  if (retain_ > 0) {
    if (recent_.size() >= retain_) {
      recent_.erase(recent_.begin());
    }
    recent_.push_back(envelope);
  }
  return {};
}

std::vector<nsi::requester::v1::Envelope> LogSink::Recent() const {
  std::lock_guard lock(mutex_);
  return recent_;
}

} // namespace nsi::transport
