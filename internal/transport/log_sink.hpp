#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include "message_sink.hpp"

namespace nsi::transport {

/*
  Sink used when no relay is configured: logs every envelope and keeps the
  most recent ones in memory for inspection.
*/
class LogSink final : public MessageSink {
 public:
  explicit LogSink(std::size_t retain = 256);

  EmitReceipt Emit(const nsi::requester::v1::Envelope& envelope) override;

  std::vector<nsi::requester::v1::Envelope> Recent() const;

 private:
  std::size_t retain_;

  mutable std::mutex                        mutex_;
  std::vector<nsi::requester::v1::Envelope> recent_;
};

} // namespace nsi::transport
