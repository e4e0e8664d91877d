#pragma once

#include <stdexcept>
#include <string>

namespace nsi::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operator intent not legal for the connection's current sub-states.
class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A pending operation of the same family already exists for the connection.
class ConflictingOperation : public std::runtime_error {
 public:
  explicit ConflictingOperation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Implementation or protocol-version mismatch, e.g. an event kind the
  transition tables do not know. Never a reachable runtime scenario.
*/
class ProtocolDefect : public std::logic_error {
 public:
  explicit ProtocolDefect(const std::string& msg) : std::logic_error(msg) {
  }
};

} // namespace nsi::util
