#pragma once
#include "lab-instruments/export.h"
#include "lab-instruments/types.hpp"

#include <chrono>
#include <string>

namespace labinst {
namespace transport {

/// Line-oriented byte stream to one instrument.
///
/// Implementations frame each outgoing command with the terminator and
/// return one reply line per receive(). They never pipeline: ordering of
/// requests and replies is the session's responsibility.
class LAB_INSTRUMENTS_API Transport {
public:
  virtual ~Transport() = default;

  /// Throws ConnectionError if the endpoint cannot be reached in time
  virtual void connect(const Address &address,
                       std::chrono::milliseconds timeout) = 0;

  /// Write `command` plus the terminator. Throws TransportError.
  virtual void send(const std::string &command) = 0;

  /// Read one terminated line, terminator stripped.
  /// Throws TimeoutError or TransportError.
  virtual std::string receive(std::chrono::milliseconds timeout) = 0;

  /// Drop any input already received or pending, without blocking
  virtual void flush_input() = 0;

  /// Idempotent. Unblocks a receive() running on another thread.
  virtual void close() = 0;

  virtual bool is_open() const = 0;

  /// Short transport name for logs, e.g. "lan"
  virtual std::string name() const = 0;
};

} // namespace transport
} // namespace labinst
