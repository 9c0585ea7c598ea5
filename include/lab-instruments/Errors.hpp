#pragma once
#include "lab-instruments/export.h"

#include <stdexcept>
#include <string>

namespace labinst {

/// Base of every error raised by the library
class LAB_INSTRUMENTS_API InstrumentError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Endpoint unreachable, unresolvable, or handshake timed out
class LAB_INSTRUMENTS_API ConnectionError : public InstrumentError {
public:
  using InstrumentError::InstrumentError;
};

/// No complete reply within the I/O deadline
class LAB_INSTRUMENTS_API TimeoutError : public InstrumentError {
public:
  using InstrumentError::InstrumentError;
};

/// Connection dropped, closed, or a write was refused
class LAB_INSTRUMENTS_API TransportError : public InstrumentError {
public:
  using InstrumentError::InstrumentError;
};

/// Unit symbol not recognized for the quantity kind
class LAB_INSTRUMENTS_API UnitError : public InstrumentError {
public:
  using InstrumentError::InstrumentError;
};

/// Value outside the allowed set or range, or an unknown operation
class LAB_INSTRUMENTS_API ArgumentError : public InstrumentError {
public:
  using InstrumentError::InstrumentError;
};

/// Reply text does not match the expected grammar
class LAB_INSTRUMENTS_API ParseError : public InstrumentError {
public:
  using InstrumentError::InstrumentError;
};

/// Request/response ordering violated
class LAB_INSTRUMENTS_API ProtocolError : public InstrumentError {
public:
  using InstrumentError::InstrumentError;
};

/// Capability table missing, unreadable, or malformed
class LAB_INSTRUMENTS_API ConfigError : public InstrumentError {
public:
  using InstrumentError::InstrumentError;
};

/// Nonzero entry reported by the instrument's error queue
class LAB_INSTRUMENTS_API DeviceError : public InstrumentError {
public:
  DeviceError(int code, std::string description);

  int code() const { return code_; }
  const std::string &description() const { return description_; }

private:
  int code_;
  std::string description_;
};

} // namespace labinst
