#pragma once
#include "lab-instruments/export.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace labinst {

constexpr uint16_t DEFAULT_SCPI_PORT = 5025;

/// Network endpoint of one instrument
struct LAB_INSTRUMENTS_API Address {
  std::string host;
  uint16_t port{DEFAULT_SCPI_PORT};

  /// Parse "host" or "host:port". Throws ArgumentError on a bad port.
  static Address parse(const std::string &text,
                       uint16_t default_port = DEFAULT_SCPI_PORT);

  std::string to_string() const;
};

struct Timeouts {
  std::chrono::milliseconds connect_timeout{3000};
  std::chrono::milliseconds io_timeout{5000};
};

enum class QuantityKind { Frequency, Power, Voltage, Current };

struct Quantity {
  double magnitude{0.0};
  std::string unit;
};

enum class OperationKind {
  Set,    // "<verb> <number>"
  Query,  // "<verb>?" -> typed reply
  State,  // "<verb> <token>" from an allowed token set
  Action, // "<verb>" with no argument
};

enum class ReturnType { None, Number, Text, Bool, List };

enum class NumberFormat { Fixed, Scientific };

/// One row of a capability table
struct Operation {
  std::string name;
  OperationKind kind{OperationKind::Action};
  std::string verb; // may contain a {ch} placeholder
  std::optional<std::string> description;

  // Numeric arguments and replies
  std::optional<QuantityKind> quantity;
  std::vector<std::string> units; // accepted subset, empty = all of the kind
  std::optional<double> min;      // base units
  std::optional<double> max;      // base units
  int decimals{12};
  NumberFormat number_format{NumberFormat::Fixed};
  std::optional<std::string> wire_unit;
  std::string separator{" "};

  // Enumerated arguments
  std::vector<std::string> tokens;

  // Raw commands sent before the operation itself
  std::vector<std::string> setup;

  // Replies
  ReturnType returns{ReturnType::None};
  bool raw{false}; // query verb sent as-is, without an appended '?'
  std::optional<int> reply_field;
};

struct InstrumentMetadata {
  std::string vendor;
  std::string model;
  std::optional<std::string> description;
};

struct ConnectionDefaults {
  uint16_t port{DEFAULT_SCPI_PORT};
  std::string terminator{"\n"};
  Timeouts timeouts;
  int banner_lines{0};
  std::string prompt; // stripped from the start of reply lines
  bool ieee488{true};
};

struct ValidationError {
  std::string path;
  std::string message;
};

struct ValidationResult {
  bool valid{true};
  std::vector<ValidationError> errors;
};

LAB_INSTRUMENTS_API std::string to_string(OperationKind kind);
LAB_INSTRUMENTS_API std::string to_string(ReturnType type);
LAB_INSTRUMENTS_API std::optional<OperationKind>
parse_operation_kind(const std::string &name);
LAB_INSTRUMENTS_API std::optional<ReturnType>
parse_return_type(const std::string &name);

} // namespace labinst
