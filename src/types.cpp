#include "lab-instruments/types.hpp"
#include "lab-instruments/Errors.hpp"

#include <cstdlib>
#include <fmt/format.h>

namespace labinst {

Address Address::parse(const std::string &text, uint16_t default_port) {
  Address address;
  address.port = default_port;

  // Bracketed IPv6 literal: [::1]:5025
  if (!text.empty() && text.front() == '[') {
    auto close = text.find(']');
    if (close == std::string::npos) {
      throw ArgumentError("Unterminated IPv6 address: " + text);
    }
    address.host = text.substr(1, close - 1);
    if (close + 1 < text.size()) {
      if (text[close + 1] != ':') {
        throw ArgumentError("Malformed address: " + text);
      }
      std::string port = text.substr(close + 2);
      char *end = nullptr;
      long value = std::strtol(port.c_str(), &end, 10);
      if (port.empty() || *end != '\0' || value <= 0 || value > 65535) {
        throw ArgumentError("Invalid port in address: " + text);
      }
      address.port = static_cast<uint16_t>(value);
    }
  } else {
    auto colon = text.rfind(':');
    // A bare IPv6 literal has several colons and no port
    if (colon != std::string::npos && text.find(':') == colon) {
      address.host = text.substr(0, colon);
      std::string port = text.substr(colon + 1);
      char *end = nullptr;
      long value = std::strtol(port.c_str(), &end, 10);
      if (port.empty() || *end != '\0' || value <= 0 || value > 65535) {
        throw ArgumentError("Invalid port in address: " + text);
      }
      address.port = static_cast<uint16_t>(value);
    } else {
      address.host = text;
    }
  }

  if (address.host.empty()) {
    throw ArgumentError("Empty host in address: " + text);
  }
  return address;
}

std::string Address::to_string() const {
  if (host.find(':') != std::string::npos) {
    return fmt::format("[{}]:{}", host, port);
  }
  return fmt::format("{}:{}", host, port);
}

std::string to_string(OperationKind kind) {
  switch (kind) {
  case OperationKind::Set:
    return "set";
  case OperationKind::Query:
    return "query";
  case OperationKind::State:
    return "state";
  case OperationKind::Action:
    return "action";
  }
  return "unknown";
}

std::string to_string(ReturnType type) {
  switch (type) {
  case ReturnType::None:
    return "none";
  case ReturnType::Number:
    return "number";
  case ReturnType::Text:
    return "text";
  case ReturnType::Bool:
    return "bool";
  case ReturnType::List:
    return "list";
  }
  return "unknown";
}

std::optional<OperationKind> parse_operation_kind(const std::string &name) {
  if (name == "set")
    return OperationKind::Set;
  if (name == "query")
    return OperationKind::Query;
  if (name == "state")
    return OperationKind::State;
  if (name == "action")
    return OperationKind::Action;
  return std::nullopt;
}

std::optional<ReturnType> parse_return_type(const std::string &name) {
  if (name == "none")
    return ReturnType::None;
  if (name == "number")
    return ReturnType::Number;
  if (name == "text")
    return ReturnType::Text;
  if (name == "bool")
    return ReturnType::Bool;
  if (name == "list")
    return ReturnType::List;
  return std::nullopt;
}

} // namespace labinst
