#pragma once
#include "lab-instruments/export.h"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace labinst {
namespace scpi {

/// One entry of the instrument error queue (SYST:ERR?)
struct LAB_INSTRUMENTS_API ErrorQueueEntry {
  int code{0};
  std::string description;

  bool ok() const { return code == 0; }
  nlohmann::json to_json() const;
};

/// Fields of an IEEE 488.2 *IDN? reply
struct LAB_INSTRUMENTS_API Identity {
  std::string manufacturer;
  std::string model;
  std::string serial;
  std::string firmware;

  nlohmann::json to_json() const;
};

/// Strip whitespace and line terminators from both ends
LAB_INSTRUMENTS_API std::string strip_reply(const std::string &reply);

/// Parse the whole reply as a floating-point number.
/// Throws ParseError if anything but a number is present.
LAB_INSTRUMENTS_API double parse_number(const std::string &reply);

/// Parse one comma-separated field; a negative index counts from the end.
/// The field may carry a trailing unit suffix ("1.23V").
LAB_INSTRUMENTS_API double parse_number_field(const std::string &reply,
                                              int index);

/// Parse an ASCII comma-separated list of numbers
LAB_INSTRUMENTS_API std::vector<double>
parse_number_list(const std::string &reply);

/// 1/0/ON/OFF, case-insensitive
LAB_INSTRUMENTS_API bool parse_bool(const std::string &reply);

/// Strip whitespace and one pair of surrounding quotes
LAB_INSTRUMENTS_API std::string parse_identifier(const std::string &reply);

LAB_INSTRUMENTS_API Identity parse_identity(const std::string &reply);

/// Parse `<code>,"<description>"` without raising for nonzero codes
LAB_INSTRUMENTS_API ErrorQueueEntry parse_error_entry(const std::string &reply);

/// Parse an error queue reply. Code 0 is returned as success; any other
/// code raises DeviceError(code, description).
LAB_INSTRUMENTS_API ErrorQueueEntry parse_error_queue(const std::string &reply);

} // namespace scpi
} // namespace labinst
