#include "lab-instruments/scpi/ReplyParser.hpp"
#include "lab-instruments/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>

namespace labinst {
namespace scpi {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::vector<std::string> split_fields(const std::string &text) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    size_t comma = text.find(',', start);
    fields.push_back(strip_reply(text.substr(start, comma - start)));
    if (comma == std::string::npos)
      break;
    start = comma + 1;
  }
  return fields;
}

// Parses the leading number of `text`; returns the number of characters
// consumed, 0 if there is no number.
size_t parse_leading_number(const std::string &text, double &value) {
  if (text.empty())
    return 0;

  char first = text.front();
  if (!(std::isdigit(static_cast<unsigned char>(first)) || first == '+' ||
        first == '-' || first == '.')) {
    return 0;
  }
  // strtod would also accept hex floats, inf and nan
  if (text.find_first_of("xX") != std::string::npos) {
    return 0;
  }

  const char *begin = text.c_str();
  char *end = nullptr;
  errno = 0;
  value = std::strtod(begin, &end);
  if (end == begin || !std::isfinite(value)) {
    return 0;
  }
  return static_cast<size_t>(end - begin);
}

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  return text;
}

} // namespace

nlohmann::json ErrorQueueEntry::to_json() const {
  nlohmann::json j;
  j["code"] = code;
  j["description"] = description;
  return j;
}

nlohmann::json Identity::to_json() const {
  nlohmann::json j;
  j["manufacturer"] = manufacturer;
  j["model"] = model;
  j["serial"] = serial;
  j["firmware"] = firmware;
  return j;
}

std::string strip_reply(const std::string &reply) {
  auto begin = std::find_if_not(reply.begin(), reply.end(), is_space);
  auto end = std::find_if_not(reply.rbegin(), reply.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

double parse_number(const std::string &reply) {
  std::string text = strip_reply(reply);
  double value = 0.0;
  size_t consumed = parse_leading_number(text, value);
  if (consumed == 0 || consumed != text.size()) {
    throw ParseError(fmt::format("Reply is not a number: '{}'", text));
  }
  return value;
}

double parse_number_field(const std::string &reply, int index) {
  auto fields = split_fields(strip_reply(reply));
  int count = static_cast<int>(fields.size());
  int position = index < 0 ? count + index : index;
  if (position < 0 || position >= count) {
    throw ParseError(fmt::format("Reply '{}' has no field {}",
                                 strip_reply(reply), index));
  }

  const std::string &field = fields[static_cast<size_t>(position)];
  double value = 0.0;
  size_t consumed = parse_leading_number(field, value);
  if (consumed == 0) {
    throw ParseError(fmt::format("Field '{}' is not a number", field));
  }

  // Only a unit suffix may follow the number
  for (size_t i = consumed; i < field.size(); ++i) {
    char c = field[i];
    if (!(std::isalpha(static_cast<unsigned char>(c)) || c == '%' ||
          is_space(c))) {
      throw ParseError(fmt::format("Field '{}' is not a number", field));
    }
  }
  return value;
}

std::vector<double> parse_number_list(const std::string &reply) {
  std::string text = strip_reply(reply);
  std::vector<double> values;
  if (text.empty()) {
    return values;
  }
  for (const auto &field : split_fields(text)) {
    values.push_back(parse_number(field));
  }
  return values;
}

bool parse_bool(const std::string &reply) {
  std::string text = upper(strip_reply(reply));
  if (text == "ON")
    return true;
  if (text == "OFF")
    return false;

  double value = 0.0;
  size_t consumed = parse_leading_number(text, value);
  if (consumed == text.size() && consumed > 0) {
    if (value == 1.0)
      return true;
    if (value == 0.0)
      return false;
  }
  throw ParseError(fmt::format("Reply is not a boolean state: '{}'", text));
}

std::string parse_identifier(const std::string &reply) {
  std::string text = strip_reply(reply);
  if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') &&
      text.back() == text.front()) {
    text = strip_reply(text.substr(1, text.size() - 2));
  }
  return text;
}

Identity parse_identity(const std::string &reply) {
  std::string text = parse_identifier(reply);
  if (text.empty()) {
    throw ParseError("Empty identification reply");
  }

  auto fields = split_fields(text);
  Identity identity;
  identity.manufacturer = fields[0];
  if (fields.size() > 1)
    identity.model = fields[1];
  if (fields.size() > 2)
    identity.serial = fields[2];
  if (fields.size() > 3)
    identity.firmware = fields[3];
  return identity;
}

ErrorQueueEntry parse_error_entry(const std::string &reply) {
  std::string text = strip_reply(reply);
  auto comma = text.find(',');
  if (comma == std::string::npos) {
    throw ParseError(fmt::format("Malformed error queue entry: '{}'", text));
  }

  std::string code_text = strip_reply(text.substr(0, comma));
  char *end = nullptr;
  errno = 0;
  long code = std::strtol(code_text.c_str(), &end, 10);
  if (code_text.empty() || *end != '\0' || errno == ERANGE ||
      code < INT_MIN || code > INT_MAX) {
    throw ParseError(fmt::format("Malformed error code in: '{}'", text));
  }

  ErrorQueueEntry entry;
  entry.code = static_cast<int>(code);
  entry.description = parse_identifier(text.substr(comma + 1));
  return entry;
}

ErrorQueueEntry parse_error_queue(const std::string &reply) {
  ErrorQueueEntry entry = parse_error_entry(reply);
  if (!entry.ok()) {
    throw DeviceError(entry.code, entry.description);
  }
  return entry;
}

} // namespace scpi
} // namespace labinst
