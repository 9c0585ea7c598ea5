#include "lab-instruments/scpi/CommandFormatter.hpp"
#include "lab-instruments/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace labinst {
namespace scpi {

namespace {

constexpr const char *CHANNEL_PLACEHOLDER = "{ch}";
constexpr int MAX_DECIMALS = 17;
// Digits a double carries reliably; more would print binary noise
constexpr int SIGNIFICANT_DIGITS = 15;
// Beyond this a fixed-point rendering no longer carries meaningful digits
constexpr double MAX_FIXED_MAGNITUDE = 1e18;

bool iequals(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::toupper(static_cast<unsigned char>(x)) ==
                  std::toupper(static_cast<unsigned char>(y));
         });
}

std::string trim_fraction(std::string text) {
  if (text.find('.') == std::string::npos) {
    return text;
  }
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text;
}

} // namespace

std::string format_number(double value, const NumberStyle &style) {
  if (!std::isfinite(value)) {
    throw ArgumentError("Cannot format a non-finite value");
  }

  int decimals = std::clamp(style.decimals, 0, MAX_DECIMALS);

  if (style.format == NumberFormat::Scientific) {
    return fmt::format("{:.{}E}", value, decimals);
  }

  if (std::fabs(value) >= MAX_FIXED_MAGNITUDE) {
    throw ArgumentError(
        fmt::format("Value {} is too large for fixed-point output", value));
  }

  if (value != 0.0) {
    int magnitude = static_cast<int>(std::floor(std::log10(std::fabs(value))));
    decimals = std::min(decimals,
                        std::max(0, SIGNIFICANT_DIGITS - 1 - magnitude));
  }

  std::string text = trim_fraction(fmt::format("{:.{}f}", value, decimals));
  if (text == "-0") {
    text = "0";
  }
  if (text == "0" && value != 0.0) {
    throw ArgumentError(fmt::format(
        "Value {} is below the instrument resolution of {} decimals", value,
        decimals));
  }
  return text;
}

Command format_set(const std::string &verb, double value,
                   const NumberStyle &style) {
  return Command(verb + style.separator + format_number(value, style), false);
}

Command format_query(const std::string &verb) {
  if (verb.empty()) {
    throw ArgumentError("Empty query");
  }
  // Already a query, possibly with arguments ("C1:PAVA? RMS")
  if (verb.find('?') != std::string::npos) {
    return Command(verb, true);
  }
  return Command(verb + "?", true);
}

Command format_query(const std::string &verb, const std::string &argument) {
  Command bare = format_query(verb);
  if (argument.empty()) {
    return bare;
  }
  return Command(bare.text() + " " + argument, true);
}

Command format_enum(const std::string &verb, const std::string &token,
                    const std::vector<std::string> &allowed_tokens,
                    const std::string &separator) {
  auto it = std::find_if(
      allowed_tokens.begin(), allowed_tokens.end(),
      [&token](const std::string &allowed) { return iequals(allowed, token); });
  if (it == allowed_tokens.end()) {
    throw ArgumentError(fmt::format("'{}' is not valid for {} (allowed: {})",
                                    token, verb,
                                    fmt::join(allowed_tokens, ", ")));
  }
  return Command(verb + separator + *it, false);
}

Command format_action(const std::string &verb) {
  if (verb.empty()) {
    throw ArgumentError("Empty command");
  }
  return Command(verb, false);
}

bool needs_channel(const std::string &verb_template) {
  return verb_template.find(CHANNEL_PLACEHOLDER) != std::string::npos;
}

std::string expand_verb(const std::string &verb_template,
                        std::optional<int> channel) {
  if (!needs_channel(verb_template)) {
    return verb_template;
  }
  if (!channel) {
    throw ArgumentError(
        fmt::format("Command '{}' requires a channel number", verb_template));
  }
  if (*channel < 0) {
    throw ArgumentError(fmt::format("Invalid channel number {}", *channel));
  }

  std::string result = verb_template;
  std::string number = std::to_string(*channel);
  const std::string placeholder = CHANNEL_PLACEHOLDER;
  size_t pos = 0;
  while ((pos = result.find(placeholder, pos)) != std::string::npos) {
    result.replace(pos, placeholder.size(), number);
    pos += number.size();
  }
  return result;
}

void check_range(const std::string &name, double value,
                 std::optional<double> min, std::optional<double> max) {
  if (min && value < *min) {
    throw ArgumentError(
        fmt::format("{}: value {} is below the minimum {}", name, value, *min));
  }
  if (max && value > *max) {
    throw ArgumentError(
        fmt::format("{}: value {} is above the maximum {}", name, value, *max));
  }
}

} // namespace scpi
} // namespace labinst
