#pragma once
#include "lab-instruments/export.h"
#include "lab-instruments/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace labinst {
namespace scpi {

/// A complete SCPI program message, without its line terminator.
/// Immutable once built; the transport appends the terminator.
class LAB_INSTRUMENTS_API Command {
public:
  Command(std::string text, bool expects_reply)
      : text_(std::move(text)), expects_reply_(expects_reply) {}

  const std::string &text() const { return text_; }
  bool expects_reply() const { return expects_reply_; }

  bool operator==(const Command &other) const {
    return text_ == other.text_ && expects_reply_ == other.expects_reply_;
  }
  bool operator!=(const Command &other) const { return !(*this == other); }

private:
  std::string text_;
  bool expects_reply_;
};

/// How a numeric argument is rendered on the wire
struct NumberStyle {
  NumberFormat format{NumberFormat::Fixed};
  int decimals{12};
  std::string separator{" "};
};

/// Render a number per `style`. Fixed-point output is limited to 15
/// significant digits, has trailing zeros trimmed and never uses an
/// exponent. Throws ArgumentError for non-finite
/// values, magnitudes too large for fixed-point, or a nonzero value that
/// would round to zero at the requested resolution.
LAB_INSTRUMENTS_API std::string format_number(double value,
                                              const NumberStyle &style = {});

/// "<verb> <value>"
LAB_INSTRUMENTS_API Command format_set(const std::string &verb, double value,
                                       const NumberStyle &style = {});

/// "<verb>?". A verb that already contains '?' is used unchanged.
LAB_INSTRUMENTS_API Command format_query(const std::string &verb);

/// "<verb>? <argument>", e.g. "C1:PAVA? RMS"
LAB_INSTRUMENTS_API Command format_query(const std::string &verb,
                                         const std::string &argument);

/// "<verb> <token>" where token matches one of allowed_tokens
/// case-insensitively. The canonical spelling from allowed_tokens is sent.
LAB_INSTRUMENTS_API Command
format_enum(const std::string &verb, const std::string &token,
            const std::vector<std::string> &allowed_tokens,
            const std::string &separator = " ");

/// Bare command such as "*RST"
LAB_INSTRUMENTS_API Command format_action(const std::string &verb);

/// Substitute {ch} in a verb template. Throws ArgumentError when the
/// template needs a channel and none was given.
LAB_INSTRUMENTS_API std::string expand_verb(const std::string &verb_template,
                                            std::optional<int> channel);

LAB_INSTRUMENTS_API bool needs_channel(const std::string &verb_template);

/// Throws ArgumentError if value lies outside [min, max]
LAB_INSTRUMENTS_API void check_range(const std::string &name, double value,
                                     std::optional<double> min,
                                     std::optional<double> max);

} // namespace scpi
} // namespace labinst
