#pragma once
#include "lab-instruments/export.h"
#include "lab-instruments/types.hpp"

#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace labinst {

/// Structural checks on capability table YAML. Reports every problem found
/// rather than stopping at the first.
class LAB_INSTRUMENTS_API CapabilityValidator {
public:
  static ValidationResult validate(const YAML::Node &doc);
  static ValidationResult validate_file(const std::string &yaml_path);

  /// Accepts LF, CR, CRLF, a literal terminator, or one written with
  /// backslash escapes ("\\r\\n"). Empty optional if unusable.
  static std::optional<std::string> decode_terminator(const std::string &text);
};

} // namespace labinst
