#include "lab-instruments/units/UnitNormalizer.hpp"
#include "lab-instruments/Errors.hpp"

#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <map>

namespace labinst {
namespace units {

namespace {

// Power units other than dBm are linear and convert logarithmically
struct UnitDef {
  double scale;      // linear factor to the base (or to mW for power)
  bool logarithmic;  // true for linear power units expressed against dBm
};

const std::map<std::string, UnitDef> &unit_table(QuantityKind kind) {
  static const std::map<std::string, UnitDef> frequency = {
      {"Hz", {1.0, false}},
      {"kHz", {1e3, false}},
      {"MHz", {1e6, false}},
      {"GHz", {1e9, false}},
  };
  static const std::map<std::string, UnitDef> power = {
      {"dBm", {1.0, false}},
      {"mW", {1.0, true}},
      {"W", {1e3, true}},
  };
  static const std::map<std::string, UnitDef> voltage = {
      {"V", {1.0, false}},
      {"mV", {1e-3, false}},
      {"uV", {1e-6, false}},
  };
  static const std::map<std::string, UnitDef> current = {
      {"A", {1.0, false}},
      {"mA", {1e-3, false}},
      {"uA", {1e-6, false}},
  };

  switch (kind) {
  case QuantityKind::Frequency:
    return frequency;
  case QuantityKind::Power:
    return power;
  case QuantityKind::Voltage:
    return voltage;
  case QuantityKind::Current:
    return current;
  }
  return frequency;
}

const UnitDef &lookup(const std::string &unit, QuantityKind kind) {
  const auto &table = unit_table(kind);
  auto it = table.find(unit);
  if (it == table.end()) {
    throw UnitError(
        fmt::format("Unit '{}' is not a {} unit (expected one of: {})", unit,
                    kind_name(kind), fmt::join(units_for(kind), ", ")));
  }
  return it->second;
}

void require_finite(double value, const std::string &what) {
  if (!std::isfinite(value)) {
    throw ArgumentError(fmt::format("{} is not a finite number", what));
  }
}

} // namespace

double to_base(double magnitude, const std::string &unit, QuantityKind kind) {
  const UnitDef &def = lookup(unit, kind);
  require_finite(magnitude, "Magnitude");

  double result;
  if (def.logarithmic) {
    if (magnitude <= 0.0) {
      throw ArgumentError(fmt::format(
          "Power {} {} cannot be expressed in dBm", magnitude, unit));
    }
    result = 10.0 * std::log10(magnitude * def.scale);
  } else {
    result = magnitude * def.scale;
  }

  if (!std::isfinite(result)) {
    throw ArgumentError(fmt::format("{} {} overflows when converted to {}",
                                    magnitude, unit, base_unit(kind)));
  }
  return result;
}

double from_base(double magnitude, QuantityKind kind,
                 const std::string &preferred_unit) {
  const UnitDef &def = lookup(preferred_unit, kind);
  require_finite(magnitude, "Magnitude");

  double result;
  if (def.logarithmic) {
    result = std::pow(10.0, magnitude / 10.0) / def.scale;
  } else {
    result = magnitude / def.scale;
  }

  if (!std::isfinite(result)) {
    throw ArgumentError(fmt::format("{} {} overflows when converted to {}",
                                    magnitude, base_unit(kind),
                                    preferred_unit));
  }
  return result;
}

bool is_unit_of(const std::string &unit, QuantityKind kind) {
  return unit_table(kind).count(unit) > 0;
}

void require_unit(const std::string &unit, QuantityKind kind) {
  lookup(unit, kind);
}

const std::vector<std::string> &units_for(QuantityKind kind) {
  static const std::vector<std::string> frequency = {"Hz", "kHz", "MHz",
                                                     "GHz"};
  static const std::vector<std::string> power = {"dBm", "W", "mW"};
  static const std::vector<std::string> voltage = {"V", "mV", "uV"};
  static const std::vector<std::string> current = {"A", "mA", "uA"};

  switch (kind) {
  case QuantityKind::Frequency:
    return frequency;
  case QuantityKind::Power:
    return power;
  case QuantityKind::Voltage:
    return voltage;
  case QuantityKind::Current:
    return current;
  }
  return frequency;
}

const std::string &base_unit(QuantityKind kind) {
  return units_for(kind).front();
}

std::string kind_name(QuantityKind kind) {
  switch (kind) {
  case QuantityKind::Frequency:
    return "frequency";
  case QuantityKind::Power:
    return "power";
  case QuantityKind::Voltage:
    return "voltage";
  case QuantityKind::Current:
    return "current";
  }
  return "unknown";
}

std::optional<QuantityKind> parse_kind(const std::string &name) {
  if (name == "frequency")
    return QuantityKind::Frequency;
  if (name == "power")
    return QuantityKind::Power;
  if (name == "voltage")
    return QuantityKind::Voltage;
  if (name == "current")
    return QuantityKind::Current;
  return std::nullopt;
}

} // namespace units
} // namespace labinst
