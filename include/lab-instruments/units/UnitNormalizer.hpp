#pragma once
#include "lab-instruments/export.h"
#include "lab-instruments/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace labinst {
namespace units {

/// Convert a magnitude in `unit` to the base unit of `kind`
/// (Hz, dBm, V, A). Unit symbols are case-sensitive.
/// Throws UnitError for an unknown unit and ArgumentError when the value
/// cannot be represented (non-finite, overflow, non-positive linear power).
LAB_INSTRUMENTS_API double to_base(double magnitude, const std::string &unit,
                                   QuantityKind kind);

/// Inverse of to_base
LAB_INSTRUMENTS_API double from_base(double magnitude, QuantityKind kind,
                                     const std::string &preferred_unit);

LAB_INSTRUMENTS_API bool is_unit_of(const std::string &unit,
                                    QuantityKind kind);

/// Throws UnitError unless `unit` belongs to `kind`
LAB_INSTRUMENTS_API void require_unit(const std::string &unit,
                                      QuantityKind kind);

LAB_INSTRUMENTS_API const std::vector<std::string> &
units_for(QuantityKind kind);

LAB_INSTRUMENTS_API const std::string &base_unit(QuantityKind kind);

LAB_INSTRUMENTS_API std::string kind_name(QuantityKind kind);

LAB_INSTRUMENTS_API std::optional<QuantityKind>
parse_kind(const std::string &name);

} // namespace units
} // namespace labinst
