#include "lab-instruments/Errors.hpp"

#include <fmt/format.h>
#include <utility>

namespace labinst {

DeviceError::DeviceError(int code, std::string description)
    : InstrumentError(
          fmt::format("Instrument error {}: {}", code, description)),
      code_(code), description_(std::move(description)) {}

} // namespace labinst
