#pragma once

#include <cstdint>
#include <string>

#include "platform/reading.hpp"

namespace psu_agent::platform::sysfs {

// What a missing file means: an attribute the driver does not expose, or a
// configured file that should be there.
enum class Missing : std::uint8_t {
  unsupported,
  failed,
};

Reading<std::string> read_text(const std::string& path, Missing missing);
Reading<double> read_scaled(const std::string& path, double divisor, Missing missing);
Reading<bool> read_flag(const std::string& path, Missing missing);
Command write_text(const std::string& path, const std::string& value);

}  // namespace psu_agent::platform::sysfs
