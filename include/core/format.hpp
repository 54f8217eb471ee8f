#pragma once

#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

#include "model/psu_record.hpp"

namespace psu_agent::core {

inline std::string format_number(const double value) {
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<double>::digits10) << value;
  std::string text = out.str();
  if (text.find_first_of(".eEn") == std::string::npos) {
    text += ".0";
  }
  return text;
}

inline std::string format_optional(const std::optional<double>& value) {
  return value.has_value() ? format_number(*value) : std::string(model::kNotAvailable);
}

inline std::string format_bool(const bool value) { return value ? "true" : "false"; }

inline std::string format_optional(const std::optional<bool>& value) {
  return value.has_value() ? format_bool(*value) : std::string(model::kNotAvailable);
}

}  // namespace psu_agent::core
