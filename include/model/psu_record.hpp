#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace psu_agent::model {

// Published in place of a reading the hardware could not provide.
inline constexpr const char* kNotAvailable = "N/A";

// Snapshot of one PSU taken during the current cycle.
struct PsuRecord {
  std::size_t index{0};
  std::string name{};

  bool presence{false};
  bool power_good{false};
  std::optional<bool> replaceable{};

  std::optional<double> voltage{};
  std::optional<double> voltage_high_threshold{};
  std::optional<double> voltage_low_threshold{};
  std::optional<double> temperature{};
  std::optional<double> temperature_high_threshold{};
  std::optional<double> current{};
  std::optional<double> power{};
  std::optional<double> input_voltage{};
  std::optional<double> input_current{};
  std::optional<double> maximum_supplied_power{};
  std::optional<double> power_critical_threshold{};
  std::optional<double> power_warning_suppress_threshold{};

  std::string model{kNotAvailable};
  std::string serial{kNotAvailable};
  std::string revision{kNotAvailable};
};

struct FanRecord {
  std::string name{};
  bool presence{false};
  std::optional<bool> status{};
  std::string direction{kNotAvailable};
  std::optional<double> speed{};
  std::string timestamp{};
};

}  // namespace psu_agent::model
