#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "platform/description.hpp"
#include "platform/reading.hpp"

namespace psu_agent::platform {

enum class LedColor : std::uint8_t {
  green = 0,
  red = 1,
};

const char* to_string(LedColor color) noexcept;

enum class PsuFlag : std::uint8_t {
  presence,
  power_good,
  replaceable,
};

enum class PsuMetric : std::uint8_t {
  voltage,
  voltage_high_threshold,
  voltage_low_threshold,
  temperature,
  temperature_high_threshold,
  current,
  power,
  input_voltage,
  input_current,
  maximum_supplied_power,
  power_critical_threshold,
  power_warning_suppress_threshold,
};

enum class PsuInfo : std::uint8_t {
  name,
  model,
  serial,
  revision,
};

class Fan {
 public:
  virtual Reading<std::string> name() = 0;
  virtual Reading<bool> presence() = 0;
  virtual Reading<bool> status() = 0;
  virtual Reading<std::string> direction() = 0;
  virtual Reading<double> speed() = 0;
  virtual Reading<std::string> status_led() = 0;
  virtual Command set_status_led(LedColor color) = 0;
  virtual ~Fan() = default;
};

class Psu {
 public:
  virtual Reading<bool> flag(PsuFlag flag) = 0;
  virtual Reading<double> metric(PsuMetric metric) = 0;
  virtual Reading<std::string> info(PsuInfo info) = 0;
  virtual Reading<std::size_t> position_in_parent() = 0;
  virtual Reading<std::string> status_led() = 0;
  virtual Command set_status_led(LedColor color) = 0;
  virtual std::size_t num_fans() = 0;
  virtual Fan* fan(std::size_t position) = 0;
  virtual ~Psu() = default;
};

// Fan drawers and line cards only matter as power consumers here.
class PowerConsumer {
 public:
  virtual Reading<std::string> name() = 0;
  virtual Reading<bool> presence() = 0;
  virtual Reading<double> maximum_consumed_power() = 0;
  virtual ~PowerConsumer() = default;
};

class Chassis {
 public:
  virtual Reading<std::string> name() = 0;
  virtual Reading<std::size_t> num_psus() = 0;
  // Zero-based position; nullptr when the PSU is not enumerated.
  virtual Psu* psu(std::size_t position) = 0;
  virtual std::size_t num_fan_drawers() = 0;
  virtual PowerConsumer* fan_drawer(std::size_t position) = 0;
  virtual std::size_t num_modules() = 0;
  virtual PowerConsumer* module(std::size_t position) = 0;
  virtual bool is_modular() = 0;
  virtual Command set_status_master_led(LedColor color) = 0;
  virtual ~Chassis() = default;
};

std::unique_ptr<Chassis> make_hwmon_chassis(PlatformDescription description);
std::unique_ptr<Chassis> make_legacy_chassis(std::string root, std::size_t num_psus);

}  // namespace psu_agent::platform
