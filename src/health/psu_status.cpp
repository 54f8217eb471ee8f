#include "health/psu_status.hpp"

namespace psu_agent::health {

bool PsuStatus::set_presence(const bool presence) noexcept {
  if (presence == presence_) {
    return false;
  }
  presence_ = presence;
  if (!presence_) {
    disarm_power_threshold();
  }
  return true;
}

bool PsuStatus::set_power_good(const bool power_good) noexcept {
  if (power_good == power_good_) {
    return false;
  }
  power_good_ = power_good;
  if (!power_good_) {
    disarm_power_threshold();
  }
  return true;
}

bool PsuStatus::set_voltage(const std::optional<double> voltage, const std::optional<double> high_threshold,
                            const std::optional<double> low_threshold) noexcept {
  if (!voltage || !high_threshold || !low_threshold) {
    if (!voltage_good_) {
      voltage_good_ = true;
      return true;
    }
    return false;
  }

  const bool voltage_good = *low_threshold <= *voltage && *voltage <= *high_threshold;
  if (voltage_good == voltage_good_) {
    return false;
  }
  voltage_good_ = voltage_good;
  return true;
}

bool PsuStatus::set_temperature(const std::optional<double> temperature,
                                const std::optional<double> high_threshold) noexcept {
  if (!temperature || !high_threshold) {
    if (!temperature_good_) {
      temperature_good_ = true;
      return true;
    }
    return false;
  }

  const bool temperature_good = *temperature < *high_threshold;
  if (temperature_good == temperature_good_) {
    return false;
  }
  temperature_good_ = temperature_good;
  return true;
}

bool PsuStatus::set_power_exceeded_threshold(const bool exceeded) noexcept {
  if (exceeded == power_exceeded_threshold_) {
    return false;
  }
  power_exceeded_threshold_ = exceeded;
  return true;
}

void PsuStatus::arm_power_threshold() noexcept { check_power_threshold_ = true; }

void PsuStatus::disarm_power_threshold() noexcept {
  check_power_threshold_ = false;
  power_exceeded_threshold_ = false;
}

void PsuStatus::mark_polled() noexcept { first_poll_ = false; }

bool PsuStatus::is_ok() const noexcept {
  return presence_ && power_good_ && voltage_good_ && temperature_good_;
}

}  // namespace psu_agent::health
