#pragma once

#include <optional>

namespace psu_agent::health {

// Debounced health verdicts for one PSU. Every setter returns true only when
// the verdict actually flips.
class PsuStatus {
 public:
  bool set_presence(bool presence) noexcept;
  bool set_power_good(bool power_good) noexcept;
  bool set_voltage(std::optional<double> voltage, std::optional<double> high_threshold,
                   std::optional<double> low_threshold) noexcept;
  bool set_temperature(std::optional<double> temperature, std::optional<double> high_threshold) noexcept;
  bool set_power_exceeded_threshold(bool exceeded) noexcept;

  void arm_power_threshold() noexcept;
  // Also drops a latched power alarm without reporting it as a transition.
  void disarm_power_threshold() noexcept;
  void mark_polled() noexcept;

  [[nodiscard]] bool is_ok() const noexcept;
  [[nodiscard]] bool presence() const noexcept { return presence_; }
  [[nodiscard]] bool power_good() const noexcept { return power_good_; }
  [[nodiscard]] bool voltage_good() const noexcept { return voltage_good_; }
  [[nodiscard]] bool temperature_good() const noexcept { return temperature_good_; }
  [[nodiscard]] bool check_power_threshold() const noexcept { return check_power_threshold_; }
  [[nodiscard]] bool power_exceeded_threshold() const noexcept { return power_exceeded_threshold_; }
  [[nodiscard]] bool first_poll() const noexcept { return first_poll_; }

 private:
  bool presence_{true};
  bool power_good_{true};
  bool voltage_good_{true};
  bool temperature_good_{true};
  bool check_power_threshold_{false};
  bool power_exceeded_threshold_{false};
  bool first_poll_{true};
};

}  // namespace psu_agent::health
