#include "health/power_threshold.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace psu_agent::health {

void SystemPowerThreshold::begin_cycle() noexcept { logged_this_cycle_ = false; }

double SystemPowerThreshold::system_power(const model::PsuRecord& record, const PsuRecords& records) noexcept {
  double total = record.power.value_or(0.0);
  for (const auto& [index, other] : records) {
    if (index == record.index || !other.presence || !other.power.has_value()) {
      continue;
    }
    total += *other.power;
  }
  return total;
}

bool SystemPowerThreshold::evaluate(const model::PsuRecord& record, const PsuRecords& records, PsuStatus& status) {
  if (!status.check_power_threshold()) {
    return false;
  }

  if (!record.power_critical_threshold || !record.power_warning_suppress_threshold) {
    std::cerr << "[psu] ERROR " << record.name
              << " power thresholds became unavailable; disabling power threshold check\n";
    const bool was_exceeded = status.power_exceeded_threshold();
    status.disarm_power_threshold();
    return was_exceeded;
  }

  if (!record.power) {
    return false;
  }

  const double total = system_power(record, records);
  if (status.power_exceeded_threshold()) {
    if (total < *record.power_warning_suppress_threshold) {
      status.set_power_exceeded_threshold(false);
      log_transition(false, total, *record.power_warning_suppress_threshold, record);
      return true;
    }
  } else if (total >= *record.power_critical_threshold) {
    status.set_power_exceeded_threshold(true);
    log_transition(true, total, *record.power_critical_threshold, record);
    return true;
  }
  return false;
}

void SystemPowerThreshold::log_transition(const bool raised, const double system_power, const double threshold,
                                          const model::PsuRecord& record) {
  if (logged_this_cycle_) {
    return;
  }
  logged_this_cycle_ = true;

  std::ostringstream line;
  line << std::fixed << std::setprecision(1);
  if (raised) {
    line << "[psu] WARNING system power " << system_power << " W exceeds the critical threshold " << threshold
         << " W of " << record.name;
  } else {
    line << "[psu] NOTICE system power " << system_power << " W dropped below the warning-suppress threshold "
         << threshold << " W of " << record.name;
  }
  std::cerr << line.str() << '\n';
}

}  // namespace psu_agent::health
