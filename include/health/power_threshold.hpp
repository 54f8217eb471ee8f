#pragma once

#include <cstddef>
#include <map>

#include "health/psu_status.hpp"
#include "model/psu_record.hpp"

namespace psu_agent::health {

using PsuRecords = std::map<std::size_t, model::PsuRecord>;

// System-wide power alarm. Raised when total draw reaches the critical
// threshold, cleared only once it falls below the warning-suppress threshold.
class SystemPowerThreshold {
 public:
  void begin_cycle() noexcept;

  // Returns true when the alarm bit of `status` changed.
  bool evaluate(const model::PsuRecord& record, const PsuRecords& records, PsuStatus& status);

  static double system_power(const model::PsuRecord& record, const PsuRecords& records) noexcept;

 private:
  void log_transition(bool raised, double system_power, double threshold, const model::PsuRecord& record);

  bool logged_this_cycle_{false};
};

}  // namespace psu_agent::health
