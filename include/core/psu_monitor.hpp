#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "health/power_budget.hpp"
#include "health/power_threshold.hpp"
#include "health/psu_status.hpp"
#include "model/psu_record.hpp"
#include "platform/chassis.hpp"
#include "sinks/state_publisher.hpp"
#include "sinks/state_store.hpp"

namespace psu_agent::core {

struct CycleStats {
  std::size_t psus_polled{0};
  std::size_t poll_failures{0};
  std::size_t power_alarm_transitions{0};
};

// One reconciliation pass over every PSU of the chassis. Owns all per-PSU
// health state; nothing here is shared with other threads.
class PsuMonitor {
 public:
  PsuMonitor(platform::Chassis& chassis, sinks::StateStore& store);

  void seed();
  CycleStats run_cycle();
  void clear();

  [[nodiscard]] const health::PsuStatus* status(std::size_t index) const;
  [[nodiscard]] const health::ChassisPowerBudget* power_budget() const noexcept { return power_budget_.get(); }

 private:
  struct Transitions {
    bool presence_changed{false};
    bool verdict_changed{false};
  };

  std::size_t psu_count();
  std::string psu_key(std::size_t index, platform::Psu& psu) const;
  void update_entity_metadata(std::size_t num_psus);
  model::PsuRecord poll_psu(std::size_t index, platform::Psu& psu) const;
  Transitions update_status(const model::PsuRecord& record, health::PsuStatus& status) const;
  void update_fan_data(const model::PsuRecord& record, const health::PsuStatus& status, platform::Psu& psu);
  void update_led_status();
  void update_power_budget(const health::PsuRecords& records);

  platform::Chassis& chassis_;
  sinks::StatePublisher publisher_;
  std::map<std::size_t, health::PsuStatus> statuses_{};
  std::map<std::size_t, std::string> psu_keys_{};
  health::PsuRecords last_records_{};
  std::map<std::size_t, std::vector<std::string>> fan_keys_{};
  health::SystemPowerThreshold power_threshold_{};
  std::unique_ptr<health::ChassisPowerBudget> power_budget_{};
  std::string parent_name_{sinks::kChassisInfoKey};
};

}  // namespace psu_agent::core
