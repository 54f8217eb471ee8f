#pragma once

#include <cstddef>
#include <string>

#include "health/power_budget.hpp"
#include "health/psu_status.hpp"
#include "model/psu_record.hpp"
#include "platform/chassis.hpp"
#include "sinks/state_store.hpp"

namespace psu_agent::sinks {

inline constexpr const char* kChassisInfoTable = "CHASSIS_INFO";
inline constexpr const char* kPsuInfoTable = "PSU_INFO";
inline constexpr const char* kFanInfoTable = "FAN_INFO";
inline constexpr const char* kPhysicalEntityInfoTable = "PHYSICAL_ENTITY_INFO";

inline constexpr const char* kChassisInfoKey = "chassis 1";
inline constexpr const char* kChassisPowerBudgetKey = "chassis_power_budget 1";
inline constexpr const char* kPsuNumField = "psu_num";

platform::LedColor led_color(bool ok) noexcept;

// Owns the table layout and the LED side effects of a cycle.
class StatePublisher {
 public:
  explicit StatePublisher(StateStore& store) : store_(store) {}

  void publish_psu_count(std::size_t num_psus);
  void publish_entity_metadata(const std::string& psu_key, std::size_t position, const std::string& parent_name);
  void publish_psu(const model::PsuRecord& record, const health::PsuStatus& status);
  void publish_psu_led_status(const std::string& psu_key, const std::string& led_status);
  void publish_fan(const model::FanRecord& record, const std::string& led_status);
  void publish_fan_led_status(const std::string& fan_key, const std::string& led_status);
  void publish_power_budget(const health::PowerBudgetUpdate& update);

  // Best-effort LED writes; unsupported or failing hardware only costs a warning.
  void set_psu_led(platform::Psu& psu, const std::string& psu_key, platform::LedColor color);
  void set_master_led(platform::Chassis& chassis, platform::LedColor color);

  void remove_psu(const std::string& psu_key);
  void remove_fan(const std::string& fan_key);
  void remove_chassis();

 private:
  void report(bool ok, const std::string& table, const std::string& key);

  StateStore& store_;
  bool store_was_ok_{true};
};

}  // namespace psu_agent::sinks
