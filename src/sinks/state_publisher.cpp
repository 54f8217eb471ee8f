#include "sinks/state_publisher.hpp"

#include <iostream>

#include "core/format.hpp"

namespace psu_agent::sinks {
namespace {

using core::format_bool;
using core::format_optional;

void warn_led_failure(const platform::Command& result, const std::string& target, const platform::LedColor color) {
  if (result.is_ok()) {
    return;
  }
  if (result.is_unsupported()) {
    std::cerr << "[psu] WARNING set_status_led(" << platform::to_string(color) << ") not supported by " << target
              << '\n';
    return;
  }
  std::cerr << "[psu] WARNING failed to set " << target << " LED to " << platform::to_string(color) << ": "
            << result.error << '\n';
}

}  // namespace

platform::LedColor led_color(const bool ok) noexcept {
  return ok ? platform::LedColor::green : platform::LedColor::red;
}

void StatePublisher::publish_psu_count(const std::size_t num_psus) {
  report(store_.set(kChassisInfoTable, kChassisInfoKey, {{kPsuNumField, std::to_string(num_psus)}}),
         kChassisInfoTable, kChassisInfoKey);
}

void StatePublisher::publish_entity_metadata(const std::string& psu_key, const std::size_t position,
                                             const std::string& parent_name) {
  report(store_.set(kPhysicalEntityInfoTable, psu_key,
                    {{"position_in_parent", std::to_string(position)}, {"parent_name", parent_name}}),
         kPhysicalEntityInfoTable, psu_key);
}

void StatePublisher::publish_psu(const model::PsuRecord& record, const health::PsuStatus& status) {
  const FieldValues fields = {
      {"model", record.model},
      {"serial", record.serial},
      {"revision", record.revision},
      {"temp", format_optional(record.temperature)},
      {"temp_threshold", format_optional(record.temperature_high_threshold)},
      {"voltage", format_optional(record.voltage)},
      {"voltage_min_threshold", format_optional(record.voltage_low_threshold)},
      {"voltage_max_threshold", format_optional(record.voltage_high_threshold)},
      {"current", format_optional(record.current)},
      {"power", format_optional(record.power)},
      {"power_warning_suppress_threshold", format_optional(record.power_warning_suppress_threshold)},
      {"power_critical_threshold", format_optional(record.power_critical_threshold)},
      {"power_overload", format_bool(status.power_exceeded_threshold())},
      {"is_replaceable", format_optional(record.replaceable)},
      {"input_voltage", format_optional(record.input_voltage)},
      {"input_current", format_optional(record.input_current)},
      {"max_power", format_optional(record.maximum_supplied_power)},
      {"presence", format_bool(record.presence)},
      {"status", format_bool(record.presence && record.power_good)},
  };
  report(store_.set(kPsuInfoTable, record.name, fields), kPsuInfoTable, record.name);
}

void StatePublisher::publish_psu_led_status(const std::string& psu_key, const std::string& led_status) {
  report(store_.set(kPsuInfoTable, psu_key, {{"led_status", led_status}}), kPsuInfoTable, psu_key);
}

void StatePublisher::publish_fan(const model::FanRecord& record, const std::string& led_status) {
  const FieldValues fields = {
      {"presence", format_bool(record.presence)},
      {"status", format_optional(record.status)},
      {"direction", record.direction},
      {"speed", format_optional(record.speed)},
      {"led_status", led_status},
      {"timestamp", record.timestamp},
  };
  report(store_.set(kFanInfoTable, record.name, fields), kFanInfoTable, record.name);
}

void StatePublisher::publish_fan_led_status(const std::string& fan_key, const std::string& led_status) {
  report(store_.set(kFanInfoTable, fan_key, {{"led_status", led_status}}), kFanInfoTable, fan_key);
}

void StatePublisher::publish_power_budget(const health::PowerBudgetUpdate& update) {
  for (const auto& field : update.removed_fields) {
    report(store_.remove_field(kChassisInfoTable, kChassisPowerBudgetKey, field), kChassisInfoTable,
           kChassisPowerBudgetKey);
  }
  report(store_.set(kChassisInfoTable, kChassisPowerBudgetKey, update.fields), kChassisInfoTable,
         kChassisPowerBudgetKey);
}

void StatePublisher::set_psu_led(platform::Psu& psu, const std::string& psu_key, const platform::LedColor color) {
  warn_led_failure(psu.set_status_led(color), psu_key, color);

  for (std::size_t position = 0; position < psu.num_fans(); ++position) {
    platform::Fan* fan = psu.fan(position);
    if (fan == nullptr) {
      continue;
    }
    warn_led_failure(fan->set_status_led(color), psu_key + " FAN " + std::to_string(position + 1), color);
  }
}

void StatePublisher::set_master_led(platform::Chassis& chassis, const platform::LedColor color) {
  warn_led_failure(chassis.set_status_master_led(color), "chassis master", color);
}

void StatePublisher::remove_psu(const std::string& psu_key) {
  report(store_.remove(kPsuInfoTable, psu_key), kPsuInfoTable, psu_key);
}

void StatePublisher::remove_fan(const std::string& fan_key) {
  report(store_.remove(kFanInfoTable, fan_key), kFanInfoTable, fan_key);
}

void StatePublisher::remove_chassis() {
  report(store_.remove(kChassisInfoTable, kChassisInfoKey), kChassisInfoTable, kChassisInfoKey);
  report(store_.remove(kChassisInfoTable, kChassisPowerBudgetKey), kChassisInfoTable, kChassisPowerBudgetKey);
}

void StatePublisher::report(const bool ok, const std::string& table, const std::string& key) {
  if (!ok) {
    if (store_was_ok_) {
      std::cerr << "[psu] WARNING state store write failed for " << make_store_key(table, key) << '\n';
      store_was_ok_ = false;
    }
  } else if (!store_was_ok_) {
    std::cerr << "[psu] NOTICE state store writes recovered\n";
    store_was_ok_ = true;
  }
}

}  // namespace psu_agent::sinks
