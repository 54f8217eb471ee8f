#include "core/psu_monitor.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include "core/format.hpp"
#include "core/timestamp.hpp"

namespace psu_agent::core {
namespace {

using platform::optional_value;
using platform::PsuFlag;
using platform::PsuInfo;
using platform::PsuMetric;
using platform::value_or;

std::string led_status_text(const platform::Reading<std::string>& reading) {
  return reading.is_ok() ? reading.value : std::string(model::kNotAvailable);
}

std::string describe_range(const model::PsuRecord& record) {
  std::ostringstream out;
  out << format_optional(record.voltage) << " V (" << format_optional(record.voltage_low_threshold) << " - "
      << format_optional(record.voltage_high_threshold) << " V)";
  return out.str();
}

void add_consumer(health::ChassisPowerBudget& budget, platform::PowerConsumer* consumer,
                  const std::string& fallback_name) {
  if (consumer == nullptr) {
    return;
  }

  const auto name_reading = consumer->name();
  const std::string name =
      name_reading.is_ok() && !name_reading.value.empty() ? name_reading.value : fallback_name;
  try {
    const bool presence = value_or(consumer->presence(), false, "presence");
    budget.add_consumer(name, presence, optional_value(consumer->maximum_consumed_power(), "maximum consumed power"));
  } catch (const platform::PollError& ex) {
    std::cerr << "[psu] WARNING failed to read power consumer " << name << ": " << ex.what() << '\n';
  }
}

}  // namespace

PsuMonitor::PsuMonitor(platform::Chassis& chassis, sinks::StateStore& store) : chassis_(chassis), publisher_(store) {
  if (chassis_.is_modular()) {
    power_budget_ = std::make_unique<health::ChassisPowerBudget>();
  }

  const auto name = chassis_.name();
  if (name.is_ok() && !name.value.empty()) {
    parent_name_ = name.value;
  }
}

void PsuMonitor::seed() { publisher_.publish_psu_count(psu_count()); }

CycleStats PsuMonitor::run_cycle() {
  CycleStats stats{};
  power_threshold_.begin_cycle();

  const std::size_t num_psus = psu_count();
  update_entity_metadata(num_psus);

  health::PsuRecords records;
  std::map<std::size_t, Transitions> transitions;
  for (std::size_t index = 1; index <= num_psus; ++index) {
    platform::Psu* psu = chassis_.psu(index - 1);
    if (psu == nullptr) {
      continue;
    }

    try {
      model::PsuRecord record = poll_psu(index, *psu);
      transitions[index] = update_status(record, statuses_[index]);
      last_records_[index] = record;
      records.emplace(index, std::move(record));
      ++stats.psus_polled;
    } catch (const std::exception& ex) {
      ++stats.poll_failures;
      std::cerr << "[psu] WARNING failed to update " << psu_key(index, *psu) << ": " << ex.what() << '\n';
    }
  }

  // A PSU whose poll failed keeps contributing its last good reading to the
  // chassis-wide sums; its own row is left untouched.
  health::PsuRecords snapshot = records;
  for (const auto& [index, record] : last_records_) {
    if (index <= num_psus && records.count(index) == 0) {
      snapshot.emplace(index, record);
    }
  }

  for (const auto& [index, record] : records) {
    if (power_threshold_.evaluate(record, snapshot, statuses_.at(index))) {
      ++stats.power_alarm_transitions;
    }
  }

  for (const auto& [index, record] : records) {
    platform::Psu* psu = chassis_.psu(index - 1);
    health::PsuStatus& status = statuses_.at(index);
    const Transitions& changes = transitions.at(index);

    publisher_.publish_psu(record, status);
    if (changes.verdict_changed || status.first_poll()) {
      publisher_.set_psu_led(*psu, record.name, sinks::led_color(status.is_ok()));
    }
    if (changes.presence_changed || status.first_poll()) {
      try {
        update_fan_data(record, status, *psu);
      } catch (const std::exception& ex) {
        std::cerr << "[psu] WARNING failed to update fans of " << record.name << ": " << ex.what() << '\n';
      }
    }
    status.mark_polled();
  }

  update_led_status();

  if (power_budget_ != nullptr) {
    update_power_budget(snapshot);
  }

  return stats;
}

void PsuMonitor::clear() {
  for (const auto& [index, key] : psu_keys_) {
    publisher_.remove_psu(key);
  }
  for (const auto& [index, keys] : fan_keys_) {
    for (const auto& key : keys) {
      if (key.empty()) {
        continue;
      }
      publisher_.remove_fan(key);
    }
  }
  publisher_.remove_chassis();
}

const health::PsuStatus* PsuMonitor::status(const std::size_t index) const {
  const auto it = statuses_.find(index);
  return it == statuses_.end() ? nullptr : &it->second;
}

std::size_t PsuMonitor::psu_count() {
  const auto reading = chassis_.num_psus();
  if (reading.is_failed()) {
    std::cerr << "[psu] WARNING failed to read the number of PSUs: " << reading.error << '\n';
  }
  return reading.is_ok() ? reading.value : 0;
}

std::string PsuMonitor::psu_key(const std::size_t index, platform::Psu& psu) const {
  const auto name = psu.info(PsuInfo::name);
  if (name.is_ok() && !name.value.empty()) {
    return name.value;
  }
  return "PSU " + std::to_string(index);
}

// Other daemons may drop these keys, so they are re-asserted every cycle.
void PsuMonitor::update_entity_metadata(const std::size_t num_psus) {
  for (std::size_t index = 1; index <= num_psus; ++index) {
    platform::Psu* psu = chassis_.psu(index - 1);
    if (psu == nullptr) {
      continue;
    }

    const std::string key = psu_key(index, *psu);
    psu_keys_[index] = key;

    const auto position = psu->position_in_parent();
    publisher_.publish_entity_metadata(key, position.is_ok() ? position.value : index, parent_name_);
  }
}

model::PsuRecord PsuMonitor::poll_psu(const std::size_t index, platform::Psu& psu) const {
  model::PsuRecord record{};
  record.index = index;
  record.name = psu_key(index, psu);

  record.presence = value_or(psu.flag(PsuFlag::presence), false, "presence");
  if (!record.presence) {
    return record;
  }

  record.power_good = value_or(psu.flag(PsuFlag::power_good), true, "power good");
  record.replaceable = optional_value(psu.flag(PsuFlag::replaceable), "replaceable");

  record.voltage = optional_value(psu.metric(PsuMetric::voltage), "voltage");
  record.voltage_high_threshold = optional_value(psu.metric(PsuMetric::voltage_high_threshold), "voltage high threshold");
  record.voltage_low_threshold = optional_value(psu.metric(PsuMetric::voltage_low_threshold), "voltage low threshold");
  record.temperature = optional_value(psu.metric(PsuMetric::temperature), "temperature");
  record.temperature_high_threshold =
      optional_value(psu.metric(PsuMetric::temperature_high_threshold), "temperature high threshold");
  record.current = optional_value(psu.metric(PsuMetric::current), "current");
  record.power = optional_value(psu.metric(PsuMetric::power), "power");
  record.input_voltage = optional_value(psu.metric(PsuMetric::input_voltage), "input voltage");
  record.input_current = optional_value(psu.metric(PsuMetric::input_current), "input current");
  record.maximum_supplied_power =
      optional_value(psu.metric(PsuMetric::maximum_supplied_power), "maximum supplied power");
  record.power_critical_threshold =
      optional_value(psu.metric(PsuMetric::power_critical_threshold), "power critical threshold");
  record.power_warning_suppress_threshold =
      optional_value(psu.metric(PsuMetric::power_warning_suppress_threshold), "power warning-suppress threshold");

  const std::string not_available = model::kNotAvailable;
  record.model = value_or(psu.info(PsuInfo::model), not_available, "model");
  record.serial = value_or(psu.info(PsuInfo::serial), not_available, "serial");
  record.revision = value_or(psu.info(PsuInfo::revision), not_available, "revision");
  return record;
}

PsuMonitor::Transitions PsuMonitor::update_status(const model::PsuRecord& record, health::PsuStatus& status) const {
  Transitions changes{};

  if (status.set_presence(record.presence)) {
    changes.presence_changed = true;
    changes.verdict_changed = true;
    if (record.presence) {
      std::cerr << "[psu] NOTICE " << record.name << " is present\n";
    } else {
      std::cerr << "[psu] WARNING " << record.name << " is absent\n";
    }
  }

  if (!record.presence) {
    return changes;
  }

  const bool power_good_changed = status.set_power_good(record.power_good);
  if (power_good_changed) {
    changes.verdict_changed = true;
    if (record.power_good) {
      std::cerr << "[psu] NOTICE " << record.name << " power is good\n";
    } else {
      std::cerr << "[psu] WARNING " << record.name << " power is not good\n";
    }
  }

  if (status.set_voltage(record.voltage, record.voltage_high_threshold, record.voltage_low_threshold)) {
    changes.verdict_changed = true;
    if (status.voltage_good()) {
      std::cerr << "[psu] NOTICE " << record.name << " output voltage is back to normal\n";
    } else {
      std::cerr << "[psu] WARNING " << record.name << " output voltage out of range: " << describe_range(record)
                << '\n';
    }
  }

  if (status.set_temperature(record.temperature, record.temperature_high_threshold)) {
    changes.verdict_changed = true;
    if (status.temperature_good()) {
      std::cerr << "[psu] NOTICE " << record.name << " temperature is back to normal\n";
    } else {
      std::cerr << "[psu] WARNING " << record.name << " temperature " << format_optional(record.temperature)
                << " C reached the high threshold " << format_optional(record.temperature_high_threshold)
                << " C\n";
    }
  }

  // Re-arm only on a rising edge of usable power; a PSU that just came back
  // counts as one.
  const bool power_rising = power_good_changed || changes.presence_changed || status.first_poll();
  if (record.power_good && power_rising && record.power_critical_threshold &&
      record.power_warning_suppress_threshold && record.power) {
    status.arm_power_threshold();
  }

  return changes;
}

void PsuMonitor::update_fan_data(const model::PsuRecord& record, const health::PsuStatus& status,
                                 platform::Psu& psu) {
  const std::string psu_led = platform::to_string(sinks::led_color(status.is_ok()));
  // Indexed by fan position; a fan the PSU does not enumerate keeps an empty key.
  std::vector<std::string>& keys = fan_keys_[record.index];
  const std::size_t num_fans = psu.num_fans();
  keys.assign(num_fans, std::string{});

  for (std::size_t position = 0; position < num_fans; ++position) {
    platform::Fan* fan = psu.fan(position);
    if (fan == nullptr) {
      continue;
    }

    model::FanRecord fan_record{};
    const auto name = fan->name();
    fan_record.name = name.is_ok() && !name.value.empty() ? name.value
                                                          : record.name + " FAN " + std::to_string(position + 1);
    fan_record.timestamp = local_timestamp_now();
    keys[position] = fan_record.name;

    fan_record.presence = record.presence && value_or(fan->presence(), record.presence, "fan presence");
    if (fan_record.presence) {
      fan_record.status = optional_value(fan->status(), "fan status");
      fan_record.direction = value_or(fan->direction(), std::string(model::kNotAvailable), "fan direction");
      fan_record.speed = optional_value(fan->speed(), "fan speed");
    }

    const auto led = fan->status_led();
    publisher_.publish_fan(fan_record, led.is_ok() ? led.value : psu_led);
  }
}

void PsuMonitor::update_led_status() {
  for (const auto& [index, status] : statuses_) {
    platform::Psu* psu = chassis_.psu(index - 1);
    const auto key = psu_keys_.find(index);
    if (psu == nullptr || key == psu_keys_.end()) {
      continue;
    }

    const std::string psu_led = led_status_text(psu->status_led());
    publisher_.publish_psu_led_status(key->second, psu_led);

    const auto fans = fan_keys_.find(index);
    if (fans == fan_keys_.end()) {
      continue;
    }
    const std::size_t num_fans = std::min(psu->num_fans(), fans->second.size());
    for (std::size_t position = 0; position < num_fans; ++position) {
      platform::Fan* fan = psu->fan(position);
      if (fan == nullptr || fans->second[position].empty()) {
        continue;
      }
      const auto fan_led = fan->status_led();
      publisher_.publish_fan_led_status(fans->second[position], fan_led.is_ok() ? fan_led.value : psu_led);
    }
  }
}

void PsuMonitor::update_power_budget(const health::PsuRecords& records) {
  health::ChassisPowerBudget& budget = *power_budget_;
  budget.begin_cycle();

  for (const auto& [index, record] : records) {
    budget.add_supplier(record.name, record.presence, record.power_good, record.maximum_supplied_power);
  }
  for (std::size_t position = 0; position < chassis_.num_fan_drawers(); ++position) {
    add_consumer(budget, chassis_.fan_drawer(position), "FAN-DRAWER " + std::to_string(position + 1));
  }
  for (std::size_t position = 0; position < chassis_.num_modules(); ++position) {
    add_consumer(budget, chassis_.module(position), "MODULE " + std::to_string(position));
  }

  publisher_.publish_power_budget(budget.finish_cycle());

  if (!budget.update_master_status()) {
    return;
  }

  std::ostringstream line;
  line << std::fixed << std::setprecision(1);
  if (budget.master_status_good()) {
    line << "[psu] NOTICE chassis power budget OK: supplied " << budget.total_supplied_power() << " W, consumed "
         << budget.total_consumed_power() << " W";
  } else {
    line << "[psu] WARNING chassis power budget exceeded: consumed " << budget.total_consumed_power()
         << " W, supplied " << budget.total_supplied_power() << " W";
  }
  std::cerr << line.str() << '\n';
  publisher_.set_master_led(chassis_, sinks::led_color(budget.master_status_good()));
}

}  // namespace psu_agent::core
