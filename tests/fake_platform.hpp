#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "platform/chassis.hpp"
#include "sinks/state_store.hpp"

namespace psu_agent::testing {

// Hash-per-key store kept in memory so tests can inspect what a cycle wrote.
class MemoryStore final : public sinks::StateStore {
 public:
  bool set(const std::string& table, const std::string& key, const sinks::FieldValues& fields) override {
    auto& hash = entries[sinks::make_store_key(table, key)];
    for (const auto& [field, value] : fields) {
      hash[field] = value;
    }
    return accept_writes;
  }

  bool remove_field(const std::string& table, const std::string& key, const std::string& field) override {
    const auto it = entries.find(sinks::make_store_key(table, key));
    if (it != entries.end()) {
      it->second.erase(field);
    }
    return accept_writes;
  }

  bool remove(const std::string& table, const std::string& key) override {
    entries.erase(sinks::make_store_key(table, key));
    return accept_writes;
  }

  [[nodiscard]] bool has(const std::string& store_key) const { return entries.count(store_key) != 0; }

  [[nodiscard]] std::string field(const std::string& store_key, const std::string& name) const {
    const auto it = entries.find(store_key);
    if (it == entries.end()) {
      return {};
    }
    const auto value = it->second.find(name);
    return value == it->second.end() ? std::string{} : value->second;
  }

  std::map<std::string, std::map<std::string, std::string>> entries{};
  bool accept_writes{true};
};

template <typename T>
platform::Reading<T> maybe(const std::optional<T>& value) {
  return value.has_value() ? platform::Reading<T>::ok(*value) : platform::Reading<T>::unsupported();
}

class FakeFan final : public platform::Fan {
 public:
  platform::Reading<std::string> name() override { return platform::Reading<std::string>::unsupported(); }
  platform::Reading<bool> presence() override { return platform::Reading<bool>::ok(true); }
  platform::Reading<bool> status() override { return platform::Reading<bool>::ok(true); }
  platform::Reading<std::string> direction() override { return platform::Reading<std::string>::ok("intake"); }
  platform::Reading<double> speed() override { return platform::Reading<double>::ok(45.0); }
  platform::Reading<std::string> status_led() override { return platform::Reading<std::string>::unsupported(); }

  platform::Command set_status_led(const platform::LedColor color) override {
    led = color;
    return platform::Command::ok(true);
  }

  std::optional<platform::LedColor> led{};
};

class FakePsu final : public platform::Psu {
 public:
  platform::Reading<bool> flag(const platform::PsuFlag flag) override {
    switch (flag) {
      case platform::PsuFlag::presence:
        return platform::Reading<bool>::ok(presence);
      case platform::PsuFlag::power_good:
        if (!power_good_supported) {
          return platform::Reading<bool>::unsupported();
        }
        return platform::Reading<bool>::ok(power_good);
      case platform::PsuFlag::replaceable:
        break;
    }
    return platform::Reading<bool>::unsupported();
  }

  platform::Reading<double> metric(const platform::PsuMetric metric) override {
    if (fail_metrics) {
      return platform::Reading<double>::failed("i2c transaction timed out");
    }
    switch (metric) {
      case platform::PsuMetric::voltage:
        return maybe(voltage);
      case platform::PsuMetric::voltage_high_threshold:
        return maybe(voltage_high);
      case platform::PsuMetric::voltage_low_threshold:
        return maybe(voltage_low);
      case platform::PsuMetric::temperature:
        return maybe(temperature);
      case platform::PsuMetric::temperature_high_threshold:
        return maybe(temperature_high);
      case platform::PsuMetric::power:
        return maybe(power);
      case platform::PsuMetric::maximum_supplied_power:
        return maybe(max_power);
      case platform::PsuMetric::power_critical_threshold:
        return maybe(critical);
      case platform::PsuMetric::power_warning_suppress_threshold:
        return maybe(warning_suppress);
      default:
        break;
    }
    return platform::Reading<double>::unsupported();
  }

  platform::Reading<std::string> info(const platform::PsuInfo info) override {
    if (info == platform::PsuInfo::model) {
      return platform::Reading<std::string>::ok("PWR-1100-AC");
    }
    return platform::Reading<std::string>::unsupported();
  }

  platform::Reading<std::size_t> position_in_parent() override {
    return platform::Reading<std::size_t>::unsupported();
  }

  platform::Reading<std::string> status_led() override {
    if (!led) {
      return platform::Reading<std::string>::unsupported();
    }
    return platform::Reading<std::string>::ok(platform::to_string(*led));
  }

  platform::Command set_status_led(const platform::LedColor color) override {
    led = color;
    ++led_writes;
    return platform::Command::ok(true);
  }

  std::size_t num_fans() override { return fans.size(); }

  platform::Fan* fan(const std::size_t position) override {
    return position < fans.size() ? fans[position].get() : nullptr;
  }

  bool presence{true};
  bool power_good{true};
  bool power_good_supported{true};
  bool fail_metrics{false};
  std::optional<double> voltage{12.0};
  std::optional<double> voltage_high{13.0};
  std::optional<double> voltage_low{11.0};
  std::optional<double> temperature{40.0};
  std::optional<double> temperature_high{70.0};
  std::optional<double> power{};
  std::optional<double> max_power{};
  std::optional<double> critical{};
  std::optional<double> warning_suppress{};
  std::optional<platform::LedColor> led{};
  int led_writes{0};
  std::vector<std::unique_ptr<FakeFan>> fans{};
};

class FakeConsumer final : public platform::PowerConsumer {
 public:
  FakeConsumer(std::string name, const double max_power) : name_(std::move(name)), max_power_(max_power) {}

  platform::Reading<std::string> name() override { return platform::Reading<std::string>::ok(name_); }
  platform::Reading<bool> presence() override { return platform::Reading<bool>::ok(present); }
  platform::Reading<double> maximum_consumed_power() override { return platform::Reading<double>::ok(max_power_); }

  bool present{true};

 private:
  std::string name_;
  double max_power_;
};

class FakeChassis final : public platform::Chassis {
 public:
  explicit FakeChassis(const std::size_t num_psus) {
    for (std::size_t i = 0; i < num_psus; ++i) {
      psus.push_back(std::make_unique<FakePsu>());
    }
  }

  platform::Reading<std::string> name() override { return platform::Reading<std::string>::unsupported(); }
  platform::Reading<std::size_t> num_psus() override { return platform::Reading<std::size_t>::ok(psus.size()); }

  platform::Psu* psu(const std::size_t position) override {
    return position < psus.size() ? psus[position].get() : nullptr;
  }

  std::size_t num_fan_drawers() override { return 0; }
  platform::PowerConsumer* fan_drawer(std::size_t /*position*/) override { return nullptr; }
  std::size_t num_modules() override { return modules.size(); }

  platform::PowerConsumer* module(const std::size_t position) override {
    return position < modules.size() ? modules[position].get() : nullptr;
  }

  bool is_modular() override { return modular; }

  platform::Command set_status_master_led(const platform::LedColor color) override {
    master_led = color;
    ++master_led_writes;
    return platform::Command::ok(true);
  }

  FakePsu& at(const std::size_t position) { return *psus.at(position); }

  bool modular{false};
  std::vector<std::unique_ptr<FakePsu>> psus{};
  std::vector<std::unique_ptr<FakeConsumer>> modules{};
  std::optional<platform::LedColor> master_led{};
  int master_led_writes{0};
};

}  // namespace psu_agent::testing
