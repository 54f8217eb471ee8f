#include "platform/chassis.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "platform/sysfs.hpp"

namespace psu_agent::platform {
namespace {

constexpr double kMilli = 1000.0;
constexpr double kMicro = 1000000.0;

using sysfs::Missing;

Reading<std::string> static_text(const std::string& value) {
  return value.empty() ? Reading<std::string>::unsupported() : Reading<std::string>::ok(value);
}

template <typename T>
Reading<T> static_value(const std::optional<T>& value) {
  return value.has_value() ? Reading<T>::ok(*value) : Reading<T>::unsupported();
}

class HwmonFan final : public Fan {
 public:
  HwmonFan(FanDescription description, std::string hwmon_path)
      : description_(std::move(description)), hwmon_path_(std::move(hwmon_path)) {}

  Reading<std::string> name() override { return static_text(description_.name); }

  Reading<bool> presence() override {
    if (hwmon_path_.empty()) {
      return Reading<bool>::unsupported();
    }
    std::error_code ec;
    return Reading<bool>::ok(std::filesystem::exists(attribute("input"), ec));
  }

  Reading<bool> status() override {
    const auto fault = sysfs::read_flag(attribute("fault"), Missing::unsupported);
    if (!fault.is_ok()) {
      return fault;
    }
    return Reading<bool>::ok(!fault.value);
  }

  Reading<std::string> direction() override { return static_text(description_.direction); }

  Reading<double> speed() override {
    if (description_.max_rpm <= 0.0) {
      return Reading<double>::unsupported();
    }
    const auto rpm = sysfs::read_scaled(attribute("input"), 1.0, Missing::unsupported);
    if (!rpm.is_ok()) {
      return rpm;
    }
    return Reading<double>::ok(std::min(100.0, rpm.value * 100.0 / description_.max_rpm));
  }

  Reading<std::string> status_led() override { return sysfs::read_text(description_.led_path, Missing::failed); }

  Command set_status_led(const LedColor color) override {
    return sysfs::write_text(description_.led_path, to_string(color));
  }

 private:
  std::string attribute(const char* suffix) const {
    if (hwmon_path_.empty()) {
      return {};
    }
    return hwmon_path_ + "/fan" + std::to_string(description_.hwmon_index) + "_" + suffix;
  }

  FanDescription description_;
  std::string hwmon_path_;
};

class HwmonPsu final : public Psu {
 public:
  explicit HwmonPsu(PsuDescription description) : description_(std::move(description)) {
    for (const auto& fan : description_.fans) {
      fans_.push_back(std::make_unique<HwmonFan>(fan, description_.hwmon_path));
    }
  }

  Reading<bool> flag(const PsuFlag flag) override {
    switch (flag) {
      case PsuFlag::presence:
        if (description_.presence_path.empty() && !description_.hwmon_path.empty()) {
          std::error_code ec;
          return Reading<bool>::ok(std::filesystem::exists(description_.hwmon_path, ec));
        }
        return sysfs::read_flag(description_.presence_path, Missing::failed);
      case PsuFlag::power_good:
        return sysfs::read_flag(description_.power_good_path, Missing::failed);
      case PsuFlag::replaceable:
        return static_value(description_.replaceable);
    }
    return Reading<bool>::unsupported();
  }

  Reading<double> metric(const PsuMetric metric) override {
    switch (metric) {
      case PsuMetric::voltage:
        return hwmon("in2_input", kMilli);
      case PsuMetric::voltage_high_threshold:
        return hwmon("in2_max", kMilli);
      case PsuMetric::voltage_low_threshold:
        return hwmon("in2_min", kMilli);
      case PsuMetric::temperature:
        return hwmon("temp1_input", kMilli);
      case PsuMetric::temperature_high_threshold:
        return hwmon("temp1_max", kMilli);
      case PsuMetric::current:
        return hwmon("curr2_input", kMilli);
      case PsuMetric::power:
        return hwmon("power2_input", kMicro);
      case PsuMetric::input_voltage:
        return hwmon("in1_input", kMilli);
      case PsuMetric::input_current:
        return hwmon("curr1_input", kMilli);
      case PsuMetric::maximum_supplied_power:
        return static_or_hwmon(description_.max_supplied_power_w, "power2_rated_max", kMicro);
      case PsuMetric::power_critical_threshold:
        return static_or_hwmon(description_.power_critical_threshold_w, "power2_crit", kMicro);
      case PsuMetric::power_warning_suppress_threshold:
        return static_or_hwmon(description_.power_warning_suppress_threshold_w, "power2_max", kMicro);
    }
    return Reading<double>::unsupported();
  }

  Reading<std::string> info(const PsuInfo info) override {
    switch (info) {
      case PsuInfo::name:
        return static_text(description_.name);
      case PsuInfo::model:
        return static_text(description_.model);
      case PsuInfo::serial:
        return static_text(description_.serial);
      case PsuInfo::revision:
        return static_text(description_.revision);
    }
    return Reading<std::string>::unsupported();
  }

  Reading<std::size_t> position_in_parent() override { return static_value(description_.position); }

  Reading<std::string> status_led() override { return sysfs::read_text(description_.led_path, Missing::failed); }

  Command set_status_led(const LedColor color) override {
    return sysfs::write_text(description_.led_path, to_string(color));
  }

  std::size_t num_fans() override { return fans_.size(); }

  Fan* fan(const std::size_t position) override {
    return position < fans_.size() ? fans_[position].get() : nullptr;
  }

 private:
  Reading<double> hwmon(const char* attribute, const double divisor) const {
    if (description_.hwmon_path.empty()) {
      return Reading<double>::unsupported();
    }
    return sysfs::read_scaled(description_.hwmon_path + "/" + attribute, divisor, Missing::unsupported);
  }

  Reading<double> static_or_hwmon(const std::optional<double>& configured, const char* attribute,
                                  const double divisor) const {
    if (configured.has_value()) {
      return Reading<double>::ok(*configured);
    }
    return hwmon(attribute, divisor);
  }

  PsuDescription description_;
  std::vector<std::unique_ptr<HwmonFan>> fans_{};
};

class HwmonConsumer final : public PowerConsumer {
 public:
  explicit HwmonConsumer(ConsumerDescription description) : description_(std::move(description)) {}

  Reading<std::string> name() override { return static_text(description_.name); }

  Reading<bool> presence() override {
    if (description_.presence_path.empty()) {
      return Reading<bool>::ok(description_.present);
    }
    return sysfs::read_flag(description_.presence_path, Missing::failed);
  }

  Reading<double> maximum_consumed_power() override { return static_value(description_.max_consumed_power_w); }

 private:
  ConsumerDescription description_;
};

class HwmonChassis final : public Chassis {
 public:
  explicit HwmonChassis(PlatformDescription description) : description_(std::move(description)) {
    for (const auto& psu : description_.psus) {
      psus_.push_back(std::make_unique<HwmonPsu>(psu));
    }
    for (const auto& drawer : description_.fan_drawers) {
      fan_drawers_.push_back(std::make_unique<HwmonConsumer>(drawer));
    }
    for (const auto& module : description_.modules) {
      modules_.push_back(std::make_unique<HwmonConsumer>(module));
    }
  }

  Reading<std::string> name() override { return static_text(description_.chassis_name); }

  Reading<std::size_t> num_psus() override { return Reading<std::size_t>::ok(psus_.size()); }

  Psu* psu(const std::size_t position) override {
    return position < psus_.size() ? psus_[position].get() : nullptr;
  }

  std::size_t num_fan_drawers() override { return fan_drawers_.size(); }

  PowerConsumer* fan_drawer(const std::size_t position) override {
    return position < fan_drawers_.size() ? fan_drawers_[position].get() : nullptr;
  }

  std::size_t num_modules() override { return modules_.size(); }

  PowerConsumer* module(const std::size_t position) override {
    return position < modules_.size() ? modules_[position].get() : nullptr;
  }

  bool is_modular() override { return description_.modular; }

  Command set_status_master_led(const LedColor color) override {
    return sysfs::write_text(description_.master_led_path, to_string(color));
  }

 private:
  PlatformDescription description_;
  std::vector<std::unique_ptr<HwmonPsu>> psus_{};
  std::vector<std::unique_ptr<HwmonConsumer>> fan_drawers_{};
  std::vector<std::unique_ptr<HwmonConsumer>> modules_{};
};

}  // namespace

std::unique_ptr<Chassis> make_hwmon_chassis(PlatformDescription description) {
  return std::make_unique<HwmonChassis>(std::move(description));
}

}  // namespace psu_agent::platform
