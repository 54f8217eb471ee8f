#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace psu_agent::platform {

struct FanDescription {
  std::string name{};
  std::size_t hwmon_index{1};
  std::string direction{};
  double max_rpm{0.0};
  std::string led_path{};
};

struct PsuDescription {
  std::string name{};
  std::string hwmon_path{};
  std::string presence_path{};
  std::string power_good_path{};
  std::string led_path{};
  std::optional<std::size_t> position{};
  std::optional<bool> replaceable{};
  std::string model{};
  std::string serial{};
  std::string revision{};
  std::optional<double> max_supplied_power_w{};
  std::optional<double> power_critical_threshold_w{};
  std::optional<double> power_warning_suppress_threshold_w{};
  std::vector<FanDescription> fans{};
};

struct ConsumerDescription {
  std::string name{};
  std::string presence_path{};
  bool present{true};
  std::optional<double> max_consumed_power_w{};
};

struct PlatformDescription {
  std::string chassis_name{"chassis 1"};
  bool modular{false};
  std::string master_led_path{};
  std::vector<PsuDescription> psus{};
  std::vector<ConsumerDescription> fan_drawers{};
  std::vector<ConsumerDescription> modules{};
};

PlatformDescription parse_platform_description(const nlohmann::json& document);
PlatformDescription load_platform_description(const std::string& path);

}  // namespace psu_agent::platform
