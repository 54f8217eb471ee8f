#include "platform/description.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace psu_agent::platform {
namespace {

template <typename T>
std::optional<T> optional_field(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

FanDescription parse_fan(const nlohmann::json& object, const std::size_t position) {
  FanDescription fan{};
  fan.name = object.value("name", std::string{});
  fan.hwmon_index = object.value("hwmon_index", position + 1);
  fan.direction = object.value("direction", std::string{});
  fan.max_rpm = object.value("max_rpm", 0.0);
  fan.led_path = object.value("led", std::string{});
  if (fan.hwmon_index == 0) {
    throw std::runtime_error("fan hwmon_index must be greater than 0");
  }
  return fan;
}

PsuDescription parse_psu(const nlohmann::json& object) {
  PsuDescription psu{};
  psu.name = object.value("name", std::string{});
  psu.hwmon_path = object.value("hwmon", std::string{});
  psu.presence_path = object.value("presence", std::string{});
  psu.power_good_path = object.value("power_good", std::string{});
  psu.led_path = object.value("led", std::string{});
  psu.position = optional_field<std::size_t>(object, "position");
  psu.replaceable = optional_field<bool>(object, "replaceable");
  psu.model = object.value("model", std::string{});
  psu.serial = object.value("serial", std::string{});
  psu.revision = object.value("revision", std::string{});
  psu.max_supplied_power_w = optional_field<double>(object, "max_supplied_power_w");
  psu.power_critical_threshold_w = optional_field<double>(object, "power_critical_threshold_w");
  psu.power_warning_suppress_threshold_w = optional_field<double>(object, "power_warning_suppress_threshold_w");

  if (const auto fans = object.find("fans"); fans != object.end()) {
    for (std::size_t i = 0; i < fans->size(); ++i) {
      psu.fans.push_back(parse_fan(fans->at(i), i));
    }
  }
  return psu;
}

ConsumerDescription parse_consumer(const nlohmann::json& object) {
  ConsumerDescription consumer{};
  consumer.name = object.value("name", std::string{});
  consumer.presence_path = object.value("presence", std::string{});
  consumer.present = object.value("present", true);
  consumer.max_consumed_power_w = optional_field<double>(object, "max_consumed_power_w");
  return consumer;
}

}  // namespace

PlatformDescription parse_platform_description(const nlohmann::json& document) {
  const nlohmann::json& chassis = document.at("chassis");

  PlatformDescription description{};
  description.chassis_name = chassis.value("name", description.chassis_name);
  description.modular = chassis.value("modular", false);
  description.master_led_path = chassis.value("master_led", std::string{});

  for (const auto& psu : chassis.at("psus")) {
    description.psus.push_back(parse_psu(psu));
  }
  if (const auto drawers = chassis.find("fan_drawers"); drawers != chassis.end()) {
    for (const auto& drawer : *drawers) {
      description.fan_drawers.push_back(parse_consumer(drawer));
    }
  }
  if (const auto modules = chassis.find("modules"); modules != chassis.end()) {
    for (const auto& module : *modules) {
      description.modules.push_back(parse_consumer(module));
    }
  }

  if (description.psus.empty()) {
    throw std::runtime_error("platform description lists no PSUs");
  }
  return description;
}

PlatformDescription load_platform_description(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open platform description: " + path);
  }

  try {
    return parse_platform_description(nlohmann::json::parse(input));
  } catch (const nlohmann::json::exception& ex) {
    throw std::runtime_error("invalid platform description " + path + ": " + ex.what());
  }
}

}  // namespace psu_agent::platform
