#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace psu_agent::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{6};
  bool enabled{false};
};

struct PlatformConfig {
  std::string type{"hwmon"};
  std::string description_path{"/usr/share/psu-agent/platform.json"};
  std::string legacy_root{"/sys/class/psu"};
  std::size_t legacy_num_psus{0};
};

struct AgentConfig {
  std::chrono::milliseconds poll_interval{3000};
  bool stdout_debug{true};
  RedisConfig redis{};
  PlatformConfig platform{};
};

AgentConfig load_agent_config(const std::string& path);

}  // namespace psu_agent::core
