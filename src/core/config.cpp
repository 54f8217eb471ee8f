#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace psu_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& value) {
  if (key == "poll_interval_s") {
    const auto seconds = std::stoi(value);
    if (seconds <= 0) {
      throw std::runtime_error("poll_interval_s must be greater than 0");
    }

    if (seconds > 3600) {
      throw std::runtime_error("poll_interval_s must be less than or equal to 3600");
    }

    config.poll_interval = std::chrono::seconds(seconds);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.db") {
    const auto db = std::stoi(value);
    if (db < 0 || db > 15) {
      throw std::runtime_error("redis.db must be in range 0..15");
    }
    config.redis.db = db;
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "platform.type") {
    if (value != "hwmon" && value != "legacy") {
      throw std::runtime_error("platform.type must be 'hwmon' or 'legacy'");
    }
    config.platform.type = value;
    return;
  }

  if (key == "platform.description") {
    config.platform.description_path = value;
    return;
  }

  if (key == "platform.legacy_root") {
    config.platform.legacy_root = value;
    return;
  }

  if (key == "platform.legacy_num_psus") {
    const auto parsed = std::stoll(value);
    if (parsed < 0) {
      throw std::runtime_error("platform.legacy_num_psus must be greater than or equal to 0");
    }
    config.platform.legacy_num_psus = static_cast<std::size_t>(parsed);
  }
}

}  // namespace

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  if (!config.redis.enabled && !config.stdout_debug) {
    throw std::runtime_error("no state store enabled: set redis.address or agent.stdout_debug");
  }

  return config;
}

}  // namespace psu_agent::core
