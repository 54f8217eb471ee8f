#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "core/agent.hpp"
#include "core/config.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const psu_agent::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | poll_interval_ms=" << config.poll_interval.count()
         << " | platform_type=" << config.platform.type
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  output << " | redis_db=" << config.redis.db;
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "/etc/psu-agent/psu-agent.yaml";

  psu_agent::core::AgentConfig config{};
  try {
    config = psu_agent::core::load_agent_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return psu_agent::core::kExitConfigError;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::unique_ptr<psu_agent::platform::Chassis> chassis;
  try {
    chassis = psu_agent::core::load_chassis(config.platform);
  } catch (const std::exception& ex) {
    std::cerr << "[psu] ERROR failed to load platform chassis: " << ex.what() << '\n';
    return psu_agent::core::kExitPlatformLoadError;
  }

  std::cerr << "[psu] NOTICE starting up\n";

  psu_agent::core::Agent agent{config, std::move(chassis), psu_agent::core::make_state_store(config)};
  agent.run_for_ticks(0, [] { return g_shutdown_requested != 0; });

  std::cerr << "[psu] NOTICE shutdown signal received; cleaning up\n";
  agent.shutdown();

  return 0;
}
