#include "core/agent.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "core/timestamp.hpp"
#include "platform/description.hpp"
#include "sinks/redis_state_store.hpp"
#include "sinks/stdout_debug.hpp"

namespace psu_agent::core {
namespace {

constexpr std::chrono::milliseconds kStopCheckInterval{100};

std::size_t count_legacy_psus(const std::string& root) {
  std::size_t count = 0;
  std::error_code ec;
  while (std::filesystem::exists(root + "/psu" + std::to_string(count + 1) + "_present", ec)) {
    ++count;
  }
  return count;
}

}  // namespace

Agent::Agent(AgentConfig config, std::unique_ptr<platform::Chassis> chassis, std::unique_ptr<sinks::StateStore> store)
    : poll_interval_(config.poll_interval), chassis_(std::move(chassis)), store_(std::move(store)) {
  if (chassis_ == nullptr || store_ == nullptr) {
    throw std::invalid_argument("agent requires a chassis and a state store");
  }
  monitor_ = std::make_unique<PsuMonitor>(*chassis_, *store_);
  monitor_->seed();
}

Agent::~Agent() { shutdown(); }

AgentStats Agent::run_for_ticks(const std::size_t total_ticks, const std::function<bool()>& stop_requested) {
  AgentStats stats{};

  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    const std::uint64_t cycle_start_ns = monotonic_timestamp_now_ns();

    const CycleStats cycle = monitor_->run_cycle();
    stats.psus_polled += cycle.psus_polled;
    stats.poll_failures += cycle.poll_failures;
    ++stats.ticks_executed;

    const auto compute_time = std::chrono::nanoseconds(monotonic_timestamp_now_ns() - cycle_start_ns);
    if (compute_time > poll_interval_) {
      ++stats.missed_cycles;
      std::cerr << "[agent] cycle took "
                << std::chrono::duration_cast<std::chrono::milliseconds>(compute_time).count()
                << " ms, longer than the poll interval\n";
    }

    next_wakeup_ += poll_interval_;
    const bool last_tick = total_ticks != 0 && i + 1 == total_ticks;
    if (last_tick || !wait_for_next_tick(stop_requested)) {
      break;
    }
  }

  return stats;
}

bool Agent::wait_for_next_tick(const std::function<bool()>& stop_requested) {
  while (true) {
    if (stop_requested && stop_requested()) {
      return false;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= next_wakeup_) {
      return true;
    }
    std::this_thread::sleep_until(std::min(next_wakeup_, now + kStopCheckInterval));
  }
}

void Agent::shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  monitor_->clear();
}

std::unique_ptr<platform::Chassis> load_chassis(const PlatformConfig& config) {
  if (config.type == "hwmon") {
    auto description = platform::load_platform_description(config.description_path);
    std::cerr << "[platform] loaded " << description.psus.size() << " PSU(s) from " << config.description_path
              << (description.modular ? " (modular chassis)" : "") << '\n';
    return platform::make_hwmon_chassis(std::move(description));
  }

  if (config.type == "legacy") {
    const std::size_t num_psus =
        config.legacy_num_psus != 0 ? config.legacy_num_psus : count_legacy_psus(config.legacy_root);
    if (num_psus == 0) {
      throw std::runtime_error("no PSUs found under " + config.legacy_root);
    }
    std::cerr << "[platform] using legacy psuutil interface at " << config.legacy_root << " with " << num_psus
              << " PSU(s)\n";
    return platform::make_legacy_chassis(config.legacy_root, num_psus);
  }

  throw std::runtime_error("unknown platform type: " + config.type);
}

std::unique_ptr<sinks::StateStore> make_state_store(const AgentConfig& config) {
  if (!config.redis.enabled) {
    return std::make_unique<sinks::StdoutDebugStore>();
  }

  sinks::RedisStoreOptions options{};
  options.host = config.redis.host;
  options.port = config.redis.port;
  options.unix_socket = config.redis.unix_socket;
  options.password = config.redis.password;
  options.db = config.redis.db;
  auto store = std::make_unique<sinks::RedisStateStore>(options);

  if (store->check_connectivity()) {
    if (!options.unix_socket.empty()) {
      std::cerr << "[agent] redis connectivity confirmed at unix://" << options.unix_socket << '\n';
    } else {
      std::cerr << "[agent] redis connectivity confirmed at " << options.host << ':' << options.port << '\n';
    }
  } else {
    if (!options.unix_socket.empty()) {
      std::cerr << "[agent] redis connectivity check failed at unix://" << options.unix_socket << '\n';
    } else {
      std::cerr << "[agent] redis connectivity check failed at " << options.host << ':' << options.port << '\n';
    }
  }
  return store;
}

}  // namespace psu_agent::core
