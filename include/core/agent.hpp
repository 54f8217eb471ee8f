#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

#include "core/config.hpp"
#include "core/psu_monitor.hpp"
#include "platform/chassis.hpp"
#include "sinks/state_store.hpp"

namespace psu_agent::core {

inline constexpr int kExitConfigError = 1;
inline constexpr int kExitPlatformLoadError = 2;

struct AgentStats {
  std::size_t ticks_executed{0};
  std::size_t psus_polled{0};
  std::size_t poll_failures{0};
  std::size_t missed_cycles{0};
};

// Daemon context: owns the hardware handle, the state store and the monitor.
// Published keys are seeded on construction and removed on shutdown.
class Agent {
 public:
  Agent(AgentConfig config, std::unique_ptr<platform::Chassis> chassis, std::unique_ptr<sinks::StateStore> store);
  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Runs `total_ticks` cycles (0 = until stopped). The wait between cycles is
  // the only place a stop request is honoured.
  AgentStats run_for_ticks(std::size_t total_ticks, const std::function<bool()>& stop_requested = {});

  void shutdown();

  [[nodiscard]] const PsuMonitor& monitor() const noexcept { return *monitor_; }

 private:
  bool wait_for_next_tick(const std::function<bool()>& stop_requested);

  std::chrono::milliseconds poll_interval_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  bool shut_down_{false};
  std::unique_ptr<platform::Chassis> chassis_;
  std::unique_ptr<sinks::StateStore> store_;
  std::unique_ptr<PsuMonitor> monitor_;
};

// Throws std::runtime_error when no usable hardware source is found.
std::unique_ptr<platform::Chassis> load_chassis(const PlatformConfig& config);

std::unique_ptr<sinks::StateStore> make_state_store(const AgentConfig& config);

}  // namespace psu_agent::core
