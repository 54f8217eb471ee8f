#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <cstddef>
#include <string>

namespace psu_agent::core {

inline std::uint64_t monotonic_timestamp_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

// Local wall-clock time as written into the fan table, e.g. "20261019 14:03:59".
inline std::string local_timestamp_now() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);

  char buffer[32] = {};
  const std::size_t length = std::strftime(buffer, sizeof(buffer), "%Y%m%d %H:%M:%S", &local);
  return std::string(buffer, length);
}

}  // namespace psu_agent::core
