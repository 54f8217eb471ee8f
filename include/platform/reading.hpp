#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace psu_agent::platform {

enum class ReadStatus : std::uint8_t {
  ok = 0,
  unsupported = 1,
  failed = 2,
};

// Result of one capability call. `unsupported` is an expected outcome and is
// replaced by a caller default; `failed` means the driver misbehaved.
template <typename T>
struct Reading {
  ReadStatus status{ReadStatus::unsupported};
  T value{};
  std::string error{};

  static Reading ok(T value) { return Reading{ReadStatus::ok, std::move(value), {}}; }
  static Reading unsupported() { return Reading{}; }
  static Reading failed(std::string message) { return Reading{ReadStatus::failed, T{}, std::move(message)}; }

  [[nodiscard]] bool is_ok() const noexcept { return status == ReadStatus::ok; }
  [[nodiscard]] bool is_unsupported() const noexcept { return status == ReadStatus::unsupported; }
  [[nodiscard]] bool is_failed() const noexcept { return status == ReadStatus::failed; }
};

// Outcome of a control operation such as an LED write.
using Command = Reading<bool>;

class PollError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

template <typename T>
T value_or(const Reading<T>& reading, T fallback, const char* what) {
  switch (reading.status) {
    case ReadStatus::ok:
      return reading.value;
    case ReadStatus::unsupported:
      return fallback;
    case ReadStatus::failed:
      break;
  }
  throw PollError(std::string(what) + ": " + reading.error);
}

template <typename T>
std::optional<T> optional_value(const Reading<T>& reading, const char* what) {
  switch (reading.status) {
    case ReadStatus::ok:
      return reading.value;
    case ReadStatus::unsupported:
      return std::nullopt;
    case ReadStatus::failed:
      break;
  }
  throw PollError(std::string(what) + ": " + reading.error);
}

}  // namespace psu_agent::platform
