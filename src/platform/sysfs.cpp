#include "platform/sysfs.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "platform/chassis.hpp"

namespace psu_agent::platform {

const char* to_string(const LedColor color) noexcept {
  switch (color) {
    case LedColor::green:
      return "green";
    case LedColor::red:
      return "red";
  }
  return "off";
}

namespace sysfs {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

}  // namespace

Reading<std::string> read_text(const std::string& path, const Missing missing) {
  if (path.empty()) {
    return Reading<std::string>::unsupported();
  }

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (missing == Missing::unsupported) {
      return Reading<std::string>::unsupported();
    }
    return Reading<std::string>::failed("missing " + path);
  }

  std::ifstream input(path);
  if (!input.is_open()) {
    return Reading<std::string>::failed("unable to open " + path + ": " + std::strerror(errno));
  }

  std::string content;
  std::getline(input, content);
  if (input.bad()) {
    return Reading<std::string>::failed("read error on " + path);
  }
  return Reading<std::string>::ok(trim(content));
}

Reading<double> read_scaled(const std::string& path, const double divisor, const Missing missing) {
  const auto text = read_text(path, missing);
  if (!text.is_ok()) {
    return Reading<double>{text.status, 0.0, text.error};
  }

  const char* begin = text.value.c_str();
  char* end = nullptr;
  errno = 0;
  const long long raw = std::strtoll(begin, &end, 10);
  if (end == begin || errno == ERANGE) {
    return Reading<double>::failed("unparsable value '" + text.value + "' in " + path);
  }
  return Reading<double>::ok(static_cast<double>(raw) / divisor);
}

Reading<bool> read_flag(const std::string& path, const Missing missing) {
  const auto text = read_text(path, missing);
  if (!text.is_ok()) {
    return Reading<bool>{text.status, false, text.error};
  }

  if (text.value == "1" || text.value == "true") {
    return Reading<bool>::ok(true);
  }
  if (text.value == "0" || text.value == "false") {
    return Reading<bool>::ok(false);
  }
  return Reading<bool>::failed("unexpected flag '" + text.value + "' in " + path);
}

Command write_text(const std::string& path, const std::string& value) {
  if (path.empty()) {
    return Command::unsupported();
  }

  std::ofstream output(path);
  if (!output.is_open()) {
    return Command::failed("unable to open " + path + ": " + std::strerror(errno));
  }
  output << value << '\n';
  output.flush();
  if (!output) {
    return Command::failed("write error on " + path);
  }
  return Command::ok(true);
}

}  // namespace sysfs
}  // namespace psu_agent::platform
