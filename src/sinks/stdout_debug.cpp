#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace psu_agent::sinks {

bool StdoutDebugStore::set(const std::string& table, const std::string& key, const FieldValues& fields) {
  std::printf("[store] HSET %s%s%s", table.c_str(), kTableSeparator, key.c_str());
  for (const auto& [field, value] : fields) {
    std::printf(" %s=%s", field.c_str(), value.c_str());
  }
  std::printf("\n");
  return true;
}

bool StdoutDebugStore::remove_field(const std::string& table, const std::string& key, const std::string& field) {
  std::printf("[store] HDEL %s%s%s %s\n", table.c_str(), kTableSeparator, key.c_str(), field.c_str());
  return true;
}

bool StdoutDebugStore::remove(const std::string& table, const std::string& key) {
  std::printf("[store] DEL %s%s%s\n", table.c_str(), kTableSeparator, key.c_str());
  return true;
}

}  // namespace psu_agent::sinks
