#pragma once

#include <string>
#include <utility>
#include <vector>

namespace psu_agent::sinks {

using FieldValues = std::vector<std::pair<std::string, std::string>>;

inline constexpr const char* kTableSeparator = "|";

inline std::string make_store_key(const std::string& table, const std::string& key) {
  return table + kTableSeparator + key;
}

// Hash-per-entity state store. Each call is independent; a false return is a
// failed write that the caller reports and moves past.
class StateStore {
 public:
  virtual bool set(const std::string& table, const std::string& key, const FieldValues& fields) = 0;
  virtual bool remove_field(const std::string& table, const std::string& key, const std::string& field) = 0;
  virtual bool remove(const std::string& table, const std::string& key) = 0;
  virtual ~StateStore() = default;
};

}  // namespace psu_agent::sinks
