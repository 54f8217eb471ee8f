#pragma once

#include "sinks/state_store.hpp"

namespace psu_agent::sinks {

class StdoutDebugStore final : public StateStore {
 public:
  bool set(const std::string& table, const std::string& key, const FieldValues& fields) override;
  bool remove_field(const std::string& table, const std::string& key, const std::string& field) override;
  bool remove(const std::string& table, const std::string& key) override;
};

}  // namespace psu_agent::sinks
