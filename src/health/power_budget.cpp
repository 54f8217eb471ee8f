#include "health/power_budget.hpp"

#include <algorithm>

#include "core/format.hpp"

namespace psu_agent::health {

void ChassisPowerBudget::begin_cycle() {
  total_supplied_power_ = 0.0;
  total_consumed_power_ = 0.0;
  update_ = {};
  cycle_fields_.clear();
}

void ChassisPowerBudget::add_supplier(const std::string& name, const bool presence, const bool power_good,
                                      const std::optional<double> max_power) {
  std::string field = kSuppliedPowerFieldPrefix + name;
  if (!presence) {
    remove(std::move(field));
    return;
  }
  if (!power_good) {
    publish(std::move(field), 0.0);
    return;
  }

  const double power = max_power.value_or(0.0);
  total_supplied_power_ += power;
  publish(std::move(field), power);
}

void ChassisPowerBudget::add_consumer(const std::string& name, const bool presence,
                                      const std::optional<double> max_power) {
  std::string field = kConsumedPowerFieldPrefix + name;
  if (!presence) {
    remove(std::move(field));
    return;
  }

  const double power = max_power.value_or(0.0);
  total_consumed_power_ += power;
  publish(std::move(field), power);
}

PowerBudgetUpdate ChassisPowerBudget::finish_cycle() {
  for (const auto& field : published_fields_) {
    if (cycle_fields_.count(field) != 0) {
      continue;
    }
    const auto& removed = update_.removed_fields;
    if (std::find(removed.begin(), removed.end(), field) == removed.end()) {
      update_.removed_fields.push_back(field);
    }
  }
  published_fields_ = cycle_fields_;

  update_.fields.emplace_back(kTotalSuppliedPowerField, core::format_number(total_supplied_power_));
  update_.fields.emplace_back(kTotalConsumedPowerField, core::format_number(total_consumed_power_));
  return std::move(update_);
}

bool ChassisPowerBudget::update_master_status() noexcept {
  if (total_supplied_power_ == 0.0 || total_consumed_power_ == 0.0) {
    return false;
  }

  const bool good = total_consumed_power_ < total_supplied_power_;
  if (good == master_status_good_ && !first_run_) {
    return false;
  }
  master_status_good_ = good;
  first_run_ = false;
  return true;
}

void ChassisPowerBudget::publish(std::string field, const double value) {
  update_.fields.emplace_back(field, core::format_number(value));
  cycle_fields_.insert(std::move(field));
}

void ChassisPowerBudget::remove(std::string field) {
  if (cycle_fields_.count(field) == 0) {
    update_.removed_fields.push_back(std::move(field));
  }
}

}  // namespace psu_agent::health
