#pragma once

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace psu_agent::health {

inline constexpr const char* kSuppliedPowerFieldPrefix = "Supplied Power ";
inline constexpr const char* kConsumedPowerFieldPrefix = "Consumed Power ";
inline constexpr const char* kTotalSuppliedPowerField = "Total Supplied Power";
inline constexpr const char* kTotalConsumedPowerField = "Total Consumed Power";

struct PowerBudgetUpdate {
  std::vector<std::pair<std::string, std::string>> fields{};
  std::vector<std::string> removed_fields{};
};

// Chassis power budget: what the PSUs can supply against what fan drawers and
// modules may consume.
class ChassisPowerBudget {
 public:
  void begin_cycle();
  void add_supplier(const std::string& name, bool presence, bool power_good, std::optional<double> max_power);
  void add_consumer(const std::string& name, bool presence, std::optional<double> max_power);
  PowerBudgetUpdate finish_cycle();

  // Returns true when the master verdict flipped, and on the first verdict.
  bool update_master_status() noexcept;

  [[nodiscard]] double total_supplied_power() const noexcept { return total_supplied_power_; }
  [[nodiscard]] double total_consumed_power() const noexcept { return total_consumed_power_; }
  [[nodiscard]] bool master_status_good() const noexcept { return master_status_good_; }

 private:
  void publish(std::string field, double value);
  void remove(std::string field);

  double total_supplied_power_{0.0};
  double total_consumed_power_{0.0};
  bool master_status_good_{true};
  bool first_run_{true};
  PowerBudgetUpdate update_{};
  std::set<std::string> published_fields_{};
  std::set<std::string> cycle_fields_{};
};

}  // namespace psu_agent::health
