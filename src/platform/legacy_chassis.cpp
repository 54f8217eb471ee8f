#include "platform/chassis.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "platform/sysfs.hpp"

namespace psu_agent::platform {
namespace {

// psuutil-style drivers only answer presence and status per PSU slot.
class LegacyPsu final : public Psu {
 public:
  LegacyPsu(const std::string& root, const std::size_t index)
      : presence_path_(root + "/psu" + std::to_string(index) + "_present"),
        status_path_(root + "/psu" + std::to_string(index) + "_status") {}

  Reading<bool> flag(const PsuFlag flag) override {
    switch (flag) {
      case PsuFlag::presence:
        return sysfs::read_flag(presence_path_, sysfs::Missing::failed);
      case PsuFlag::power_good:
        return sysfs::read_flag(status_path_, sysfs::Missing::failed);
      case PsuFlag::replaceable:
        break;
    }
    return Reading<bool>::unsupported();
  }

  Reading<double> metric(PsuMetric /*metric*/) override { return Reading<double>::unsupported(); }
  Reading<std::string> info(PsuInfo /*info*/) override { return Reading<std::string>::unsupported(); }
  Reading<std::size_t> position_in_parent() override { return Reading<std::size_t>::unsupported(); }
  Reading<std::string> status_led() override { return Reading<std::string>::unsupported(); }
  Command set_status_led(LedColor /*color*/) override { return Command::unsupported(); }
  std::size_t num_fans() override { return 0; }
  Fan* fan(std::size_t /*position*/) override { return nullptr; }

 private:
  std::string presence_path_;
  std::string status_path_;
};

class LegacyChassis final : public Chassis {
 public:
  LegacyChassis(const std::string& root, const std::size_t num_psus) {
    for (std::size_t index = 1; index <= num_psus; ++index) {
      psus_.push_back(std::make_unique<LegacyPsu>(root, index));
    }
  }

  Reading<std::string> name() override { return Reading<std::string>::unsupported(); }
  Reading<std::size_t> num_psus() override { return Reading<std::size_t>::ok(psus_.size()); }

  Psu* psu(const std::size_t position) override {
    return position < psus_.size() ? psus_[position].get() : nullptr;
  }

  std::size_t num_fan_drawers() override { return 0; }
  PowerConsumer* fan_drawer(std::size_t /*position*/) override { return nullptr; }
  std::size_t num_modules() override { return 0; }
  PowerConsumer* module(std::size_t /*position*/) override { return nullptr; }
  bool is_modular() override { return false; }
  Command set_status_master_led(LedColor /*color*/) override { return Command::unsupported(); }

 private:
  std::vector<std::unique_ptr<LegacyPsu>> psus_{};
};

}  // namespace

std::unique_ptr<Chassis> make_legacy_chassis(std::string root, const std::size_t num_psus) {
  return std::make_unique<LegacyChassis>(root, num_psus);
}

}  // namespace psu_agent::platform
