#include <iostream>
#include <optional>

#include "health/psu_status.hpp"

using psu_agent::health::PsuStatus;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

int test_defaults_are_healthy() {
  const PsuStatus status;
  if (!status.is_ok() || !status.first_poll()) {
    return fail("test_defaults_are_healthy", "fresh status should be ok and awaiting its first poll");
  }
  if (status.check_power_threshold() || status.power_exceeded_threshold()) {
    return fail("test_defaults_are_healthy", "power threshold should start disarmed and clear");
  }
  return 0;
}

int test_setters_report_each_transition_once() {
  PsuStatus status;

  if (status.set_presence(true)) {
    return fail("test_setters_report_each_transition_once", "unchanged presence reported a transition");
  }
  if (!status.set_presence(false)) {
    return fail("test_setters_report_each_transition_once", "presence loss not reported");
  }
  if (status.set_presence(false)) {
    return fail("test_setters_report_each_transition_once", "repeated presence loss reported twice");
  }
  if (!status.set_presence(true)) {
    return fail("test_setters_report_each_transition_once", "presence recovery not reported");
  }

  if (!status.set_power_good(false) || status.set_power_good(false)) {
    return fail("test_setters_report_each_transition_once", "power good debounce mismatch");
  }
  if (!status.set_power_good(true) || status.set_power_good(true)) {
    return fail("test_setters_report_each_transition_once", "power good recovery debounce mismatch");
  }

  if (!status.set_power_exceeded_threshold(true) || status.set_power_exceeded_threshold(true)) {
    return fail("test_setters_report_each_transition_once", "power alarm debounce mismatch");
  }
  return 0;
}

int test_voltage_window_is_inclusive() {
  PsuStatus status;

  if (status.set_voltage(11.0, 13.0, 11.0) || status.set_voltage(13.0, 13.0, 11.0)) {
    return fail("test_voltage_window_is_inclusive", "voltage on a threshold should stay good");
  }
  if (!status.set_voltage(13.5, 13.0, 11.0) || status.voltage_good()) {
    return fail("test_voltage_window_is_inclusive", "over-voltage not flagged");
  }
  if (status.set_voltage(10.0, 13.0, 11.0)) {
    return fail("test_voltage_window_is_inclusive", "staying out of range should not report again");
  }
  if (!status.set_voltage(12.0, 13.0, 11.0) || !status.voltage_good()) {
    return fail("test_voltage_window_is_inclusive", "recovery into range not reported");
  }
  return 0;
}

int test_indeterminate_readings_fail_open() {
  PsuStatus status;

  if (!status.set_voltage(14.0, 13.0, 11.0)) {
    return fail("test_indeterminate_readings_fail_open", "setup: over-voltage not flagged");
  }
  if (!status.set_voltage(std::nullopt, 13.0, 11.0) || !status.voltage_good()) {
    return fail("test_indeterminate_readings_fail_open", "missing voltage should force good");
  }
  if (status.set_voltage(12.0, std::nullopt, 11.0)) {
    return fail("test_indeterminate_readings_fail_open", "missing threshold while good should not report");
  }

  if (status.set_temperature(std::nullopt, 70.0) || !status.temperature_good()) {
    return fail("test_indeterminate_readings_fail_open", "missing temperature should stay good");
  }
  if (!status.set_temperature(70.0, 70.0) || status.temperature_good()) {
    return fail("test_indeterminate_readings_fail_open", "temperature at the threshold should be bad");
  }
  if (!status.set_temperature(80.0, std::nullopt) || !status.temperature_good()) {
    return fail("test_indeterminate_readings_fail_open", "missing temperature threshold should force good");
  }
  return 0;
}

int test_is_ok_combines_all_verdicts() {
  PsuStatus status;

  status.set_temperature(90.0, 70.0);
  if (status.is_ok()) {
    return fail("test_is_ok_combines_all_verdicts", "hot PSU reported ok");
  }
  status.set_temperature(40.0, 70.0);
  status.set_power_good(false);
  if (status.is_ok()) {
    return fail("test_is_ok_combines_all_verdicts", "PSU without power good reported ok");
  }
  status.set_power_good(true);
  if (!status.is_ok()) {
    return fail("test_is_ok_combines_all_verdicts", "recovered PSU not ok");
  }
  return 0;
}

int test_losing_power_disarms_and_clears_alarm() {
  PsuStatus status;
  status.arm_power_threshold();
  status.set_power_exceeded_threshold(true);

  status.set_power_good(false);
  if (status.check_power_threshold() || status.power_exceeded_threshold()) {
    return fail("test_losing_power_disarms_and_clears_alarm", "power good loss should disarm and clear");
  }

  status.set_power_good(true);
  status.arm_power_threshold();
  status.set_power_exceeded_threshold(true);
  status.set_presence(false);
  if (status.check_power_threshold() || status.power_exceeded_threshold()) {
    return fail("test_losing_power_disarms_and_clears_alarm", "presence loss should disarm and clear");
  }

  status.mark_polled();
  if (status.first_poll()) {
    return fail("test_losing_power_disarms_and_clears_alarm", "mark_polled should end the first poll");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_defaults_are_healthy(); rc != 0) {
    return rc;
  }
  if (int rc = test_setters_report_each_transition_once(); rc != 0) {
    return rc;
  }
  if (int rc = test_voltage_window_is_inclusive(); rc != 0) {
    return rc;
  }
  if (int rc = test_indeterminate_readings_fail_open(); rc != 0) {
    return rc;
  }
  if (int rc = test_is_ok_combines_all_verdicts(); rc != 0) {
    return rc;
  }
  if (int rc = test_losing_power_disarms_and_clears_alarm(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] psu status unit tests\n";
  return 0;
}
