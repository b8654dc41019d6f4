#include "parkwise/core/Log.h"

#include <iostream>

int test_args();
int test_cvars();
int test_log_sinks();
int test_jobs();
int test_time();
int test_occupancy_grid();
int test_value_table();
int test_scoring();
int test_policy();
int test_simulation();
int test_engine_config();
int test_facility_status();
int test_record_store();
int test_allocation_service();
int test_request_io();
int test_report_io();

int main() {
  // Keep expected warnings visible, drop per-run info lines.
  parkwise::core::setLogLevel(parkwise::core::LogLevel::Warn);

  int fails = 0;

  fails += test_args();
  fails += test_cvars();
  fails += test_log_sinks();
  fails += test_jobs();
  fails += test_time();
  fails += test_occupancy_grid();
  fails += test_value_table();
  fails += test_scoring();
  fails += test_policy();
  fails += test_simulation();
  fails += test_engine_config();
  fails += test_facility_status();
  fails += test_record_store();
  fails += test_allocation_service();
  fails += test_request_io();
  fails += test_report_io();

  if (fails == 0) {
    std::cout << "[parkwise_tests] ALL PASS\n";
    return 0;
  }

  std::cerr << "[parkwise_tests] FAILS: " << fails << "\n";
  return 1;
}
