#include <iostream>

int test_fixed_point();
int test_json_errors();
int test_log();
int test_config();
int test_capacity();
int test_emission();
int test_accumulator();
int test_vesting();
int test_era_phase();
int test_events();
int test_shards();
int test_supply();
int test_engine_lifecycle();
int test_digests();
int test_state_export();

int main() {
  int fails = 0;
  fails += test_fixed_point();
  fails += test_json_errors();
  fails += test_log();
  fails += test_config();
  fails += test_capacity();
  fails += test_emission();
  fails += test_accumulator();
  fails += test_vesting();
  fails += test_era_phase();
  fails += test_events();
  fails += test_shards();
  fails += test_supply();
  fails += test_engine_lifecycle();
  fails += test_digests();
  fails += test_state_export();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
