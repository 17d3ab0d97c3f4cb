#include <iostream>

int test_calendar();
int test_growth();
int test_crops();
int test_plot_simulator();
int test_processing();
int test_aging();
int test_simulation();
int test_animals();
int test_bees();
int test_fruit_trees();
int test_economy();
int test_config();
int test_config_validation();
int test_report();
int test_file_io();
int test_json_bom();
int test_json_errors();
int test_save_import();
int test_ancient_seeds();

int main() {
  int fails = 0;
  fails += test_calendar();
  fails += test_growth();
  fails += test_crops();
  fails += test_plot_simulator();
  fails += test_processing();
  fails += test_aging();
  fails += test_simulation();
  fails += test_animals();
  fails += test_bees();
  fails += test_fruit_trees();
  fails += test_economy();
  fails += test_config();
  fails += test_config_validation();
  fails += test_report();
  fails += test_file_io();
  fails += test_json_bom();
  fails += test_json_errors();
  fails += test_save_import();
  fails += test_ancient_seeds();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
