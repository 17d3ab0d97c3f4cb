#include <iostream>

int test_ui_app();

int main() {
  const int fails = test_ui_app();
  if (fails == 0) {
    std::cout << "All UI tests passed\n";
    return 0;
  }
  std::cerr << fails << " UI tests failed\n";
  return 1;
}
