#include <iostream>

void run_config_benchmark();
void run_context_benchmark();
void run_loop_detector_benchmark();

int main() {
  std::cout << "Drover Benchmarks\n";
  run_config_benchmark();
  run_context_benchmark();
  run_loop_detector_benchmark();
  return 0;
}
