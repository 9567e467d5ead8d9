#include <iostream>

void run_pattern_benchmark();
void run_gateway_benchmark();

int main() {
  std::cout << "toolwarden Benchmarks\n";
  run_pattern_benchmark();
  run_gateway_benchmark();
  return 0;
}
