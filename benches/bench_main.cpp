#include <iostream>

void run_chunker_benchmarks();
void run_catalog_benchmarks();

int main() {
  std::cout << "transloom benchmarks\n";
  run_chunker_benchmarks();
  run_catalog_benchmarks();
  return 0;
}
