#include <stdlib.h>
#include <thread>
#include <vector>

// Starts argv[1] threads and joins them.
int main(int argc, char** argv) {
  std::vector<std::thread> threads;
  for (int i = 0; i < atoi(argv[1]); i++) threads.emplace_back([] {});
  for (std::thread& t : threads) t.join();
  return 0;
}
