#include <stdlib.h>
#include <ctime>
#include <vector>

// Burns cpu time for argv[1] seconds, forever if argv[1] is negative.
int main(int argc, char** argv) {
  const constexpr int sz = 10240;
  double seconds = atof(argv[1]);
  std::clock_t start = std::clock();
  std::vector<int> v(sz, 0);
  int i = 0;
  while (seconds < 0 || (std::clock() - start) < seconds * CLOCKS_PER_SEC) {
    for (int j = 0; j < i; j++) v[j] += i;
    i = (i + 1) % sz;
  }
  return v[0] == 42;
}
