#include "util/which.hpp"

#include <unistd.h>

#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::unordered_map<std::string, std::string> cmd_cache;
std::mutex cmd_cache_mutex;

bool is_executable(const std::string& path) {
  return access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd) {
  if (cmd.find('/') != std::string::npos) {
    return is_executable(cmd) ? cmd : "";
  }
  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");

  std::lock_guard<std::mutex> lck(cmd_cache_mutex);
  if (cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  std::vector<std::string> dirs = absl::StrSplit(path, ':', absl::SkipEmpty());
  for (const std::string& dir : dirs) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (is_executable(fullpath)) return cmd_cache[cmd] = fullpath;
  }

  return cmd_cache[cmd] = "";
}

}  // namespace util
