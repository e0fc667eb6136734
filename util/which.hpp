#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Results are cached for the
// lifetime of the process. Commands containing a slash are returned
// unchanged if they exist. Returns an empty string if the command cannot be
// found, and throws if PATH is not set.
std::string which(const std::string& cmd);

}  // namespace util

#endif
