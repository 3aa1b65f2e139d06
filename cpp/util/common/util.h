#pragma once

#include <string>

namespace fifocache {
namespace util::common {

// Returns true if the given FIFOCACHE environment variable contains the given
// label.
bool ContainsLabel(std::string env_var, std::string label);

// Returns the value of the environment variable, or "" if it is unset.
std::string GetEnv(const std::string &name);

// Number of hardware threads the host reports. Never less than 1.
int Parallelism();

};  // namespace util::common
};  // namespace fifocache
