#include <util/common/util.h>

#include <cstdlib>
#include <thread>

namespace fifocache {
namespace util::common {

bool ContainsLabel(std::string env_var, std::string label) {
  bool contains_label = false;
  size_t nextpos = env_var.find(label);
  while (nextpos != std::string::npos) {
    // Save current pos
    size_t pos = nextpos;
    // Advance nextpos
    nextpos = env_var.find(label, pos + 1);
    // Check that the label is delimited on either side. If not, continue
    if (!(pos == 0 || env_var[pos - 1] == ';')) {
      continue;
    }
    if (!(pos + label.length() == env_var.length() ||
          env_var[pos + label.length()] == ';')) {
      continue;
    }
    contains_label = true;
    break;
  }
  return contains_label;
}

std::string GetEnv(const std::string &name) {
  const char *v = std::getenv(name.c_str());
  if (v == nullptr) {
    return "";
  }
  return std::string(v);
}

int Parallelism() {
  unsigned int n = std::thread::hardware_concurrency();
  if (n == 0) {
    return 1;
  }
  return (int)n;
}

};  // namespace util::common
};  // namespace fifocache
