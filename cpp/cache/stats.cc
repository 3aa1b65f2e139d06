#include <cache/stats.h>

namespace fifocache {
namespace cache {

void Stats::Reset() { *this = Stats(); }

std::string Stats::String() const {
  return fmt::format(
      "{{get_calls:{} set_calls:{} misses:{} hits:{} deletes:{} evictions:{} "
      "entries_count:{} max_entries:{}}}",
      get_calls, set_calls, misses, hits, deletes, evictions, entries_count,
      max_entries);
}

};  // namespace cache
};  // namespace fifocache
