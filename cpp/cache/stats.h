#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace fifocache {
namespace cache {

// Point-in-time cache counters. Filled by Cache::UpdateStats, which adds to
// the existing values; call Reset before reusing a Stats.
struct Stats {
  // Number of Get and Has calls, plus GetOrSet calls that found the key.
  uint64_t get_calls = 0;
  // Number of Set calls, plus GetOrSet/SetIfAbsent calls that stored.
  uint64_t set_calls = 0;
  uint64_t misses = 0;
  uint64_t hits = 0;
  // Number of Delete and GetAndDelete calls, whether or not the key existed.
  uint64_t deletes = 0;
  // Number of entries dropped to make room for new ones.
  uint64_t evictions = 0;
  uint64_t entries_count = 0;
  uint64_t max_entries = 0;

  void Reset();
  std::string String() const;
};

};  // namespace cache
};  // namespace fifocache

template <>
struct fmt::formatter<fifocache::cache::Stats>
    : fmt::formatter<std::string_view> {
  template <class FmtContext>
  auto format(const fifocache::cache::Stats &s, FmtContext &ctx) const {
    return fmt::formatter<std::string_view>::format(s.String(), ctx);
  }
};
