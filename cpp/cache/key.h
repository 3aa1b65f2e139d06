#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

namespace fifocache {
namespace cache {

// Keys must compare for equality and have a std::hash specialization.
template <typename K>
concept Hashable = std::equality_comparable<K> && requires(const K &k) {
  { std::hash<K>{}(k) } -> std::convertible_to<size_t>;
};

// Per-process random seed, fixed on first use.
uint64_t hash_seed();

// 64-bit finalizer so that weak std::hash outputs (identity for integers)
// spread over every shard.
uint64_t mix64(uint64_t h);

// Seeded fnv64a over the key's bytes.
uint64_t hash_bytes(std::string_view b);

template <Hashable K>
uint64_t HashKey(const K &k) {
  if constexpr (std::is_convertible_v<const K &, std::string_view>) {
    return hash_bytes(std::string_view(k));
  } else {
    return mix64((uint64_t)std::hash<K>{}(k) ^ hash_seed());
  }
}

template <Hashable K>
uint32_t key2shard(const K &k, uint32_t nshard) {
  return (uint32_t)(HashKey(k) % nshard);
}

};  // namespace cache
};  // namespace fifocache
