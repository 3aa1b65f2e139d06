#include <cache/key.h>

#include <random>

namespace fifocache {
namespace cache {

uint64_t hash_seed() {
  static const uint64_t seed = [] {
    std::random_device rd;
    return ((uint64_t)rd() << 32) ^ (uint64_t)rd();
  }();
  return seed;
}

uint64_t mix64(uint64_t h) {
  // splitmix64 finalizer
  h ^= h >> 30;
  h *= 0xbf58476d1ce4e5b9ULL;
  h ^= h >> 27;
  h *= 0x94d049bb133111ebULL;
  h ^= h >> 31;
  return h;
}

uint64_t hash_bytes(std::string_view b) {
  // fnv64a hash inspired by
  // https://cs.opensource.google/go/go/+/refs/tags/go1.24.3:src/hash/fnv/fnv.go
  uint64_t s = 14695981039346656037ULL ^ hash_seed();
  const uint64_t prime64 = 1099511628211ULL;
  for (size_t i = 0; i < b.size(); i++) {
    s ^= (uint64_t)(unsigned char)b[i];
    s *= prime64;
  }
  return mix64(s);
}

};  // namespace cache
};  // namespace fifocache
