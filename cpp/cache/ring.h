#pragma once

#include <cstddef>
#include <vector>

namespace fifocache {
namespace cache {

// One historical insertion position. occupied is false for slots never
// written, reclaimed by eviction, or found stale.
template <typename K>
struct KeySlot {
  K key{};
  bool occupied = false;
};

// Fixed-size circular record of a shard's insertion order. Slots are reused
// in place; a deleted key's slot stays occupied until the cursor comes back
// around to it. Not synchronized: the owning shard's lock covers it.
template <typename K>
class EvictionRing {
 public:
  explicit EvictionRing(size_t len) : _slots(len == 0 ? 1 : len), _cursor(0) {}
  ~EvictionRing() {}

  size_t Len() const { return _slots.size(); }
  size_t Cursor() const { return _cursor; }

  // Slot under the cursor
  KeySlot<K> &Current() { return _slots[_cursor]; }
  const KeySlot<K> &At(size_t i) const { return _slots[i]; }

  void Advance() { _cursor = (_cursor + 1) % _slots.size(); }

  // Record k at the cursor, overwriting whatever was there, and advance.
  void Push(const K &k) {
    _slots[_cursor].key = k;
    _slots[_cursor].occupied = true;
    Advance();
  }

  void Reset() {
    for (auto &s : _slots) {
      s = KeySlot<K>();
    }
    _cursor = 0;
  }

 private:
  std::vector<KeySlot<K>> _slots;
  size_t _cursor;
};

};  // namespace cache
};  // namespace fifocache
