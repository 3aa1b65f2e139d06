#pragma once

#include <cache/key.h>
#include <cache/ring.h>
#include <cache/stats.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fifocache {
namespace cache {

// One independently locked partition of the key space. The live counter and
// capacity belong to the owning cache and are shared by all its shards.
template <Hashable K, typename V>
class Shard {
 public:
  Shard(std::atomic<int64_t> &live, int64_t capacity, size_t ring_len)
      : _mu(),
        _map(),
        _ring(ring_len),
        _live(live),
        _capacity(capacity),
        _get_calls(0),
        _set_calls(0),
        _misses(0),
        _deletes(0),
        _evictions(0) {}
  ~Shard() {}

  std::optional<V> Get(const K &key) {
    std::shared_lock<std::shared_mutex> lock(_mu);
    _get_calls.fetch_add(1, std::memory_order_relaxed);
    auto it = _map.find(key);
    if (it == _map.end()) {
      _misses.fetch_add(1, std::memory_order_relaxed);
      return std::nullopt;
    }
    return it->second;
  }

  void Set(const K &key, const V &val) {
    _set_calls.fetch_add(1, std::memory_order_relaxed);
    std::unique_lock<std::shared_mutex> lock(_mu);
    // Updates keep the key's original place in the eviction order.
    auto it = _map.find(key);
    if (it != _map.end()) {
      it->second = val;
      return;
    }
    insert_locked(key, val);
  }

  // Returns the existing value and true, or stores val and returns it with
  // false.
  std::pair<V, bool> GetOrSet(const K &key, const V &val) {
    std::unique_lock<std::shared_mutex> lock(_mu);
    auto it = _map.find(key);
    if (it != _map.end()) {
      _get_calls.fetch_add(1, std::memory_order_relaxed);
      return {it->second, true};
    }
    _set_calls.fetch_add(1, std::memory_order_relaxed);
    insert_locked(key, val);
    return {val, false};
  }

  bool SetIfAbsent(const K &key, const V &val) {
    std::unique_lock<std::shared_mutex> lock(_mu);
    if (_map.contains(key)) {
      return false;
    }
    _set_calls.fetch_add(1, std::memory_order_relaxed);
    insert_locked(key, val);
    return true;
  }

  // The key's ring slot is left in place and reconciled when the cursor next
  // reaches it.
  void Delete(const K &key) {
    _deletes.fetch_add(1, std::memory_order_relaxed);
    std::unique_lock<std::shared_mutex> lock(_mu);
    if (_map.erase(key) > 0) {
      _live.fetch_sub(1);
    }
  }

  std::optional<V> GetAndDelete(const K &key) {
    _deletes.fetch_add(1, std::memory_order_relaxed);
    std::unique_lock<std::shared_mutex> lock(_mu);
    auto it = _map.find(key);
    if (it == _map.end()) {
      return std::nullopt;
    }
    std::optional<V> v(std::move(it->second));
    _map.erase(it);
    _live.fetch_sub(1);
    return v;
  }

  // Drop all entries and counters. The caller resets the live counter.
  void Clear() {
    std::unique_lock<std::shared_mutex> lock(_mu);
    _map = std::unordered_map<K, V>();
    _ring.Reset();
    _get_calls.store(0);
    _set_calls.store(0);
    _misses.store(0);
    _deletes.store(0);
    _evictions.store(0);
  }

  // Copy of the shard's current contents, in map order.
  std::vector<std::pair<K, V>> Copy() const {
    std::shared_lock<std::shared_mutex> lock(_mu);
    return std::vector<std::pair<K, V>>(_map.begin(), _map.end());
  }

  // Number of keys resident in this shard
  size_t Len() const {
    std::shared_lock<std::shared_mutex> lock(_mu);
    return _map.size();
  }

  // Add this shard's counters to st.
  void AddStats(Stats &st) const {
    st.get_calls += _get_calls.load(std::memory_order_relaxed);
    st.set_calls += _set_calls.load(std::memory_order_relaxed);
    st.misses += _misses.load(std::memory_order_relaxed);
    st.deletes += _deletes.load(std::memory_order_relaxed);
    st.evictions += _evictions.load(std::memory_order_relaxed);
  }

 private:
  mutable std::shared_mutex _mu;
  std::unordered_map<K, V> _map;
  EvictionRing<K> _ring;
  std::atomic<int64_t> &_live;
  int64_t _capacity;
  std::atomic<uint64_t> _get_calls;
  std::atomic<uint64_t> _set_calls;
  std::atomic<uint64_t> _misses;
  std::atomic<uint64_t> _deletes;
  std::atomic<uint64_t> _evictions;

  // Insert a key known to be absent. Caller holds _mu exclusively.
  //
  // While the cache as a whole is at capacity, reclaim this shard's oldest
  // ring slots, visiting each slot at most once. The live counter may be
  // stale by the time the map changes, so concurrent inserts into different
  // shards can overshoot capacity by one each. Pressure coming only from
  // other shards can leave a full revolution with nothing to evict.
  void insert_locked(const K &key, const V &val) {
    size_t n = _ring.Len();
    for (size_t i = 0; i < n && _live.load() >= _capacity && !_map.empty();
         i++) {
      KeySlot<K> &slot = _ring.Current();
      if (slot.occupied) {
        if (_map.erase(slot.key) > 0) {
          _live.fetch_sub(1);
          _evictions.fetch_add(1, std::memory_order_relaxed);
        }
        // else: deleted earlier, its count is already gone
        slot.occupied = false;
      }
      // Once there is room again, stay on the reclaimed slot so the new key
      // takes the evicted key's position.
      if (_live.load() < _capacity) {
        break;
      }
      _ring.Advance();
    }
    // If the shard holds more keys than ring slots, this overwrites a live
    // key's slot and that key is no longer tracked for eviction.
    _ring.Push(key);
    _map.emplace(key, val);
    _live.fetch_add(1);
  }
};

};  // namespace cache
};  // namespace fifocache
