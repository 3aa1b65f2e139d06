#pragma once

#include <cache/key.h>
#include <cache/shard.h>
#include <cache/snapshot.h>
#include <cache/stats.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <serr/serr.h>
#include <util/codec/codec.h>
#include <util/common/util.h>
#include <util/log/log.h>

#include <atomic>
#include <expected>
#include <functional>
#include <future>
#include <istream>
#include <memory>
#include <new>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fifocache {
namespace cache {

const uint32_t NSHARD = 16;

const std::string CACHE = "CACHE";
const std::string CACHE_ERR = CACHE + fifocache::util::log::ERR;

// A thread-safe in-memory cache holding at most capacity entries (give or
// take concurrent races), evicting the oldest inserted entries first.
//
// Keys are spread over a fixed number of shards, each with its own lock, map
// and insertion-order ring. A single atomic live-entry counter decides when
// the cache is full; the shard receiving a new key then evicts from its own
// ring. Reads never change eviction order, and neither do updates of an
// existing key.
template <Hashable K, typename V>
class Cache {
 public:
  explicit Cache(int64_t capacity) : Cache(capacity, NSHARD) {}
  Cache(int64_t capacity, uint32_t nshard)
      : _capacity(capacity), _live(0), _shards() {
    if (capacity <= 0) {
      fatal("capacity must be greater than 0; got {}", capacity);
    }
    if (nshard == 0) {
      fatal("nshard must be greater than 0");
    }
    size_t ring_len =
        (size_t)(capacity / nshard + (capacity % nshard == 0 ? 0 : 1));
    _shards.reserve(nshard);
    for (uint32_t i = 0; i < nshard; i++) {
      _shards.push_back(
          std::make_unique<Shard<K, V>>(_live, capacity, ring_len));
    }
    log(CACHE, "New cache capacity:{} nshard:{} ring_len:{}", capacity, nshard,
        ring_len);
  }
  ~Cache() {}

  // Stores (key, val). The entry may be evicted at any time by later inserts.
  void Set(const K &key, const V &val) { shard(key).Set(key, val); }

  std::optional<V> Get(const K &key) { return shard(key).Get(key); }

  bool Has(const K &key) { return Get(key).has_value(); }

  // Returns the stored value and true if key is present; otherwise stores val
  // and returns it with false.
  std::pair<V, bool> GetOrSet(const K &key, const V &val) {
    return shard(key).GetOrSet(key, val);
  }

  // Stores val only if key is absent. Returns whether it stored.
  bool SetIfAbsent(const K &key, const V &val) {
    return shard(key).SetIfAbsent(key, val);
  }

  void Delete(const K &key) { shard(key).Delete(key); }

  std::optional<V> GetAndDelete(const K &key) {
    return shard(key).GetAndDelete(key);
  }

  // Removes every entry and zeroes all counters. Shards are cleared one at a
  // time, so a concurrent Set may land before or after its shard's turn.
  void Clear() {
    for (auto &s : _shards) {
      s->Clear();
    }
    _live.store(0);
    log(CACHE, "Cleared cache capacity:{}", _capacity);
  }

  int64_t Len() const {
    int64_t n = _live.load();
    return n < 0 ? 0 : n;
  }
  int64_t Capacity() const { return _capacity; }
  uint32_t NShard() const { return (uint32_t)_shards.size(); }

  // Calls f for every entry until f returns false. Each shard is copied under
  // its read lock and f runs after the lock is released, so f may use the
  // cache. Entries changed concurrently may or may not be seen. Returns false
  // if f stopped the iteration.
  bool All(std::function<bool(const K &, const V &)> f) const {
    for (auto &s : _shards) {
      auto kvs = s->Copy();
      for (auto &[k, v] : kvs) {
        if (!f(k, v)) {
          return false;
        }
      }
    }
    return true;
  }

  bool Keys(std::function<bool(const K &)> f) const {
    return All([&f](const K &k, const V &) { return f(k); });
  }

  bool Values(std::function<bool(const V &)> f) const {
    return All([&f](const K &, const V &v) { return f(v); });
  }

  // Adds the cache's counters to st. Shards are read one by one without
  // stopping writers, so the result is approximate under concurrency.
  void UpdateStats(Stats &st) const {
    for (auto &s : _shards) {
      s->AddStats(st);
    }
    st.entries_count = (uint64_t)Len();
    st.hits = st.get_calls >= st.misses ? st.get_calls - st.misses : 0;
    st.max_entries = (uint64_t)_capacity;
  }

  // Writes a compressed snapshot to os, copying shards with one worker per
  // hardware thread. Safe to call while other threads use the cache; each
  // shard is consistent, the whole snapshot need not be.
  std::expected<int, fifocache::serr::Error> SaveTo(std::ostream &os) const {
    return SaveToConcurrent(os, 0);
  }

  // As SaveTo, with at most concurrency workers. Non-positive means one per
  // hardware thread.
  std::expected<int, fifocache::serr::Error> SaveToConcurrent(
      std::ostream &os, int concurrency) const {
    auto res = [&] {
      google::protobuf::io::OstreamOutputStream out(&os);
      return save(&out, concurrency);
    }();
    if (!res.has_value()) {
      log(CACHE_ERR, "Error SaveTo: {}", res.error());
      return std::unexpected(res.error());
    }
    os.flush();
    if (!os.good()) {
      log(CACHE_ERR, "Error SaveTo: output stream failed");
      return std::unexpected(fifocache::serr::Error(
          fifocache::serr::TErrIO, "cannot write output stream"));
    }
    return 0;
  }

  // Atomically replaces pn with a snapshot of the cache. Missing parent
  // directories are created. On error pn is left as it was.
  std::expected<int, fifocache::serr::Error> SaveToFile(
      const std::string &pn) const {
    return SaveToFileConcurrent(pn, 0);
  }

  std::expected<int, fifocache::serr::Error> SaveToFileConcurrent(
      const std::string &pn, int concurrency) const {
    std::unique_ptr<snapshot::TmpFile> tmp;
    {
      auto res = snapshot::TmpFile::Create(pn);
      if (!res.has_value()) {
        log(CACHE_ERR, "Error SaveToFile {}: {}", pn, res.error());
        return std::unexpected(res.error());
      }
      tmp = std::move(res.value());
    }
    {
      auto res = save(tmp->Stream(), concurrency);
      if (!res.has_value()) {
        log(CACHE_ERR, "Error SaveToFile {}: {}", pn, res.error());
        return std::unexpected(res.error());
      }
    }
    {
      auto res = tmp->Commit();
      if (!res.has_value()) {
        log(CACHE_ERR, "Error SaveToFile {}: {}", pn, res.error());
        return std::unexpected(res.error());
      }
    }
    log(CACHE, "Saved cache to {}", pn);
    return 0;
  }

 private:
  int64_t _capacity;
  std::atomic<int64_t> _live;
  std::vector<std::unique_ptr<Shard<K, V>>> _shards;

  Shard<K, V> &shard(const K &key) {
    return *_shards[key2shard(key, (uint32_t)_shards.size())];
  }

  // Copy every shard using nworker threads. Workers claim shard indices from
  // a shared cursor and deposit each copy at its index, so the result is in
  // shard order whatever order the workers finish in. Throws the first
  // worker's exception after all workers have finished.
  std::vector<std::vector<std::pair<K, V>>> gather(int nworker) const {
    std::vector<std::vector<std::pair<K, V>>> entries(_shards.size());
    std::atomic<size_t> next(0);
    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<std::promise<int>>> promises;
    std::vector<std::future<int>> results;
    try {
      for (int w = 0; w < nworker; w++) {
        promises.push_back(std::make_shared<std::promise<int>>());
        results.push_back(promises.at(w)->get_future());
        threads.push_back(std::thread(
            [this, &next, &entries](
                std::shared_ptr<std::promise<int>> result) {
              try {
                int ncopied = 0;
                for (size_t i = next.fetch_add(1); i < _shards.size();
                     i = next.fetch_add(1)) {
                  entries[i] = _shards[i]->Copy();
                  ncopied++;
                }
                result->set_value(ncopied);
              } catch (...) {
                result->set_exception(std::current_exception());
              }
            },
            promises.at(w)));
      }
    } catch (...) {
      // Workers already running still reference next and entries.
      for (auto &t : threads) {
        t.join();
      }
      throw;
    }
    for (auto &t : threads) {
      t.join();
    }
    // Rethrows a worker's exception, if any.
    for (int w = 0; w < (int)results.size(); w++) {
      int ncopied = results.at(w).get();
      log(snapshot::SNAPSHOT, "worker {} copied {} shards", w, ncopied);
    }
    return entries;
  }

  std::expected<int, fifocache::serr::Error> save(
      google::protobuf::io::ZeroCopyOutputStream *raw, int concurrency) const {
    int nworker = concurrency;
    int par = fifocache::util::common::Parallelism();
    if (nworker <= 0 || nworker > par) {
      nworker = par;
    }
    snapshot::Writer w(raw);
    {
      auto res = w.WriteHeader(_capacity, NShard());
      if (!res.has_value()) {
        return std::unexpected(res.error());
      }
    }
    std::vector<std::vector<std::pair<K, V>>> entries;
    try {
      entries = gather(nworker);
    } catch (const std::exception &e) {
      return std::unexpected(fifocache::serr::Error(
          fifocache::serr::TErrError,
          fmt::format("copy shards: {}", e.what())));
    }
    int64_t total = 0;
    for (auto &kvs : entries) {
      total += (int64_t)kvs.size();
    }
    {
      auto res = w.WriteCount(total);
      if (!res.has_value()) {
        return std::unexpected(res.error());
      }
    }
    std::string kb;
    std::string vb;
    for (auto &kvs : entries) {
      for (auto &[k, v] : kvs) {
        {
          auto res = fifocache::util::codec::Codec<K>::Encode(k, kb);
          if (!res.has_value()) {
            return std::unexpected(res.error());
          }
        }
        {
          auto res = fifocache::util::codec::Codec<V>::Encode(v, vb);
          if (!res.has_value()) {
            return std::unexpected(res.error());
          }
        }
        {
          auto res = w.WriteEntry(kb, vb);
          if (!res.has_value()) {
            return std::unexpected(res.error());
          }
        }
      }
    }
    {
      auto res = w.Close();
      if (!res.has_value()) {
        return std::unexpected(res.error());
      }
    }
    log(snapshot::SNAPSHOT, "Saved {} entries from {} shards with {} workers",
        total, _shards.size(), nworker);
    return 0;
  }
};

// Builds a cache from a snapshot stream. Entries are inserted in stream order
// with Set, so a snapshot holding more entries than its capacity loads with
// the earliest ones evicted.
template <Hashable K, typename V>
std::expected<std::shared_ptr<Cache<K, V>>, fifocache::serr::Error> load(
    google::protobuf::io::ZeroCopyInputStream *raw) {
  snapshot::Reader r(raw);
  auto hdr = r.ReadHeader();
  if (!hdr.has_value()) {
    return std::unexpected(hdr.error());
  }
  uint32_t nshard = hdr->nshard() == 0 ? NSHARD : hdr->nshard();
  // Rings are allocated up front, so the header's capacity must fit in memory.
  std::shared_ptr<Cache<K, V>> c;
  try {
    c = std::make_shared<Cache<K, V>>(hdr->capacity(), nshard);
  } catch (const std::bad_alloc &e) {
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrCorrupt,
        fmt::format("capacity {} nshard {}: {}", hdr->capacity(), nshard,
                    e.what())));
  } catch (const std::length_error &e) {
    return std::unexpected(fifocache::serr::Error(
        fifocache::serr::TErrCorrupt,
        fmt::format("capacity {} nshard {}: {}", hdr->capacity(), nshard,
                    e.what())));
  }
  auto total = r.ReadCount();
  if (!total.has_value()) {
    return std::unexpected(total.error());
  }
  SnapshotEntry e;
  for (int64_t i = 0; i < total.value(); i++) {
    {
      auto res = r.ReadEntry(e);
      if (!res.has_value()) {
        return std::unexpected(fifocache::serr::Error(
            res.error().GetError(),
            fmt::format("entry {}: {}", i, res.error().GetMsg())));
      }
    }
    auto k = fifocache::util::codec::Codec<K>::Decode(e.key());
    if (!k.has_value()) {
      return std::unexpected(fifocache::serr::Error(
          k.error().GetError(),
          fmt::format("key of entry {}: {}", i, k.error().GetMsg())));
    }
    auto v = fifocache::util::codec::Codec<V>::Decode(e.value());
    if (!v.has_value()) {
      return std::unexpected(fifocache::serr::Error(
          v.error().GetError(),
          fmt::format("value of entry {}: {}", i, v.error().GetMsg())));
    }
    c->Set(k.value(), v.value());
  }
  log(snapshot::SNAPSHOT, "Loaded {} entries capacity:{} len:{}",
      total.value(), c->Capacity(), c->Len());
  return c;
}

template <Hashable K, typename V>
std::expected<std::shared_ptr<Cache<K, V>>, fifocache::serr::Error> LoadFrom(
    std::istream &is) {
  google::protobuf::io::IstreamInputStream in(&is);
  auto res = load<K, V>(&in);
  if (!res.has_value()) {
    log(CACHE_ERR, "Error LoadFrom: {}", res.error());
  }
  return res;
}

// Loads a cache saved with SaveToFile. A missing file is TErrNotfound.
template <Hashable K, typename V>
std::expected<std::shared_ptr<Cache<K, V>>, fifocache::serr::Error>
LoadFromFile(const std::string &pn) {
  auto f = snapshot::OpenFile(pn);
  if (!f.has_value()) {
    log(CACHE_ERR, "Error LoadFromFile {}: {}", pn, f.error());
    return std::unexpected(f.error());
  }
  auto res = load<K, V>(f.value().get());
  if (!res.has_value()) {
    log(CACHE_ERR, "Error LoadFromFile {}: {}", pn, res.error());
    return res;
  }
  log(CACHE, "Loaded cache from {}", pn);
  return res;
}

// Loads pn if possible. Any error, including a missing file, is dropped and
// an empty cache of the given capacity is returned instead.
template <Hashable K, typename V>
std::shared_ptr<Cache<K, V>> LoadFromFileOrNew(const std::string &pn,
                                               int64_t capacity) {
  auto res = LoadFromFile<K, V>(pn);
  if (res.has_value()) {
    return res.value();
  }
  log(CACHE_ERR, "LoadFromFileOrNew {}: starting empty after {}", pn,
      res.error());
  return std::make_shared<Cache<K, V>>(capacity);
}

};  // namespace cache
};  // namespace fifocache
