#pragma once

#include "cache/concurrent_store.hpp"
#include "mapping/detector.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace admapper::core::logging {
class Logger;
}

namespace admapper::cache {

// Point-in-time read of the cache instruments. Counters are monotonic for
// the lifetime of the cache; `size` is a gauge.
struct CacheStats {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t size = 0;
  std::uint64_t corrupt_evictions = 0;
};

// Detector-mapping cache: encoded tag-set key -> encoded detector-id list.
//
// Example: metric tags {k1: v1, k2: v2} matching detectors D1 and D2 are
// held as ("k1:v1,k2:v2" -> "<uuid-1>,<uuid-2>"). One string per side keeps
// the per-entry footprint small when millions of tag-sets are cached.
//
// The instance is built and owned by the composing service and handed to the
// lookup front end and the invalidation engine by reference.
//
// Thread-safety: all methods may be called concurrently. `Find`/`Get`/`Put`
// touch one store partition; nothing here takes a cache-wide lock.
class MappingCache {
public:
  MappingCache(std::unique_ptr<IConcurrentStore> store, core::logging::Logger& logger);

  MappingCache(const MappingCache&) = delete;
  MappingCache& operator=(const MappingCache&) = delete;

  // Counts one hit or one miss. An entry that is present but holds no
  // detectors is a hit returning an empty list. A stored value that fails
  // to decode is logged, evicted and reported as a miss.
  std::optional<std::vector<mapping::Detector>> Find(const std::string& key);

  // `Find` with a miss mapped to an empty list.
  std::vector<mapping::Detector> Get(const std::string& key);

  // Last writer wins. Restarts the entry's TTL and refreshes the size gauge.
  // Ids are stored lowercased; an id that is not UUID text at all is dropped
  // with a warning so the stored value always decodes.
  void Put(const std::string& key, const std::vector<mapping::Detector>& detectors);

  // Raw access for the invalidation engine. Entries are already encoded.
  std::vector<StoreEntry> Entries() const;
  void PutEncoded(const std::vector<StoreEntry>& entries);
  // Rewrites `key` only while it is live and still holds `expected_value`,
  // so an entry that expired or changed since it was read is left alone.
  bool ReplaceEncoded(const std::string& key, const std::string& expected_value,
                      std::string value);
  std::size_t Remove(const std::vector<std::string>& keys);

  // Drops `key` only if it still holds `corrupt_value`, so a concurrent
  // repopulation is not thrown away.
  bool EvictCorrupt(const std::string& key, const std::string& corrupt_value,
                    const std::string& reason);

  std::size_t PurgeExpired();

  CacheStats Stats() const;

private:
  void RefreshSizeGauge();

  std::unique_ptr<IConcurrentStore> store_;
  core::logging::Logger& logger_;
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> size_{0};
  std::atomic<std::uint64_t> corrupt_evictions_{0};
};

} // namespace admapper::cache
