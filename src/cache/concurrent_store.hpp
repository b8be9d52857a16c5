#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace admapper::cache {

struct StoreEntry {
  std::string key;
  std::string value;
};

// Thread-safe string -> string store with expire-after-write semantics.
//
// Contract:
// - every method may be called from any number of threads concurrently
// - `Get` never returns an entry whose last `Put` is older than the TTL,
//   whether or not that entry has been purged yet
// - `Snapshot` is a point-in-time copy per partition, not a global freeze;
//   writes racing with it may or may not be reflected
class IConcurrentStore {
public:
  virtual ~IConcurrentStore() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  // Overwrites unconditionally and restarts the entry's TTL.
  virtual void Put(const std::string& key, std::string value) = 0;

  // Returns true when a live entry was removed.
  virtual bool Invalidate(const std::string& key) = 0;

  // Removes `key` only while it still holds `expected_value`.
  virtual bool InvalidateIfValue(const std::string& key, const std::string& expected_value) = 0;

  // Overwrites `key` only while it is live and still holds `expected_value`.
  // A successful replace restarts the entry's TTL.
  virtual bool ReplaceIfValue(const std::string& key, const std::string& expected_value,
                              std::string value) = 0;

  // Returns the number of live entries removed.
  virtual std::size_t InvalidateAll(const std::vector<std::string>& keys) = 0;

  virtual std::vector<StoreEntry> Snapshot() const = 0;

  // Reclaims expired entries; returns how many were dropped.
  virtual std::size_t PurgeExpired() = 0;

  // Entries currently held, including expired ones not yet reclaimed.
  virtual std::size_t Size() const = 0;
};

} // namespace admapper::cache
