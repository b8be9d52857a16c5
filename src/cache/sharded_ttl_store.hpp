#pragma once

#include "cache/concurrent_store.hpp"
#include "core/clock.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace admapper::cache {

// IConcurrentStore backed by independently locked hash-map shards.
//
// A key's shard is chosen by hashing the key, so callers touching different
// keys rarely contend. Expiry is checked lazily on read and reclaimed either
// by an explicit `PurgeExpired` or by the amortized sweep a shard runs after
// enough writes.
class ShardedTtlStore final : public IConcurrentStore {
public:
  ShardedTtlStore(std::chrono::milliseconds ttl, std::size_t shard_count,
                  const core::IClock& clock);

  std::optional<std::string> Get(const std::string& key) override;
  void Put(const std::string& key, std::string value) override;
  bool Invalidate(const std::string& key) override;
  bool InvalidateIfValue(const std::string& key, const std::string& expected_value) override;
  bool ReplaceIfValue(const std::string& key, const std::string& expected_value,
                      std::string value) override;
  std::size_t InvalidateAll(const std::vector<std::string>& keys) override;
  std::vector<StoreEntry> Snapshot() const override;
  std::size_t PurgeExpired() override;
  std::size_t Size() const override;

  std::size_t ShardCount() const {
    return shards_.size();
  }

private:
  struct Slot {
    std::string value;
    core::IClock::TimePoint written_at{};
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, Slot> slots;
    std::size_t writes_since_sweep = 0;
    std::atomic<std::size_t> size{0};
  };

  Shard& ShardFor(const std::string& key) const;
  bool IsExpired(const Slot& slot, core::IClock::TimePoint now) const;

  // Caller holds `shard.mutex`.
  std::size_t SweepLocked(Shard& shard, core::IClock::TimePoint now) const;

  std::chrono::milliseconds ttl_;
  const core::IClock& clock_;
  std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace admapper::cache
