#include "cache/sharded_ttl_store.hpp"

#include <algorithm>
#include <functional>

namespace admapper::cache {

namespace {

// A shard sweeps itself once it has seen this many writes, or as many writes
// as it holds entries, whichever is larger. Keeps reclamation amortized O(1)
// per put.
constexpr std::size_t kMinWritesBetweenSweeps = 64;

} // namespace

ShardedTtlStore::ShardedTtlStore(const std::chrono::milliseconds ttl,
                                 const std::size_t shard_count,
                                 const core::IClock& clock)
    : ttl_(ttl), clock_(clock) {
  const std::size_t count = std::max<std::size_t>(shard_count, 1U);
  shards_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

ShardedTtlStore::Shard& ShardedTtlStore::ShardFor(const std::string& key) const {
  return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

bool ShardedTtlStore::IsExpired(const Slot& slot, const core::IClock::TimePoint now) const {
  return now - slot.written_at >= ttl_;
}

std::size_t ShardedTtlStore::SweepLocked(Shard& shard, const core::IClock::TimePoint now) const {
  std::size_t dropped = 0;
  for (auto it = shard.slots.begin(); it != shard.slots.end();) {
    if (IsExpired(it->second, now)) {
      it = shard.slots.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  shard.writes_since_sweep = 0;
  shard.size.store(shard.slots.size(), std::memory_order_relaxed);
  return dropped;
}

std::optional<std::string> ShardedTtlStore::Get(const std::string& key) {
  Shard& shard = ShardFor(key);
  const auto now = clock_.Now();
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.slots.find(key);
  if (it == shard.slots.end()) {
    return std::nullopt;
  }
  if (IsExpired(it->second, now)) {
    shard.slots.erase(it);
    shard.size.store(shard.slots.size(), std::memory_order_relaxed);
    return std::nullopt;
  }
  return it->second.value;
}

void ShardedTtlStore::Put(const std::string& key, std::string value) {
  Shard& shard = ShardFor(key);
  const auto now = clock_.Now();
  std::lock_guard<std::mutex> lock(shard.mutex);
  Slot& slot = shard.slots[key];
  slot.value = std::move(value);
  slot.written_at = now;

  ++shard.writes_since_sweep;
  if (shard.writes_since_sweep >= std::max(kMinWritesBetweenSweeps, shard.slots.size())) {
    SweepLocked(shard, now);
    return;
  }
  shard.size.store(shard.slots.size(), std::memory_order_relaxed);
}

bool ShardedTtlStore::Invalidate(const std::string& key) {
  Shard& shard = ShardFor(key);
  const auto now = clock_.Now();
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.slots.find(key);
  if (it == shard.slots.end()) {
    return false;
  }
  const bool was_live = !IsExpired(it->second, now);
  shard.slots.erase(it);
  shard.size.store(shard.slots.size(), std::memory_order_relaxed);
  return was_live;
}

bool ShardedTtlStore::InvalidateIfValue(const std::string& key,
                                        const std::string& expected_value) {
  Shard& shard = ShardFor(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.slots.find(key);
  if (it == shard.slots.end() || it->second.value != expected_value) {
    return false;
  }
  shard.slots.erase(it);
  shard.size.store(shard.slots.size(), std::memory_order_relaxed);
  return true;
}

bool ShardedTtlStore::ReplaceIfValue(const std::string& key, const std::string& expected_value,
                                     std::string value) {
  Shard& shard = ShardFor(key);
  const auto now = clock_.Now();
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.slots.find(key);
  if (it == shard.slots.end() || IsExpired(it->second, now) ||
      it->second.value != expected_value) {
    return false;
  }
  it->second.value = std::move(value);
  it->second.written_at = now;
  return true;
}

std::size_t ShardedTtlStore::InvalidateAll(const std::vector<std::string>& keys) {
  std::size_t removed = 0;
  for (const std::string& key : keys) {
    if (Invalidate(key)) {
      ++removed;
    }
  }
  return removed;
}

std::vector<StoreEntry> ShardedTtlStore::Snapshot() const {
  std::vector<StoreEntry> entries;
  const auto now = clock_.Now();
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    entries.reserve(entries.size() + shard->slots.size());
    for (const auto& [key, slot] : shard->slots) {
      if (!IsExpired(slot, now)) {
        entries.push_back(StoreEntry{.key = key, .value = slot.value});
      }
    }
  }
  return entries;
}

std::size_t ShardedTtlStore::PurgeExpired() {
  std::size_t dropped = 0;
  const auto now = clock_.Now();
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    dropped += SweepLocked(*shard, now);
  }
  return dropped;
}

std::size_t ShardedTtlStore::Size() const {
  std::size_t total = 0;
  for (const auto& shard : shards_) {
    total += shard->size.load(std::memory_order_relaxed);
  }
  return total;
}

} // namespace admapper::cache
