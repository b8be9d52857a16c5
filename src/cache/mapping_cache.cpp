#include "cache/mapping_cache.hpp"

#include "cache/key_codec.hpp"
#include "core/logging/logger.hpp"

#include <utility>

namespace admapper::cache {

MappingCache::MappingCache(std::unique_ptr<IConcurrentStore> store,
                           core::logging::Logger& logger)
    : store_(std::move(store)), logger_(logger) {}

std::optional<std::vector<mapping::Detector>> MappingCache::Find(const std::string& key) {
  const std::optional<std::string> encoded = store_->Get(key);
  if (!encoded.has_value()) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }

  std::vector<mapping::Detector> detectors;
  CodecError codec_error;
  if (!DecodeDetectorIds(*encoded, detectors, codec_error)) {
    EvictCorrupt(key, *encoded, FormatCodecError(codec_error));
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }

  hits_.fetch_add(1, std::memory_order_relaxed);
  return detectors;
}

std::vector<mapping::Detector> MappingCache::Get(const std::string& key) {
  std::optional<std::vector<mapping::Detector>> found = Find(key);
  if (!found.has_value()) {
    return {};
  }
  return std::move(*found);
}

void MappingCache::Put(const std::string& key, const std::vector<mapping::Detector>& detectors) {
  std::vector<mapping::Detector> storable;
  storable.reserve(detectors.size());
  for (const mapping::Detector& detector : detectors) {
    std::string canonical;
    std::string error;
    if (!mapping::NormalizeDetectorId(detector.Id(), canonical, error)) {
      logger_.Warn("dropping invalid detector id from cache write",
                   {{"cache_key", key}, {"detector_id", detector.Id()}, {"error", error}});
      continue;
    }
    storable.emplace_back(std::move(canonical), detector.Enabled());
  }

  std::string encoded = EncodeDetectorIds(storable);
  logger_.Debug("updating cache", {{"cache_key", key}, {"detector_ids", encoded}});
  store_->Put(key, std::move(encoded));
  RefreshSizeGauge();
}

std::vector<StoreEntry> MappingCache::Entries() const {
  return store_->Snapshot();
}

void MappingCache::PutEncoded(const std::vector<StoreEntry>& entries) {
  for (const StoreEntry& entry : entries) {
    store_->Put(entry.key, entry.value);
  }
  RefreshSizeGauge();
}

bool MappingCache::ReplaceEncoded(const std::string& key, const std::string& expected_value,
                                  std::string value) {
  return store_->ReplaceIfValue(key, expected_value, std::move(value));
}

std::size_t MappingCache::Remove(const std::vector<std::string>& keys) {
  const std::size_t removed = store_->InvalidateAll(keys);
  RefreshSizeGauge();
  return removed;
}

bool MappingCache::EvictCorrupt(const std::string& key, const std::string& corrupt_value,
                                const std::string& reason) {
  const bool evicted = store_->InvalidateIfValue(key, corrupt_value);
  if (evicted) {
    corrupt_evictions_.fetch_add(1, std::memory_order_relaxed);
    RefreshSizeGauge();
  }
  logger_.Warn("evicting corrupt cache entry",
               {{"cache_key", key},
                {"stored_value", corrupt_value},
                {"error", reason},
                {"evicted", evicted ? "true" : "false"}});
  return evicted;
}

std::size_t MappingCache::PurgeExpired() {
  const std::size_t dropped = store_->PurgeExpired();
  RefreshSizeGauge();
  return dropped;
}

CacheStats MappingCache::Stats() const {
  CacheStats stats;
  stats.hits = hits_.load(std::memory_order_relaxed);
  stats.misses = misses_.load(std::memory_order_relaxed);
  stats.size = size_.load(std::memory_order_relaxed);
  stats.corrupt_evictions = corrupt_evictions_.load(std::memory_order_relaxed);
  return stats;
}

void MappingCache::RefreshSizeGauge() {
  size_.store(static_cast<std::uint64_t>(store_->Size()), std::memory_order_relaxed);
}

} // namespace admapper::cache
