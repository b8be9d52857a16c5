#include "cache/invalidation_engine.hpp"

#include "cache/key_codec.hpp"
#include "core/logging/logger.hpp"
#include "mapping/expression_matcher.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace admapper::cache {

namespace {

std::string JoinForLog(const std::vector<std::string>& values) {
  std::string joined;
  for (const std::string& value : values) {
    if (!joined.empty()) {
      joined += " | ";
    }
    joined += value;
  }
  return joined;
}

struct StagedPrune {
  std::string key;
  std::string snapshot_value;
  std::string pruned_value;
  bool emptied = false;
};

} // namespace

InvalidationEngine::InvalidationEngine(MappingCache& cache, core::logging::Logger& logger)
    : cache_(cache), logger_(logger) {}

PruneReport InvalidationEngine::RemoveDisabledDetectorMappings(
    const std::vector<mapping::DetectorMapping>& disabled_mappings) {
  PruneReport report;

  std::unordered_set<std::string> disabled_ids;
  for (const mapping::DetectorMapping& mapping : disabled_mappings) {
    std::string canonical;
    std::string error;
    if (!mapping::NormalizeDetectorId(mapping.detector.Id(), canonical, error)) {
      ++report.mappings_skipped;
      logger_.Warn("skipping disabled mapping", {{"error", error}});
      continue;
    }
    if (disabled_ids.insert(canonical).second) {
      report.disabled_ids.push_back(canonical);
    }
  }
  if (disabled_ids.empty()) {
    return report;
  }

  std::vector<StagedPrune> staged_updates;
  std::vector<StoreEntry> corrupt;
  const std::vector<StoreEntry> snapshot = cache_.Entries();
  report.entries_scanned = snapshot.size();

  for (const StoreEntry& entry : snapshot) {
    std::vector<mapping::Detector> detectors;
    CodecError codec_error;
    if (!DecodeDetectorIds(entry.value, detectors, codec_error)) {
      corrupt.push_back(entry);
      logger_.Warn("undecodable cache value during prune",
                   {{"cache_key", entry.key}, {"error", FormatCodecError(codec_error)}});
      continue;
    }

    const auto before = detectors.size();
    detectors.erase(std::remove_if(detectors.begin(), detectors.end(),
                                   [&](const mapping::Detector& detector) {
                                     return disabled_ids.count(detector.Id()) != 0U;
                                   }),
                    detectors.end());
    if (detectors.size() == before) {
      continue;
    }
    staged_updates.push_back(StagedPrune{.key = entry.key,
                                         .snapshot_value = entry.value,
                                         .pruned_value = EncodeDetectorIds(detectors),
                                         .emptied = detectors.empty()});
  }

  logger_.Info("removing disabled detectors from cache entries",
               {{"detector_ids", JoinForLog(report.disabled_ids)},
                {"entries_scanned", std::to_string(report.entries_scanned)},
                {"entries_to_update", std::to_string(staged_updates.size())}});

  // An entry that expired, was evicted or was rewritten since the snapshot
  // is skipped rather than written back with a fresh TTL.
  for (StagedPrune& update : staged_updates) {
    const std::string detector_ids = update.pruned_value;
    if (!cache_.ReplaceEncoded(update.key, update.snapshot_value,
                               std::move(update.pruned_value))) {
      ++report.entries_superseded;
      logger_.Debug("cache entry changed since snapshot; prune skipped",
                    {{"cache_key", update.key}});
      continue;
    }
    ++report.entries_pruned;
    if (update.emptied) {
      ++report.entries_emptied;
    }
    logger_.Debug("cache entry pruned", {{"cache_key", update.key}, {"detector_ids", detector_ids}});
  }
  for (const StoreEntry& entry : corrupt) {
    if (cache_.EvictCorrupt(entry.key, entry.value, "undecodable value found during prune")) {
      ++report.corrupt_entries;
    }
  }
  return report;
}

EvictionReport InvalidationEngine::InvalidateEntriesWithChangedMappings(
    const std::vector<mapping::DetectorMapping>& changed_mappings) {
  EvictionReport report;
  report.mappings_received = changed_mappings.size();

  std::vector<mapping::TagMap> required_tag_sets;
  required_tag_sets.reserve(changed_mappings.size());
  for (const mapping::DetectorMapping& mapping : changed_mappings) {
    mapping::TagMap required;
    std::string error;
    if (!mapping::FlattenExpression(mapping.expression, required, error)) {
      ++report.mappings_skipped;
      logger_.Warn("skipping mapping with invalid expression",
                   {{"detector_id", mapping.detector.Id()}, {"error", error}});
      continue;
    }
    required_tag_sets.push_back(std::move(required));
  }
  if (required_tag_sets.empty()) {
    return report;
  }

  std::vector<std::string> staged_keys;
  std::vector<StoreEntry> corrupt;
  const std::vector<StoreEntry> snapshot = cache_.Entries();
  report.entries_scanned = snapshot.size();

  for (const StoreEntry& entry : snapshot) {
    mapping::TagMap metric_tags;
    CodecError codec_error;
    if (!DecodeKey(entry.key, metric_tags, codec_error)) {
      corrupt.push_back(entry);
      logger_.Warn("undecodable cache key during invalidation",
                   {{"cache_key", entry.key}, {"error", FormatCodecError(codec_error)}});
      continue;
    }
    for (const mapping::TagMap& required : required_tag_sets) {
      if (mapping::Matches(metric_tags, required)) {
        staged_keys.push_back(entry.key);
        break;
      }
    }
  }

  std::vector<std::string> detector_ids;
  detector_ids.reserve(changed_mappings.size());
  for (const mapping::DetectorMapping& mapping : changed_mappings) {
    detector_ids.push_back(mapping.detector.Id());
  }
  logger_.Info("invalidating cache entries for changed mappings",
               {{"cache_keys", JoinForLog(staged_keys)},
                {"detector_ids", JoinForLog(detector_ids)},
                {"entries_scanned", std::to_string(report.entries_scanned)}});

  cache_.Remove(staged_keys);
  for (const StoreEntry& entry : corrupt) {
    if (cache_.EvictCorrupt(entry.key, entry.value, "undecodable key found during invalidation")) {
      ++report.corrupt_entries;
    }
  }
  report.evicted_keys = std::move(staged_keys);
  return report;
}

} // namespace admapper::cache
