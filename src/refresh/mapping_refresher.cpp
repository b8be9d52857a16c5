#include "refresh/mapping_refresher.hpp"

#include "core/logging/logger.hpp"

#include <string>
#include <unordered_set>
#include <utility>

namespace admapper::refresh {

MappingDelta DiffMappings(
    const std::unordered_map<std::string, mapping::DetectorMapping>& previous,
    const std::vector<mapping::DetectorMapping>& current) {
  MappingDelta delta;
  std::unordered_set<std::string> seen;

  for (const mapping::DetectorMapping& candidate : current) {
    std::string id;
    std::string error;
    if (!mapping::NormalizeDetectorId(candidate.detector.Id(), id, error)) {
      continue;
    }
    seen.insert(id);

    const auto before = previous.find(id);
    const bool known = before != previous.end();
    if (!candidate.detector.Enabled()) {
      if (!known || before->second.detector.Enabled()) {
        delta.newly_disabled.push_back(candidate);
      }
      continue;
    }
    if (!known || !before->second.detector.Enabled()) {
      delta.created_or_changed.push_back(candidate);
    } else if (!(before->second.expression == candidate.expression)) {
      delta.created_or_changed.push_back(candidate);
      delta.retargeted_from.push_back(before->second);
    }
  }

  for (const auto& [id, mapping] : previous) {
    if (seen.count(id) != 0U || !mapping.detector.Enabled()) {
      continue;
    }
    mapping::DetectorMapping removed = mapping;
    removed.detector.SetEnabled(false);
    delta.newly_disabled.push_back(std::move(removed));
  }
  return delta;
}

MappingRefresher::MappingRefresher(cache::InvalidationEngine& engine,
                                   core::logging::Logger& logger)
    : engine_(engine), logger_(logger) {}

void MappingRefresher::Prime(const std::vector<mapping::DetectorMapping>& mappings) {
  std::lock_guard<std::mutex> lock(cycle_mutex_);
  last_applied_.clear();
  RecordLocked(mappings);
}

RefreshReport MappingRefresher::RunCycle(const std::vector<mapping::DetectorMapping>& current) {
  RefreshReport report;
  report.mappings_received = current.size();

  std::unique_lock<std::mutex> lock(cycle_mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    report.skipped = true;
    logger_.Info("refresh cycle skipped; previous cycle still running",
                 {{"mappings_received", std::to_string(current.size())}});
    return report;
  }

  const MappingDelta delta = DiffMappings(last_applied_, current);
  report.newly_disabled = delta.newly_disabled.size();
  report.created_or_changed = delta.created_or_changed.size();

  if (!delta.newly_disabled.empty()) {
    report.prune = engine_.RemoveDisabledDetectorMappings(delta.newly_disabled);
  }
  if (!delta.created_or_changed.empty()) {
    // Evict both where the detector now applies and where it used to.
    std::vector<mapping::DetectorMapping> to_evict = delta.created_or_changed;
    to_evict.insert(to_evict.end(), delta.retargeted_from.begin(), delta.retargeted_from.end());
    report.eviction = engine_.InvalidateEntriesWithChangedMappings(to_evict);
  }

  last_applied_.clear();
  RecordLocked(current);

  logger_.Info("refresh cycle applied",
               {{"mappings_received", std::to_string(report.mappings_received)},
                {"newly_disabled", std::to_string(report.newly_disabled)},
                {"created_or_changed", std::to_string(report.created_or_changed)},
                {"entries_pruned", std::to_string(report.prune.entries_pruned)},
                {"entries_evicted", std::to_string(report.eviction.evicted_keys.size())}});
  return report;
}

std::size_t MappingRefresher::KnownMappings() const {
  std::lock_guard<std::mutex> lock(cycle_mutex_);
  return last_applied_.size();
}

void MappingRefresher::RecordLocked(const std::vector<mapping::DetectorMapping>& mappings) {
  for (const mapping::DetectorMapping& candidate : mappings) {
    std::string id;
    std::string error;
    if (!mapping::NormalizeDetectorId(candidate.detector.Id(), id, error)) {
      logger_.Warn("ignoring mapping with invalid detector id", {{"error", error}});
      continue;
    }
    last_applied_[id] = candidate;
  }
}

} // namespace admapper::refresh
