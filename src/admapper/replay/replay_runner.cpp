#include "admapper/replay/replay_runner.hpp"

#include "cache/invalidation_engine.hpp"
#include "cache/key_codec.hpp"
#include "cache/mapping_cache.hpp"
#include "cache/sharded_ttl_store.hpp"
#include "core/clock.hpp"
#include "core/logging/logger.hpp"
#include "metrics/stats_json.hpp"
#include "refresh/mapping_refresher.hpp"
#include "resolver/detector_mapper.hpp"
#include "resolver/static_mapping_service.hpp"

#include <memory>
#include <string>
#include <vector>

namespace admapper::replay {

void RunReplay(const ReplayPlan& plan, const config::ServiceConfig& config, std::ostream& out,
               core::logging::Logger& logger) {
  core::SteadyClock clock;
  cache::MappingCache cache(
      std::make_unique<cache::ShardedTtlStore>(config.cache.ttl, config.cache.shard_count, clock),
      logger);
  cache::InvalidationEngine engine(cache, logger);
  resolver::StaticMappingService service(plan.initial_mappings);
  resolver::DetectorMapper mapper(cache, service, logger);
  refresh::MappingRefresher refresher(engine, logger);
  refresher.Prime(plan.initial_mappings);

  logger.Info("replay started", {{"config", config::DescribeServiceConfig(config)},
                                 {"steps", std::to_string(plan.steps.size())}});

  for (const ReplayStep& step : plan.steps) {
    if (step.kind == ReplayStep::Kind::kLookup) {
      const std::vector<mapping::Detector> detectors = mapper.Lookup(step.tags);
      out << "lookup key=" << cache::EncodeKey(step.tags)
          << " detectors=" << mapping::JoinDetectorIds(detectors) << '\n';
      continue;
    }

    service.ReplaceMappings(step.mappings);
    const refresh::RefreshReport report = refresher.RunCycle(step.mappings);
    out << "refresh disabled=" << report.newly_disabled
        << " changed=" << report.created_or_changed
        << " pruned=" << report.prune.entries_pruned
        << " evicted=" << report.eviction.evicted_keys.size()
        << " skipped_mappings="
        << report.prune.mappings_skipped + report.eviction.mappings_skipped << '\n';
  }

  out << "stats " << metrics::FormatStatsJson(cache.Stats(), mapper.Stats()) << '\n';
}

} // namespace admapper::replay
