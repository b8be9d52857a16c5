#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace admapper::config {

// Entries not rewritten within this window stop being served.
constexpr std::chrono::milliseconds kDefaultCacheTtl = std::chrono::minutes(120);
constexpr std::size_t kDefaultShardCount = 16;
constexpr std::size_t kMaxShardCount = 4096;
constexpr std::chrono::milliseconds kDefaultRefreshInterval = std::chrono::minutes(1);

struct CacheConfig {
  std::chrono::milliseconds ttl = kDefaultCacheTtl;
  std::size_t shard_count = kDefaultShardCount;
};

struct ServiceConfig {
  CacheConfig cache;
  // Period of the external refresh trigger. Read by the scheduler that owns
  // the refresher; the cache itself never schedules anything.
  std::chrono::milliseconds refresh_interval = kDefaultRefreshInterval;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Parses config JSON:
//   {
//     "cache": {"ttl_ms": 7200000, "shard_count": 16},
//     "refresh_interval_ms": 60000,
//     "log_level": "info"
//   }
// Every field is optional and falls back to the defaults above. Unknown
// fields, wrong types and out-of-range values are rejected with an error
// naming the offending path (for example `cache.ttl_ms`).
bool ParseServiceConfigText(std::string_view json_text, ServiceConfig& config, std::string& error);

bool LoadServiceConfigFile(const std::string& path, ServiceConfig& config, std::string& error);

// One-line summary for logs and `validate-config` output.
std::string DescribeServiceConfig(const ServiceConfig& config);

} // namespace admapper::config
