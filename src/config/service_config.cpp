#include "config/service_config.hpp"

#include "core/json_dom.hpp"
#include "core/time_utils.hpp"

#include <cstdint>
#include <initializer_list>

namespace admapper::config {

namespace {

using JsonValue = core::json::Value;

bool RejectUnknownMembers(const JsonValue& object,
                          std::string_view path_prefix,
                          std::initializer_list<std::string_view> allowed,
                          std::string& error) {
  for (const auto& [name, value] : object.object_value) {
    (void)value;
    bool known = false;
    for (const std::string_view candidate : allowed) {
      if (candidate == name) {
        known = true;
        break;
      }
    }
    if (!known) {
      error = "unknown config field: " + std::string(path_prefix) + name;
      return false;
    }
  }
  return true;
}

bool ReadPositiveMillis(const JsonValue& parent,
                        std::string_view key,
                        std::string_view path,
                        std::chrono::milliseconds& target,
                        std::string& error) {
  const JsonValue* value = core::json::FindMember(parent, key);
  if (value == nullptr) {
    return true;
  }
  std::uint64_t parsed = 0;
  if (!core::json::TryGetUnsigned(*value, parsed) || parsed == 0U) {
    error = std::string(path) + " must be a positive integer number of milliseconds";
    return false;
  }
  target = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(parsed));
  return true;
}

bool ParseCacheSection(const JsonValue& root, CacheConfig& cache, std::string& error) {
  const JsonValue* section = core::json::FindMember(root, "cache");
  if (section == nullptr) {
    return true;
  }
  if (!section->IsObject()) {
    error = "cache must be an object";
    return false;
  }
  if (!RejectUnknownMembers(*section, "cache.", {"ttl_ms", "shard_count"}, error)) {
    return false;
  }
  if (!ReadPositiveMillis(*section, "ttl_ms", "cache.ttl_ms", cache.ttl, error)) {
    return false;
  }

  if (const JsonValue* shards = core::json::FindMember(*section, "shard_count");
      shards != nullptr) {
    std::uint64_t parsed = 0;
    if (!core::json::TryGetUnsigned(*shards, parsed) || parsed == 0U ||
        parsed > kMaxShardCount) {
      error = "cache.shard_count must be an integer in [1, " + std::to_string(kMaxShardCount) +
              "]";
      return false;
    }
    cache.shard_count = static_cast<std::size_t>(parsed);
  }
  return true;
}

bool ParseServiceConfigRoot(const JsonValue& root, ServiceConfig& config, std::string& error) {
  if (!root.IsObject()) {
    error = "config root must be a JSON object";
    return false;
  }
  if (!RejectUnknownMembers(root, "", {"cache", "refresh_interval_ms", "log_level"}, error)) {
    return false;
  }

  ServiceConfig parsed;
  if (!ParseCacheSection(root, parsed.cache, error)) {
    return false;
  }
  if (!ReadPositiveMillis(root, "refresh_interval_ms", "refresh_interval_ms",
                          parsed.refresh_interval, error)) {
    return false;
  }

  if (const JsonValue* level = core::json::FindMember(root, "log_level"); level != nullptr) {
    if (!level->IsString()) {
      error = "log_level must be a string (" + core::logging::ExpectedLogLevelList() + ")";
      return false;
    }
    if (!core::logging::ParseLogLevel(level->string_value, parsed.log_level, error)) {
      error = "log_level: " + error;
      return false;
    }
  }

  config = parsed;
  return true;
}

} // namespace

bool ParseServiceConfigText(std::string_view json_text, ServiceConfig& config,
                            std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  return ParseServiceConfigRoot(root, config, error);
}

bool LoadServiceConfigFile(const std::string& path, ServiceConfig& config, std::string& error) {
  JsonValue root;
  if (!core::json::ParseFile(path, root, error)) {
    return false;
  }
  if (!ParseServiceConfigRoot(root, config, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

std::string DescribeServiceConfig(const ServiceConfig& config) {
  return "cache.ttl=" + core::FormatMillis(config.cache.ttl) +
         " cache.shard_count=" + std::to_string(config.cache.shard_count) +
         " refresh_interval=" + core::FormatMillis(config.refresh_interval) +
         " log_level=" + core::logging::ToString(config.log_level);
}

} // namespace admapper::config
