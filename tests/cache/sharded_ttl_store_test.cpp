#include "cache/sharded_ttl_store.hpp"

#include "../common/mapping_fixtures.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

using admapper::cache::ShardedTtlStore;
using admapper::cache::StoreEntry;
namespace common = admapper::tests::common;

namespace {

constexpr std::chrono::milliseconds kTtl{1000};

std::vector<std::string> SnapshotKeys(const ShardedTtlStore& store) {
  std::vector<std::string> keys;
  for (const StoreEntry& entry : store.Snapshot()) {
    keys.push_back(entry.key);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace

TEST_CASE("Put then Get returns the stored value", "[cache][store]") {
  common::ManualClock clock;
  ShardedTtlStore store(kTtl, 4, clock);

  REQUIRE_FALSE(store.Get("a:1").has_value());
  store.Put("a:1", "value-1");
  REQUIRE(store.Get("a:1") == std::optional<std::string>("value-1"));

  store.Put("a:1", "value-2");
  REQUIRE(store.Get("a:1") == std::optional<std::string>("value-2"));
  REQUIRE(store.Size() == 1U);
}

TEST_CASE("Entries expire once the TTL has elapsed since the last write", "[cache][store]") {
  common::ManualClock clock;
  ShardedTtlStore store(kTtl, 4, clock);
  store.Put("a:1", "v");

  clock.Advance(std::chrono::milliseconds(999));
  REQUIRE(store.Get("a:1").has_value());

  clock.Advance(std::chrono::milliseconds(1));
  REQUIRE_FALSE(store.Get("a:1").has_value());
  REQUIRE(store.Size() == 0U);
}

TEST_CASE("Rewriting an entry restarts its TTL", "[cache][store]") {
  common::ManualClock clock;
  ShardedTtlStore store(kTtl, 4, clock);
  store.Put("a:1", "v");

  clock.Advance(std::chrono::milliseconds(800));
  store.Put("a:1", "v");
  clock.Advance(std::chrono::milliseconds(800));
  REQUIRE(store.Get("a:1").has_value());
}

TEST_CASE("Snapshot skips expired entries and PurgeExpired reclaims them", "[cache][store]") {
  common::ManualClock clock;
  ShardedTtlStore store(kTtl, 4, clock);
  store.Put("old:1", "v");
  clock.Advance(std::chrono::milliseconds(600));
  store.Put("new:1", "v");
  store.Put("new:2", "v");
  clock.Advance(std::chrono::milliseconds(500));

  REQUIRE(SnapshotKeys(store) == std::vector<std::string>{"new:1", "new:2"});
  REQUIRE(store.Size() == 3U);

  REQUIRE(store.PurgeExpired() == 1U);
  REQUIRE(store.Size() == 2U);
}

TEST_CASE("Invalidate reports whether a live entry was removed", "[cache][store]") {
  common::ManualClock clock;
  ShardedTtlStore store(kTtl, 4, clock);
  store.Put("a:1", "v");
  store.Put("b:1", "v");

  REQUIRE(store.Invalidate("a:1"));
  REQUIRE_FALSE(store.Invalidate("a:1"));
  REQUIRE_FALSE(store.Get("a:1").has_value());

  clock.Advance(kTtl);
  REQUIRE_FALSE(store.Invalidate("b:1"));
  REQUIRE(store.Size() == 0U);
}

TEST_CASE("InvalidateAll removes only the listed keys", "[cache][store]") {
  common::ManualClock clock;
  ShardedTtlStore store(kTtl, 8, clock);
  for (int i = 0; i < 10; ++i) {
    store.Put("k:" + std::to_string(i), "v");
  }

  REQUIRE(store.InvalidateAll({"k:1", "k:3", "k:5", "missing:1"}) == 3U);
  REQUIRE(store.Size() == 7U);
  REQUIRE_FALSE(store.Get("k:3").has_value());
  REQUIRE(store.Get("k:4").has_value());
}

TEST_CASE("InvalidateIfValue leaves a rewritten entry alone", "[cache][store]") {
  common::ManualClock clock;
  ShardedTtlStore store(kTtl, 4, clock);
  store.Put("a:1", "stale");
  store.Put("a:1", "fresh");

  REQUIRE_FALSE(store.InvalidateIfValue("a:1", "stale"));
  REQUIRE(store.Get("a:1") == std::optional<std::string>("fresh"));

  REQUIRE(store.InvalidateIfValue("a:1", "fresh"));
  REQUIRE_FALSE(store.Get("a:1").has_value());
  REQUIRE_FALSE(store.InvalidateIfValue("missing:1", "fresh"));
}

TEST_CASE("ReplaceIfValue rewrites only a live entry holding the expected value",
          "[cache][store]") {
  common::ManualClock clock;
  ShardedTtlStore store(kTtl, 4, clock);
  store.Put("a:1", "before");

  REQUIRE_FALSE(store.ReplaceIfValue("a:1", "other", "after"));
  REQUIRE(store.Get("a:1") == std::optional<std::string>("before"));
  REQUIRE_FALSE(store.ReplaceIfValue("missing:1", "before", "after"));
  REQUIRE_FALSE(store.Get("missing:1").has_value());

  clock.Advance(std::chrono::milliseconds(600));
  REQUIRE(store.ReplaceIfValue("a:1", "before", "after"));
  clock.Advance(std::chrono::milliseconds(600));
  REQUIRE(store.Get("a:1") == std::optional<std::string>("after"));

  clock.Advance(kTtl);
  REQUIRE_FALSE(store.ReplaceIfValue("a:1", "after", "revived"));
  REQUIRE_FALSE(store.Get("a:1").has_value());
  REQUIRE(store.Size() == 0U);
}

TEST_CASE("Writes sweep expired entries out of a shard", "[cache][store]") {
  common::ManualClock clock;
  ShardedTtlStore store(kTtl, 1, clock);
  for (int i = 0; i < 10; ++i) {
    store.Put("old:" + std::to_string(i), "v");
  }
  clock.Advance(kTtl);

  for (int i = 0; i < 64; ++i) {
    store.Put("new:" + std::to_string(i), "v");
  }
  REQUIRE(store.Size() == 64U);
}

TEST_CASE("Shard count is clamped to at least one", "[cache][store]") {
  common::ManualClock clock;
  ShardedTtlStore store(kTtl, 0, clock);
  REQUIRE(store.ShardCount() == 1U);
  store.Put("a:1", "v");
  REQUIRE(store.Get("a:1").has_value());
}
