#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <string>

namespace {

using admapper::tests::common::AssertContains;
using admapper::tests::common::AssertNotContains;
using admapper::tests::common::DispatchCaptured;
using admapper::tests::common::DispatchResult;
using admapper::tests::common::Expect;
using admapper::tests::common::ScopedTempDir;
using admapper::tests::common::WriteTextFile;

constexpr const char* kDetectorOne = "2c49ba26-1a7d-43f4-b70c-c6644a2c1689";
constexpr const char* kDetectorTwo = "5a7c3f1e-9b2d-4e8a-a1c4-3f6e2d9b8c70";
constexpr const char* kDetectorThree = "e3b0c442-98fc-4c14-9afb-f4c8996fb924";

constexpr const char* kReplayJson = R"({
  "mappings": [
    {"detector": {"uuid": "2c49ba26-1a7d-43f4-b70c-c6644a2c1689"},
     "expression": {"operands": [{"key": "region", "value": "us"}]}},
    {"detector": {"uuid": "5a7c3f1e-9b2d-4e8a-a1c4-3f6e2d9b8c70"},
     "expression": {"operands": [{"key": "env", "value": "prod"}]}}
  ],
  "steps": [
    {"lookup": {"region": "us", "env": "prod"}},
    {"lookup": {"env": "prod", "region": "us"}},
    {"refresh": [
      {"detector": {"uuid": "2c49ba26-1a7d-43f4-b70c-c6644a2c1689", "enabled": false},
       "expression": {"operands": [{"key": "region", "value": "us"}]}},
      {"detector": {"uuid": "5a7c3f1e-9b2d-4e8a-a1c4-3f6e2d9b8c70"},
       "expression": {"operands": [{"key": "env", "value": "prod"}]}}
    ]},
    {"lookup": {"region": "us", "env": "prod"}},
    {"refresh": [
      {"detector": {"uuid": "2c49ba26-1a7d-43f4-b70c-c6644a2c1689", "enabled": false},
       "expression": {"operands": [{"key": "region", "value": "us"}]}},
      {"detector": {"uuid": "5a7c3f1e-9b2d-4e8a-a1c4-3f6e2d9b8c70"},
       "expression": {"operands": [{"key": "env", "value": "prod"}]}},
      {"detector": {"uuid": "e3b0c442-98fc-4c14-9afb-f4c8996fb924"},
       "expression": {"operator": "AND", "operands": [{"key": "region", "value": "us"}]}}
    ]},
    {"lookup": {"region": "us", "env": "prod"}}
  ]
})";

void ExpectReplayOutput(const DispatchResult& result) {
  Expect(result.exit_code == 0, "replay should succeed");
  const std::string& out = result.stdout_text;
  const std::string key = "lookup key=env:prod,region:us detectors=";

  AssertContains(out, key + kDetectorOne + "," + kDetectorTwo + "\n" + key + kDetectorOne + "," +
                          kDetectorTwo + "\n");
  AssertContains(out, "refresh disabled=1 changed=0 pruned=1 evicted=0 skipped_mappings=0\n" +
                          key + kDetectorTwo + "\n");
  AssertContains(out, "refresh disabled=0 changed=1 pruned=0 evicted=1 skipped_mappings=0\n" +
                          key + kDetectorTwo + "," + kDetectorThree + "\n");
  AssertContains(out,
                 "stats {\"cache.hit\":2,\"cache.miss\":2,\"cache.size\":1,"
                 "\"cache.corrupt_evictions\":0,\"resolver.resolutions\":2,"
                 "\"resolver.errors\":0}\n");
}

} // namespace

int main() {
  ScopedTempDir temp_dir("admapper-replay-cli-smoke");
  const auto replay_path = temp_dir.Path() / "replay.json";
  const auto config_path = temp_dir.Path() / "config.json";
  const auto bad_config_path = temp_dir.Path() / "bad_config.json";
  const auto bad_replay_path = temp_dir.Path() / "bad_replay.json";
  WriteTextFile(replay_path, kReplayJson);
  WriteTextFile(config_path, R"({"cache": {"ttl_ms": 600000, "shard_count": 4},
                                 "log_level": "warn"})");
  WriteTextFile(bad_config_path, R"({"cache": {"shard_count": 0}})");
  WriteTextFile(bad_replay_path, R"({"steps": [{"resolve": {}}]})");

  // Defaults, then with a config file.
  ExpectReplayOutput(DispatchCaptured({"admapper", "replay", replay_path.string()}));
  const DispatchResult configured = DispatchCaptured(
      {"admapper", "replay", replay_path.string(), "--config", config_path.string()});
  ExpectReplayOutput(configured);
  AssertNotContains(configured.stderr_text, "level=INFO");

  const DispatchResult debug = DispatchCaptured(
      {"admapper", "replay", replay_path.string(), "--log-level", "debug"});
  ExpectReplayOutput(debug);
  AssertContains(debug.stderr_text, "msg=\"updating cache\"");
  AssertContains(debug.stderr_text, "msg=\"refresh cycle applied\"");

  const DispatchResult bad_config = DispatchCaptured(
      {"admapper", "replay", replay_path.string(), "--config", bad_config_path.string()});
  Expect(bad_config.exit_code == 10, "invalid config should exit 10");
  AssertContains(bad_config.stderr_text, "error: invalid config: ");
  AssertContains(bad_config.stderr_text, "cache.shard_count");

  const DispatchResult bad_replay =
      DispatchCaptured({"admapper", "replay", bad_replay_path.string()});
  Expect(bad_replay.exit_code == 20, "invalid replay input should exit 20");
  AssertContains(bad_replay.stderr_text, "error: invalid replay input: ");
  AssertContains(bad_replay.stderr_text, "unknown step kind");

  const DispatchResult missing_path = DispatchCaptured({"admapper", "replay"});
  Expect(missing_path.exit_code == 2, "replay without a path should exit 2");

  const DispatchResult unknown_option =
      DispatchCaptured({"admapper", "replay", replay_path.string(), "--fast"});
  Expect(unknown_option.exit_code == 2, "unknown option should exit 2");
  AssertContains(unknown_option.stderr_text, "unknown option: --fast");

  const DispatchResult validate =
      DispatchCaptured({"admapper", "validate-config", config_path.string()});
  Expect(validate.exit_code == 0, "valid config should validate");
  AssertContains(validate.stdout_text,
                 "config ok: cache.ttl=600000ms cache.shard_count=4 "
                 "refresh_interval=60000ms log_level=WARN");

  const DispatchResult invalid =
      DispatchCaptured({"admapper", "validate-config", bad_config_path.string()});
  Expect(invalid.exit_code == 10, "invalid config should fail validation with 10");

  const DispatchResult version = DispatchCaptured({"admapper", "version"});
  Expect(version.exit_code == 0, "version should succeed");
  AssertContains(version.stdout_text, "admapper 0.1.0");

  const DispatchResult unknown = DispatchCaptured({"admapper", "explode"});
  Expect(unknown.exit_code == 2, "unknown subcommand should exit 2");
  AssertContains(unknown.stderr_text, "unknown subcommand: explode");

  return 0;
}
