#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace admapper::mapping {

// Metric tag-set. Ordered so every consumer iterates tags the same way.
using TagMap = std::map<std::string, std::string>;

// Canonical detector id text: lowercase 8-4-4-4-12 hex UUID.
bool IsCanonicalDetectorId(std::string_view text);

// Accepts upper/lower/mixed-case UUID text and lowercases it.
bool NormalizeDetectorId(std::string_view text, std::string& canonical, std::string& error);

// A detector as seen by the mapping layer.
//
// Identity is the id alone: two detectors with the same id compare equal
// regardless of `enabled`, which is what set membership during
// invalidation relies on. The enabled flag is owned by the mapping service;
// detectors decoded from the cache have no known state and report enabled.
class Detector {
public:
  Detector() = default;
  explicit Detector(std::string id, bool enabled = true)
      : id_(std::move(id)), enabled_(enabled) {}

  const std::string& Id() const {
    return id_;
  }

  bool Enabled() const {
    return enabled_;
  }

  void SetEnabled(bool enabled) {
    enabled_ = enabled;
  }

  bool operator==(const Detector& other) const {
    return id_ == other.id_;
  }

private:
  std::string id_;
  bool enabled_ = true;
};

struct DetectorHash {
  std::size_t operator()(const Detector& detector) const {
    return std::hash<std::string>{}(detector.Id());
  }
};

// One `tag key == tag value` condition of a mapping expression.
struct Operand {
  std::string key;
  std::string value;

  bool operator==(const Operand& other) const = default;
};

// Mapping expression. Operands are always combined with logical AND; there
// is no OR/NOT form, and callers must not build mappings that need one.
struct Expression {
  std::vector<Operand> operands;

  bool operator==(const Expression& other) const = default;
};

// "Detector applies to metrics whose tags satisfy expression."
struct DetectorMapping {
  Detector detector;
  Expression expression;
};

// De-duplicates by id, keeping the first occurrence and the input order.
std::vector<Detector> UniqueById(const std::vector<Detector>& detectors);

// Comma-separated ids for log fields.
std::string JoinDetectorIds(const std::vector<Detector>& detectors);

} // namespace admapper::mapping
