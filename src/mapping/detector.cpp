#include "mapping/detector.hpp"

#include <array>
#include <cctype>
#include <unordered_set>

namespace admapper::mapping {

namespace {

constexpr std::size_t kUuidTextLength = 36;
constexpr std::array<std::size_t, 4> kUuidHyphenPositions = {8, 13, 18, 23};

bool IsHyphenPosition(std::size_t index) {
  for (const std::size_t position : kUuidHyphenPositions) {
    if (position == index) {
      return true;
    }
  }
  return false;
}

} // namespace

bool IsCanonicalDetectorId(std::string_view text) {
  if (text.size() != kUuidTextLength) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (IsHyphenPosition(i)) {
      if (c != '-') {
        return false;
      }
      continue;
    }
    const bool is_digit = c >= '0' && c <= '9';
    const bool is_lower_hex = c >= 'a' && c <= 'f';
    if (!is_digit && !is_lower_hex) {
      return false;
    }
  }
  return true;
}

bool NormalizeDetectorId(std::string_view text, std::string& canonical, std::string& error) {
  std::string lowered(text);
  for (char& c : lowered) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (!IsCanonicalDetectorId(lowered)) {
    error = "detector id is not a UUID: '" + std::string(text) + "'";
    return false;
  }
  canonical = std::move(lowered);
  return true;
}

std::vector<Detector> UniqueById(const std::vector<Detector>& detectors) {
  std::vector<Detector> unique;
  unique.reserve(detectors.size());
  std::unordered_set<std::string> seen;
  for (const Detector& detector : detectors) {
    if (seen.insert(detector.Id()).second) {
      unique.push_back(detector);
    }
  }
  return unique;
}

std::string JoinDetectorIds(const std::vector<Detector>& detectors) {
  std::string joined;
  for (const Detector& detector : detectors) {
    if (!joined.empty()) {
      joined.push_back(',');
    }
    joined += detector.Id();
  }
  return joined;
}

} // namespace admapper::mapping
