#include "cache/key_codec.hpp"

#include <unordered_set>
#include <utility>

namespace admapper::cache {

namespace {

bool IsReserved(char c) {
  return c == kEscape || c == kPairSeparator || c == kKeyValueSeparator;
}

void AppendEscaped(std::string_view text, std::string& out) {
  for (const char c : text) {
    if (IsReserved(c)) {
      out.push_back(kEscape);
    }
    out.push_back(c);
  }
}

bool FailKey(std::string_view key, std::string detail, CodecError& error) {
  error.code = CodecErrorCode::kMalformedKey;
  error.detail = std::move(detail) + " in key '" + std::string(key) + "'";
  return false;
}

bool FailValue(std::string_view value, std::string detail, CodecError& error) {
  error.code = CodecErrorCode::kMalformedValue;
  error.detail = std::move(detail) + " in value '" + std::string(value) + "'";
  return false;
}

} // namespace

std::string_view ToStableErrorCode(const CodecErrorCode code) {
  switch (code) {
  case CodecErrorCode::kMalformedKey:
    return "MALFORMED_KEY";
  case CodecErrorCode::kMalformedValue:
    return "MALFORMED_VALUE";
  }
  return "MALFORMED_KEY";
}

std::string FormatCodecError(const CodecError& error) {
  return std::string(ToStableErrorCode(error.code)) + ": " + error.detail;
}

std::string EncodeKey(const mapping::TagMap& tags) {
  std::string key;
  for (const auto& [tag_key, tag_value] : tags) {
    if (!key.empty()) {
      key.push_back(kPairSeparator);
    }
    AppendEscaped(tag_key, key);
    key.push_back(kKeyValueSeparator);
    AppendEscaped(tag_value, key);
  }
  return key;
}

bool DecodeKey(std::string_view key, mapping::TagMap& tags, CodecError& error) {
  tags.clear();
  if (key.empty()) {
    return true;
  }

  mapping::TagMap decoded;
  std::string tag_key;
  std::string tag_value;
  bool in_value = false;

  auto finish_pair = [&]() -> bool {
    if (!in_value) {
      return FailKey(key, "pair without ':'", error);
    }
    if (!decoded.emplace(std::move(tag_key), std::move(tag_value)).second) {
      return FailKey(key, "repeated tag key", error);
    }
    tag_key.clear();
    tag_value.clear();
    in_value = false;
    return true;
  };

  for (std::size_t i = 0; i < key.size(); ++i) {
    char c = key[i];
    if (c == kEscape) {
      if (i + 1 >= key.size()) {
        return FailKey(key, "dangling escape", error);
      }
      c = key[++i];
      if (!IsReserved(c)) {
        return FailKey(key, "unknown escape", error);
      }
      (in_value ? tag_value : tag_key).push_back(c);
      continue;
    }
    if (c == kPairSeparator) {
      if (!finish_pair()) {
        return false;
      }
      continue;
    }
    if (c == kKeyValueSeparator) {
      if (in_value) {
        return FailKey(key, "unescaped ':' inside value", error);
      }
      in_value = true;
      continue;
    }
    (in_value ? tag_value : tag_key).push_back(c);
  }

  if (!finish_pair()) {
    return false;
  }
  tags = std::move(decoded);
  return true;
}

std::string EncodeDetectorIds(const std::vector<mapping::Detector>& detectors) {
  std::string value;
  std::unordered_set<std::string_view> seen;
  for (const mapping::Detector& detector : detectors) {
    if (!seen.insert(detector.Id()).second) {
      continue;
    }
    if (!value.empty()) {
      value.push_back(kDetectorIdSeparator);
    }
    value += detector.Id();
  }
  return value;
}

bool DecodeDetectorIds(std::string_view value,
                       std::vector<mapping::Detector>& detectors,
                       CodecError& error) {
  detectors.clear();
  if (value.empty()) {
    return true;
  }

  std::unordered_set<std::string_view> seen;
  std::size_t begin = 0;
  while (begin <= value.size()) {
    std::size_t end = value.find(kDetectorIdSeparator, begin);
    if (end == std::string_view::npos) {
      end = value.size();
    }
    const std::string_view id = value.substr(begin, end - begin);
    if (!mapping::IsCanonicalDetectorId(id)) {
      detectors.clear();
      return FailValue(value, "invalid detector id '" + std::string(id) + "'", error);
    }
    if (seen.insert(id).second) {
      detectors.emplace_back(std::string(id));
    }
    begin = end + 1;
  }
  return true;
}

} // namespace admapper::cache
