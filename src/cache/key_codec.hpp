#pragma once

#include "mapping/detector.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace admapper::cache {

// Compact string forms stored in the mapping cache.
//
// Cache key: tags rendered as `key:value`, sorted by key, joined with ','.
//   {env: prod, region: us} -> "env:prod,region:us"
//   {}                      -> ""
// A '\', ',' or ':' inside a tag key or value is escaped with a leading '\',
// so any tag map encodes and decodes losslessly:
//   {path: "a:b"}           -> "path:a\:b"
//
// Cache value: canonical detector ids joined with ',', de-duplicated by id in
// first-seen order. An empty list encodes to "".

constexpr char kPairSeparator = ',';
constexpr char kKeyValueSeparator = ':';
constexpr char kEscape = '\\';
constexpr char kDetectorIdSeparator = ',';

enum class CodecErrorCode {
  kMalformedKey,
  kMalformedValue,
};

// "MALFORMED_KEY" / "MALFORMED_VALUE"
std::string_view ToStableErrorCode(CodecErrorCode code);

struct CodecError {
  CodecErrorCode code = CodecErrorCode::kMalformedKey;
  std::string detail;
};

// "<STABLE_CODE>: <detail>"
std::string FormatCodecError(const CodecError& error);

std::string EncodeKey(const mapping::TagMap& tags);

// Exact inverse of EncodeKey. Fails with kMalformedKey on a dangling or
// unknown escape, a pair without exactly one unescaped ':', an empty pair,
// or a repeated tag key.
bool DecodeKey(std::string_view key, mapping::TagMap& tags, CodecError& error);

// Precondition: every id is canonical (see mapping::IsCanonicalDetectorId).
std::string EncodeDetectorIds(const std::vector<mapping::Detector>& detectors);

// Fails with kMalformedValue when any segment is not a canonical id.
// Decoded detectors report enabled; repeated ids collapse to one.
bool DecodeDetectorIds(std::string_view value,
                       std::vector<mapping::Detector>& detectors,
                       CodecError& error);

} // namespace admapper::cache
