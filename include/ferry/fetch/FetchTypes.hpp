// Repository: Ferry
// Component: Fetch data model
// Purpose: Byte ranges, chunks, and the transient/fatal fetch error split.
// Copyright (c) 2025 Ferry

#ifndef FERRY_FETCH_FETCH_TYPES_HPP_
#define FERRY_FETCH_FETCH_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "ferry/fetch/IFetchTransport.hpp"

namespace ferry::fetch {

enum class ChunkStatus { kPending, kLoaded, kFailed, kAborted };

const char* ToString(ChunkStatus status);

// Cache identity. rendition is the tier height: tiers are distinct byte
// streams of the same content.
struct ChunkKey {
  std::string content_id;
  int rendition = 0;
  int64_t offset = 0;

  bool operator<(const ChunkKey& o) const {
    return std::tie(content_id, rendition, offset) <
           std::tie(o.content_id, o.rendition, o.offset);
  }
  bool operator==(const ChunkKey& o) const {
    return content_id == o.content_id && rendition == o.rendition &&
           offset == o.offset;
  }
};

struct Chunk {
  ChunkKey key;
  ChunkStatus status = ChunkStatus::kPending;
  std::string provider;
  ByteRange range;
  double start_s = 0.0;
  double end_s = 0.0;
  std::vector<uint8_t> payload;
  int64_t size = 0;
  uint32_t crc32 = 0;
  std::string mime_type;
  int64_t elapsed_ms = 0;
  int64_t completed_at_ms = 0;
  bool from_cache = false;
};

enum class FetchErrorKind {
  kTransient,  // timeout, 5xx, reset: retry elsewhere
  kFatal,      // content absent at this provider
  kPastEnd,    // 416 for a range starting past the rendition's last byte
};

struct FetchError {
  FetchErrorKind kind = FetchErrorKind::kTransient;
  int http_status = 0;
  std::string message;
};

const char* ToString(FetchErrorKind kind);

// Classifies a finished transport exchange for `requested`. nullopt means the
// response is a usable chunk. Aborted exchanges are not classified here.
std::optional<FetchError> ClassifyResponse(const TransportResponse& response,
                                           const ByteRange& requested);

// zlib CRC-32 of a payload.
uint32_t PayloadCrc32(const std::vector<uint8_t>& payload);

}  // namespace ferry::fetch

#endif  // FERRY_FETCH_FETCH_TYPES_HPP_
