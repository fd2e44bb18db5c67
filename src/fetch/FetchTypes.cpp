// Repository: Ferry
// Component: Fetch data model
// Copyright (c) 2025 Ferry

#include "ferry/fetch/FetchTypes.hpp"

#include <zlib.h>

#include <sstream>

namespace ferry::fetch {

namespace {

bool IsMarkupContentType(const std::string& content_type) {
  return content_type.rfind("text/html", 0) == 0 ||
         content_type.rfind("application/xhtml", 0) == 0;
}

FetchError Transient(int http_status, const std::string& message) {
  return FetchError{FetchErrorKind::kTransient, http_status, message};
}

FetchError Fatal(int http_status, const std::string& message) {
  return FetchError{FetchErrorKind::kFatal, http_status, message};
}

}  // namespace

const char* ToString(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::kPending: return "pending";
    case ChunkStatus::kLoaded: return "loaded";
    case ChunkStatus::kFailed: return "failed";
    case ChunkStatus::kAborted: return "aborted";
  }
  return "unknown";
}

const char* ToString(FetchErrorKind kind) {
  switch (kind) {
    case FetchErrorKind::kTransient: return "transient";
    case FetchErrorKind::kFatal: return "fatal";
    case FetchErrorKind::kPastEnd: return "past_end";
  }
  return "unknown";
}

const char* ToString(TransportStatus status) {
  switch (status) {
    case TransportStatus::kOk: return "ok";
    case TransportStatus::kHttpError: return "http_error";
    case TransportStatus::kTimeout: return "timeout";
    case TransportStatus::kConnectionReset: return "connection_reset";
    case TransportStatus::kIoError: return "io_error";
    case TransportStatus::kAborted: return "aborted";
  }
  return "unknown";
}

std::optional<FetchError> ClassifyResponse(const TransportResponse& response,
                                           const ByteRange& requested) {
  switch (response.status) {
    case TransportStatus::kAborted:
      return std::nullopt;
    case TransportStatus::kTimeout:
      return Transient(0, "timeout " + response.detail);
    case TransportStatus::kConnectionReset:
      return Transient(0, "connection reset " + response.detail);
    case TransportStatus::kIoError:
      return Transient(0, "io error " + response.detail);
    case TransportStatus::kHttpError: {
      const int code = response.http_status;
      std::ostringstream msg;
      msg << "http " << code;
      if (!response.detail.empty()) msg << " " << response.detail;
      // Request timeout and throttling are the gateway's problem, not the
      // content's.
      if (code == 408 || code == 429) return Transient(code, msg.str());
      // Range Not Satisfiable past byte 0: the rendition ends before the
      // requested offset. At byte 0 the content is simply not there.
      if (code == 416 && requested.offset > 0) {
        return FetchError{FetchErrorKind::kPastEnd, code, msg.str()};
      }
      if (code >= 400 && code < 500) return Fatal(code, msg.str());
      return Transient(code, msg.str());
    }
    case TransportStatus::kOk:
      break;
  }

  if (IsMarkupContentType(response.content_type)) {
    return Fatal(response.http_status,
                 "unexpected content-type " + response.content_type);
  }
  if (!response.partial_content && requested.offset != 0) {
    return Transient(response.http_status, "range not honored");
  }
  const int64_t got = static_cast<int64_t>(response.body.size());
  if (got == 0) {
    return Transient(response.http_status, "empty body");
  }
  if (got > requested.length) {
    return Transient(response.http_status, "body longer than requested range");
  }
  if (got < requested.length) {
    const bool at_eof = response.total_size >= 0 &&
                        requested.offset + got == response.total_size;
    if (!at_eof) {
      std::ostringstream msg;
      msg << "short read " << got << "/" << requested.length;
      return Transient(response.http_status, msg.str());
    }
  }
  return std::nullopt;
}

uint32_t PayloadCrc32(const std::vector<uint8_t>& payload) {
  uLong crc = crc32(0L, Z_NULL, 0);
  if (!payload.empty()) {
    crc = crc32(crc, payload.data(), static_cast<uInt>(payload.size()));
  }
  return static_cast<uint32_t>(crc);
}

}  // namespace ferry::fetch
