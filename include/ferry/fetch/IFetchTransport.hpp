// Repository: Ferry
// Component: Fetch transport seam
// Purpose: Byte-range GET abstraction. Production uses libavformat's HTTP
//          protocol; tests script responses per provider.
// Copyright (c) 2025 Ferry

#ifndef FERRY_FETCH_I_FETCH_TRANSPORT_HPP_
#define FERRY_FETCH_I_FETCH_TRANSPORT_HPP_

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace ferry::fetch {

struct ByteRange {
  int64_t offset = 0;
  int64_t length = 0;

  int64_t end() const { return offset + length; }
  bool operator==(const ByteRange& o) const {
    return offset == o.offset && length == o.length;
  }
};

enum class TransportStatus {
  kOk,               // 2xx, body valid
  kHttpError,        // non-2xx; http_status set
  kTimeout,
  kConnectionReset,
  kIoError,
  kAborted,          // cancelled by caller
};

const char* ToString(TransportStatus status);

struct TransportRequest {
  std::string url;
  ByteRange range;
  int64_t timeout_ms = 10000;
};

struct TransportResponse {
  TransportStatus status = TransportStatus::kIoError;
  int http_status = 0;
  std::vector<uint8_t> body;
  std::string content_type;
  bool partial_content = false;  // range honored
  int64_t total_size = -1;       // -1 unknown
  std::string detail;
};

class IFetchTransport {
 public:
  virtual ~IFetchTransport() = default;

  // Blocking. Must return promptly (status kAborted) once `cancelled` turns
  // true, and must honor request.timeout_ms.
  virtual TransportResponse Get(const TransportRequest& request,
                                const std::atomic<bool>& cancelled) = 0;
};

}  // namespace ferry::fetch

#endif  // FERRY_FETCH_I_FETCH_TRANSPORT_HPP_
