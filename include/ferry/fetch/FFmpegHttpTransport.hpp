// Repository: Ferry
// Component: FFmpegHttpTransport
// Purpose: Byte-range GET over libavformat's http/https protocol.
// Copyright (c) 2025 Ferry

#ifndef FERRY_FETCH_FFMPEG_HTTP_TRANSPORT_HPP_
#define FERRY_FETCH_FFMPEG_HTTP_TRANSPORT_HPP_

#include <string>

#include "ferry/fetch/IFetchTransport.hpp"

namespace ferry::fetch {

// Opens the URL with AVIO using the http protocol's offset/end_offset
// options (Range: bytes=offset-(end-1)), reads the span, and maps
// AVERROR_HTTP_* / errno codes onto TransportStatus. Cancellation and the
// per-request deadline are enforced through the AVIO interrupt callback.
//
// libavformat does not surface the status line. The http protocol resets its
// "offset" option on every response and sets it from Content-Range, so once
// the headers are read it holds the offset the server actually served from:
// the requested offset for a 206, zero for a 200 that ignored the Range.
class FFmpegHttpTransport : public IFetchTransport {
 public:
  explicit FFmpegHttpTransport(std::string user_agent = "ferry/1.0");

  TransportResponse Get(const TransportRequest& request,
                        const std::atomic<bool>& cancelled) override;

  // True when a response positioned at `served_offset` satisfies `requested`.
  // A negative served offset means the protocol did not report one.
  static bool ServedRequestedRange(const ByteRange& requested, int64_t served_offset);

 private:
  std::string user_agent_;
};

}  // namespace ferry::fetch

#endif  // FERRY_FETCH_FFMPEG_HTTP_TRANSPORT_HPP_
