// Repository: Ferry
// Component: FFmpegHttpTransport
// Purpose: Byte-range GET over libavformat's http/https protocol.
// Copyright (c) 2025 Ferry

#include "ferry/fetch/FFmpegHttpTransport.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <mutex>
#include <sstream>

extern "C" {
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libavutil/opt.h>
}

#include "ferry/util/Logger.hpp"

namespace ferry::fetch {

using ferry::util::Logger;

namespace {

constexpr int kReadBlockBytes = 64 * 1024;

std::once_flag g_network_init;

int64_t SteadyNowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// Opaque passed to the AVIO interrupt callback.
struct InterruptState {
  const std::atomic<bool>* cancelled = nullptr;
  int64_t deadline_ms = 0;
  bool timed_out = false;
};

int InterruptCallback(void* opaque) {
  auto* state = static_cast<InterruptState*>(opaque);
  if (state->cancelled->load(std::memory_order_acquire)) return 1;
  if (SteadyNowMs() >= state->deadline_ms) {
    state->timed_out = true;
    return 1;
  }
  return 0;
}

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

void MapAvError(int err, const InterruptState& interrupt,
                TransportResponse* response) {
  response->detail = AvErrorString(err);
  if (interrupt.cancelled->load(std::memory_order_acquire)) {
    response->status = TransportStatus::kAborted;
    return;
  }
  if ((err == AVERROR_EXIT && interrupt.timed_out) || err == AVERROR(ETIMEDOUT)) {
    response->status = TransportStatus::kTimeout;
    return;
  }
  switch (err) {
    case AVERROR_HTTP_BAD_REQUEST:
      response->status = TransportStatus::kHttpError;
      response->http_status = 400;
      return;
    case AVERROR_HTTP_UNAUTHORIZED:
      response->status = TransportStatus::kHttpError;
      response->http_status = 401;
      return;
    case AVERROR_HTTP_FORBIDDEN:
      response->status = TransportStatus::kHttpError;
      response->http_status = 403;
      return;
    case AVERROR_HTTP_NOT_FOUND:
      response->status = TransportStatus::kHttpError;
      response->http_status = 404;
      return;
    case AVERROR_HTTP_OTHER_4XX:
      response->status = TransportStatus::kHttpError;
      response->http_status = 499;
      return;
    case AVERROR_HTTP_SERVER_ERROR:
      response->status = TransportStatus::kHttpError;
      response->http_status = 500;
      return;
    default:
      break;
  }
  if (err == AVERROR(ECONNRESET) || err == AVERROR(ECONNREFUSED) ||
      err == AVERROR(EPIPE) || err == AVERROR(ECONNABORTED)) {
    response->status = TransportStatus::kConnectionReset;
    return;
  }
  response->status = TransportStatus::kIoError;
}

}  // namespace

FFmpegHttpTransport::FFmpegHttpTransport(std::string user_agent)
    : user_agent_(std::move(user_agent)) {
  std::call_once(g_network_init, [] { avformat_network_init(); });
}

TransportResponse FFmpegHttpTransport::Get(const TransportRequest& request,
                                           const std::atomic<bool>& cancelled) {
  TransportResponse response;

  InterruptState interrupt;
  interrupt.cancelled = &cancelled;
  interrupt.deadline_ms = SteadyNowMs() + request.timeout_ms;
  AVIOInterruptCB interrupt_cb{&InterruptCallback, &interrupt};

  AVDictionary* opts = nullptr;
  av_dict_set_int(&opts, "offset", request.range.offset, 0);
  if (request.range.length > 0) {
    av_dict_set_int(&opts, "end_offset", request.range.end(), 0);
  }
  av_dict_set_int(&opts, "rw_timeout", request.timeout_ms * 1000, 0);
  av_dict_set_int(&opts, "reconnect", 0, 0);
  av_dict_set(&opts, "user_agent", user_agent_.c_str(), 0);

  AVIOContext* io = nullptr;
  int ret = avio_open2(&io, request.url.c_str(), AVIO_FLAG_READ, &interrupt_cb, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    MapAvError(ret, interrupt, &response);
    std::ostringstream oss;
    oss << "[FFmpegHttpTransport] OPEN_FAILED url=" << request.url
        << " status=" << ToString(response.status)
        << " http_status=" << response.http_status
        << " error=\"" << response.detail << "\"";
    Logger::Debug(oss.str());
    return response;
  }

  uint8_t* mime = nullptr;
  if (av_opt_get(io, "mime_type", AV_OPT_SEARCH_CHILDREN, &mime) >= 0 && mime != nullptr) {
    response.content_type = reinterpret_cast<const char*>(mime);
    av_free(mime);
  }
  // http reports the full resource size (Content-Range total or
  // Content-Length); a negative value means unknown.
  const int64_t size = avio_size(io);
  response.total_size = size >= 0 ? size : -1;
  // Read before the body: the protocol advances "offset" as bytes arrive.
  int64_t served_offset = -1;
  if (av_opt_get_int(io, "offset", AV_OPT_SEARCH_CHILDREN, &served_offset) < 0) {
    served_offset = -1;
  }
  const bool honored = ServedRequestedRange(request.range, served_offset);

  response.body.resize(static_cast<size_t>(std::max<int64_t>(request.range.length, 0)));
  int64_t got = 0;
  int read_error = 0;
  while (got < request.range.length) {
    const int want = static_cast<int>(
        std::min<int64_t>(request.range.length - got, kReadBlockBytes));
    const int n = avio_read(io, response.body.data() + got, want);
    if (n == AVERROR_EOF || n == 0) break;
    if (n < 0) {
      read_error = n;
      break;
    }
    got += n;
  }
  avio_closep(&io);
  response.body.resize(static_cast<size_t>(got));

  if (read_error != 0) {
    response.body.clear();
    MapAvError(read_error, interrupt, &response);
    return response;
  }
  if (cancelled.load(std::memory_order_acquire)) {
    response.status = TransportStatus::kAborted;
    return response;
  }

  response.status = TransportStatus::kOk;
  response.partial_content = honored;
  response.http_status = honored && request.range.offset > 0 ? 206 : 200;
  if (!honored) {
    std::ostringstream oss;
    oss << "[FFmpegHttpTransport] RANGE_IGNORED url=" << request.url
        << " requested_offset=" << request.range.offset
        << " served_offset=" << served_offset;
    Logger::Debug(oss.str());
  }
  return response;
}

bool FFmpegHttpTransport::ServedRequestedRange(const ByteRange& requested,
                                               int64_t served_offset) {
  if (requested.offset == 0) return true;
  return served_offset == requested.offset;
}

}  // namespace ferry::fetch
