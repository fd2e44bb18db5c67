// Repository: Ferry
// Component: MediaProbeValidator Implementation
// Purpose: libavformat probe of the content at the top-ranked provider.
// Copyright (c) 2025 Ferry

#include "ferry/session/MediaProbeValidator.hpp"

#include <cctype>
#include <chrono>
#include <mutex>
#include <sstream>
#include <stdexcept>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

#include "ferry/util/Logger.hpp"

namespace ferry::session {

using ferry::util::Logger;

namespace {

std::once_flag g_network_init;

int64_t SteadyNowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

int ProbeInterrupt(void* opaque) {
  const int64_t deadline_ms = *static_cast<const int64_t*>(opaque);
  return SteadyNowMs() >= deadline_ms ? 1 : 0;
}

std::shared_ptr<time::ITimeSource> RequireClock(std::shared_ptr<time::ITimeSource> clock) {
  if (!clock) {
    throw std::invalid_argument("MediaProbeValidator: time source is required");
  }
  return clock;
}

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

MediaProbeValidator::MediaProbeValidator(ProbeConfig config,
                                         std::shared_ptr<time::ITimeSource> clock,
                                         std::shared_ptr<IValidatedContentStore> store)
    : config_(config),
      cache_(config.validity_ms, RequireClock(std::move(clock)), std::move(store)) {
  std::call_once(g_network_init, [] { avformat_network_init(); });
}

bool MediaProbeValidator::IsWellFormedId(const std::string& content_id) {
  if (content_id.empty() || content_id.size() > 256) return false;
  for (unsigned char c : content_id) {
    if (!std::isalnum(c) && c != '-' && c != '_') return false;
  }
  return true;
}

size_t MediaProbeValidator::CachedCount() const {
  return cache_.size();
}

ValidationResult MediaProbeValidator::Validate(const std::string& content_id,
                                               const std::string& probe_url) {
  if (!IsWellFormedId(content_id)) {
    ValidationResult result;
    result.reason = "malformed content id";
    return result;
  }

  if (auto info = cache_.Lookup(content_id)) {
    Logger::Debug("[MediaProbeValidator] CACHE_HIT content=" + content_id);
    ValidationResult result;
    result.ok = true;
    result.info = *info;
    return result;
  }

  ValidationResult result = Probe(probe_url);
  if (result.ok) cache_.Insert(content_id, result.info);

  std::ostringstream oss;
  oss << "[MediaProbeValidator] PROBE content=" << content_id
      << " ok=" << (result.ok ? 1 : 0);
  if (result.ok) {
    oss << " duration_s=" << result.info.duration_s
        << " size=" << result.info.size_bytes;
    Logger::Info(oss.str());
  } else {
    oss << " reason=\"" << result.reason << "\"";
    Logger::Warn(oss.str());
  }
  return result;
}

ValidationResult MediaProbeValidator::Probe(const std::string& probe_url) const {
  ValidationResult result;
  if (probe_url.empty()) {
    result.reason = "no probe url";
    return result;
  }

  AVFormatContext* fmt_ctx = avformat_alloc_context();
  if (!fmt_ctx) {
    result.reason = "avformat_alloc_context failed";
    return result;
  }
  int64_t deadline_ms = SteadyNowMs() + config_.probe_timeout_ms;
  fmt_ctx->interrupt_callback.callback = &ProbeInterrupt;
  fmt_ctx->interrupt_callback.opaque = &deadline_ms;

  AVDictionary* opts = nullptr;
  av_dict_set_int(&opts, "rw_timeout", config_.probe_timeout_ms * 1000, 0);
  av_dict_set(&opts, "reconnect", "0", 0);

  // avformat_open_input frees fmt_ctx on failure.
  int ret = avformat_open_input(&fmt_ctx, probe_url.c_str(), nullptr, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    result.reason = "open failed: " + AvErrorString(ret);
    return result;
  }

  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    avformat_close_input(&fmt_ctx);
    result.reason = "stream info failed: " + AvErrorString(ret);
    return result;
  }

  if (av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0) < 0) {
    avformat_close_input(&fmt_ctx);
    result.reason = "no video stream";
    return result;
  }

  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0) {
    result.info.duration_s = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
  }
  if (fmt_ctx->pb) {
    const int64_t size = avio_size(fmt_ctx->pb);
    if (size > 0) result.info.size_bytes = size;
  }
  if (fmt_ctx->iformat) {
    result.info.mime_type = fmt_ctx->iformat->mime_type ? fmt_ctx->iformat->mime_type
                                                        : fmt_ctx->iformat->name;
  }

  avformat_close_input(&fmt_ctx);
  result.ok = true;
  return result;
}

}  // namespace ferry::session
