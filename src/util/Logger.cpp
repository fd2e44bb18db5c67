// Repository: Ferry
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by sessions, fetch workers
//          and gRPC handlers.
// Copyright (c) 2025 Ferry

#include "ferry/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace ferry::util {

std::mutex Logger::mutex_;
bool Logger::debug_forced_ = false;
Logger::Sink Logger::error_sink_;
Logger::Sink Logger::warn_sink_;
Logger::Sink Logger::info_sink_;

void Logger::SetDebugEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  debug_forced_ = enabled;
}

void Logger::SetErrorSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetInfoSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!debug_forced_ && std::getenv("FERRY_DEBUG") == nullptr) return;
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace ferry::util
