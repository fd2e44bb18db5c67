// Repository: Ferry
// Component: Provider score table implementation
// Copyright (c) 2025 Ferry

#include "store/FileProviderScoreStore.hpp"

#include <cerrno>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

#include "store/JsonLines.hpp"

namespace ferry::store {

std::string ToJsonLine(const ProviderScoreEntry& entry) {
  std::ostringstream o;
  o.precision(6);
  o << "{\"name\":\"" << JsonEscape(entry.name) << "\""
    << ",\"score\":" << std::fixed << entry.score
    << ",\"updated_ms\":" << entry.updated_ms
    << "}";
  return o.str();
}

bool FromJsonLine(const std::string& line, ProviderScoreEntry& out) {
  if (line.empty() || line.front() != '{' || line.back() != '}')
    return false;
  size_t pos = 0;
  double score = 0.0;
  double updated = 0.0;
  if (!ParseJsonStringValue(line, "name", &pos, &out.name)) return false;
  if (!ParseJsonNumberValue(line, "score", &pos, &score)) return false;
  if (!ParseJsonNumberValue(line, "updated_ms", &pos, &updated)) return false;
  if (out.name.empty() || score < 0.0 || score > 1.0) return false;
  out.score = score;
  out.updated_ms = static_cast<int64_t>(updated);
  return true;
}

// -----------------------------------------------------------------------------
// FileProviderScoreStore
// -----------------------------------------------------------------------------

FileProviderScoreStore::FileProviderScoreStore(const std::string& dir)
    : dir_(dir), path_(dir + "/" + kFileName) {
  if (mkdir(dir_.c_str(), 0755) != 0 && errno != EEXIST) {
    throw std::runtime_error("FileProviderScoreStore: cannot create directory " + dir_);
  }
  table_ = ReadFile();
  writer_thread_ = std::thread(&FileProviderScoreStore::WriterLoop, this);
}

FileProviderScoreStore::~FileProviderScoreStore() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (writer_thread_.joinable())
    writer_thread_.join();
}

std::vector<ProviderScoreEntry> FileProviderScoreStore::Load() {
  auto on_disk = ReadFile();
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : on_disk) MergeLocked(kv.second);
  std::vector<ProviderScoreEntry> out;
  out.reserve(table_.size());
  for (const auto& kv : table_) out.push_back(kv.second);
  return out;
}

void FileProviderScoreStore::Save(const std::vector<ProviderScoreEntry>& entries) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries) MergeLocked(e);
    dirty_ = true;
  }
  cv_.notify_one();
}

void FileProviderScoreStore::MergeLocked(const ProviderScoreEntry& entry) {
  auto it = table_.find(entry.name);
  if (it == table_.end() || entry.updated_ms >= it->second.updated_ms) {
    table_[entry.name] = entry;
  }
}

void FileProviderScoreStore::Flush() {
  std::map<std::string, ProviderScoreEntry> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = table_;
    dirty_ = false;
  }
  WriteTable(snapshot);
}

void FileProviderScoreStore::WriterLoop() {
  while (true) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(kFlushIntervalMs), [this] {
      return shutdown_ || dirty_;
    });
    if (!dirty_) {
      if (shutdown_) break;
      continue;
    }
    // Coalesce bursts of Save() into one rewrite.
    if (!shutdown_) {
      cv_.wait_for(lock, std::chrono::milliseconds(kFlushIntervalMs),
                   [this] { return shutdown_; });
    }
    auto snapshot = table_;
    dirty_ = false;
    const bool exiting = shutdown_;
    lock.unlock();

    WriteTable(snapshot);
    if (exiting) break;
  }
}

std::map<std::string, ProviderScoreEntry> FileProviderScoreStore::ReadFile() const {
  std::map<std::string, ProviderScoreEntry> out;
  for (const auto& line : ReadLines(path_)) {
    ProviderScoreEntry entry;
    if (!FromJsonLine(line, entry))
      continue;  // torn or hand-edited line
    auto it = out.find(entry.name);
    if (it == out.end() || entry.updated_ms >= it->second.updated_ms)
      out[entry.name] = entry;
  }
  return out;
}

void FileProviderScoreStore::WriteTable(
    const std::map<std::string, ProviderScoreEntry>& table) {
  std::lock_guard<std::mutex> lock(file_mutex_);
  std::vector<std::string> lines;
  lines.reserve(table.size());
  for (const auto& kv : table)
    lines.push_back(ToJsonLine(kv.second));
  (void)WriteLinesAtomically(path_, lines, "FileProviderScoreStore");
}

}  // namespace ferry::store
