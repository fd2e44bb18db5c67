// Repository: Ferry
// Component: Provider score table (durable, JSONL)
// Copyright (c) 2025 Ferry

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ferry/provider/IProviderScoreStore.hpp"

namespace ferry::store {

using provider::ProviderScoreEntry;

// One provider per line: {"name":"ipfs.io","score":0.734,"updated_ms":1234}
std::string ToJsonLine(const ProviderScoreEntry& entry);
// Returns false if the line is corrupt or incomplete.
bool FromJsonLine(const std::string& line, ProviderScoreEntry& out);

// Durable score table: <dir>/provider_scores.jsonl, rewritten whole through
// a temp file + rename by a dedicated writer thread. Save() only merges into
// memory (last-write-wins by updated_ms) and wakes the writer.
class FileProviderScoreStore : public provider::IProviderScoreStore {
 public:
  static constexpr const char* kFileName = "provider_scores.jsonl";
  static constexpr int kFlushIntervalMs = 250;

  // Creates `dir` if missing; throws std::runtime_error if it cannot.
  explicit FileProviderScoreStore(const std::string& dir);
  ~FileProviderScoreStore() override;

  FileProviderScoreStore(const FileProviderScoreStore&) = delete;
  FileProviderScoreStore& operator=(const FileProviderScoreStore&) = delete;

  std::vector<ProviderScoreEntry> Load() override;
  void Save(const std::vector<ProviderScoreEntry>& entries) override;

  // Writes the current table synchronously.
  void Flush();

  const std::string& Path() const { return path_; }

 private:
  void WriterLoop();
  void MergeLocked(const ProviderScoreEntry& entry);
  std::map<std::string, ProviderScoreEntry> ReadFile() const;
  void WriteTable(const std::map<std::string, ProviderScoreEntry>& table);

  std::string dir_;
  std::string path_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::string, ProviderScoreEntry> table_;
  bool dirty_ = false;
  bool shutdown_ = false;

  std::mutex file_mutex_;  // serializes WriteTable between writer and Flush()
  std::thread writer_thread_;
};

}  // namespace ferry::store
