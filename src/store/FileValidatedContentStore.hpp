// Repository: Ferry
// Component: Validated content table (durable, JSONL)
// Copyright (c) 2025 Ferry

#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "ferry/session/IValidatedContentStore.hpp"

namespace ferry::store {

using session::ValidatedContentEntry;

// {"content_id":"Qm..","duration_s":120.5,"size_bytes":1048576,
//  "mime_type":"video/mp4","validated_ms":1700000000000}
std::string ToJsonLine(const ValidatedContentEntry& entry);
bool FromJsonLine(const std::string& line, ValidatedContentEntry& out);

// <dir>/validated_content.jsonl. Entries are few and change only when new
// content validates, so Save() rewrites the file synchronously.
class FileValidatedContentStore : public session::IValidatedContentStore {
 public:
  static constexpr const char* kFileName = "validated_content.jsonl";

  // Creates `dir` if missing; throws std::runtime_error if it cannot.
  explicit FileValidatedContentStore(const std::string& dir);

  std::vector<ValidatedContentEntry> Load() override;
  void Save(const std::vector<ValidatedContentEntry>& entries) override;

  const std::string& Path() const { return path_; }

 private:
  std::string path_;
  std::mutex file_mutex_;
};

}  // namespace ferry::store
