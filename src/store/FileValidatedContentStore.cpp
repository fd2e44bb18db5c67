// Repository: Ferry
// Component: Validated content table implementation
// Copyright (c) 2025 Ferry

#include "store/FileValidatedContentStore.hpp"

#include <cerrno>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

#include "store/JsonLines.hpp"

namespace ferry::store {

std::string ToJsonLine(const ValidatedContentEntry& entry) {
  std::ostringstream o;
  o.precision(3);
  o << "{\"content_id\":\"" << JsonEscape(entry.content_id) << "\""
    << ",\"duration_s\":" << std::fixed << entry.info.duration_s
    << ",\"size_bytes\":" << entry.info.size_bytes
    << ",\"mime_type\":\"" << JsonEscape(entry.info.mime_type) << "\""
    << ",\"validated_ms\":" << entry.validated_ms
    << "}";
  return o.str();
}

bool FromJsonLine(const std::string& line, ValidatedContentEntry& out) {
  if (line.empty() || line.front() != '{' || line.back() != '}')
    return false;
  size_t pos = 0;
  double duration = 0.0;
  double size = 0.0;
  double validated = 0.0;
  if (!ParseJsonStringValue(line, "content_id", &pos, &out.content_id)) return false;
  if (!ParseJsonNumberValue(line, "duration_s", &pos, &duration)) return false;
  if (!ParseJsonNumberValue(line, "size_bytes", &pos, &size)) return false;
  if (!ParseJsonStringValue(line, "mime_type", &pos, &out.info.mime_type)) return false;
  if (!ParseJsonNumberValue(line, "validated_ms", &pos, &validated)) return false;
  if (out.content_id.empty()) return false;
  out.info.duration_s = duration;
  out.info.size_bytes = static_cast<int64_t>(size);
  out.validated_ms = static_cast<int64_t>(validated);
  return true;
}

FileValidatedContentStore::FileValidatedContentStore(const std::string& dir)
    : path_(dir + "/" + kFileName) {
  if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
    throw std::runtime_error("FileValidatedContentStore: cannot create directory " + dir);
  }
}

std::vector<ValidatedContentEntry> FileValidatedContentStore::Load() {
  std::lock_guard<std::mutex> lock(file_mutex_);
  std::vector<ValidatedContentEntry> out;
  for (const auto& line : ReadLines(path_)) {
    ValidatedContentEntry entry;
    if (!FromJsonLine(line, entry))
      continue;  // torn or hand-edited line
    out.push_back(std::move(entry));
  }
  return out;
}

void FileValidatedContentStore::Save(const std::vector<ValidatedContentEntry>& entries) {
  std::lock_guard<std::mutex> lock(file_mutex_);
  std::vector<std::string> lines;
  lines.reserve(entries.size());
  for (const auto& e : entries)
    lines.push_back(ToJsonLine(e));
  (void)WriteLinesAtomically(path_, lines, "FileValidatedContentStore");
}

}  // namespace ferry::store
