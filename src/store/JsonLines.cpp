// Repository: Ferry
// Component: JSONL helpers shared by the durable tables
// Copyright (c) 2025 Ferry

#include "store/JsonLines.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

#include "ferry/util/Logger.hpp"

namespace ferry::store {

using ferry::util::Logger;

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else out += c;
  }
  return out;
}

bool ParseJsonStringValue(const std::string& line, const std::string& key,
                          size_t* pos, std::string* out) {
  std::string search = "\"" + key + "\":\"";
  size_t start = line.find(search, *pos);
  if (start == std::string::npos) return false;
  start += search.size();
  out->clear();
  for (size_t i = start; i < line.size(); ++i) {
    if (line[i] == '\\' && i + 1 < line.size()) {
      if (line[i + 1] == '"') { *out += '"'; i++; continue; }
      if (line[i + 1] == '\\') { *out += '\\'; i++; continue; }
      if (line[i + 1] == 'n')  { *out += '\n'; i++; continue; }
      if (line[i + 1] == 'r')  { *out += '\r'; i++; continue; }
      if (line[i + 1] == 't')  { *out += '\t'; i++; continue; }
    }
    if (line[i] == '"') {
      *pos = i + 1;
      return true;
    }
    *out += line[i];
  }
  return false;
}

bool ParseJsonNumberValue(const std::string& line, const std::string& key,
                          size_t* pos, double* out) {
  std::string search = "\"" + key + "\":";
  size_t start = line.find(search, *pos);
  if (start == std::string::npos) return false;
  start += search.size();
  const char* begin = line.c_str() + start;
  char* end = nullptr;
  errno = 0;
  double v = std::strtod(begin, &end);
  if (end == begin || errno == ERANGE) return false;
  *out = v;
  *pos = start + static_cast<size_t>(end - begin);
  return true;
}

std::vector<std::string> ReadLines(const std::string& path) {
  std::vector<std::string> out;
  std::ifstream in(path);
  if (!in) return out;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

bool WriteLinesAtomically(const std::string& path, const std::vector<std::string>& lines,
                          const std::string& component) {
  std::string tmp_path = path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc);
    if (!of) {
      Logger::Error("[" + component + "] cannot open " + tmp_path);
      return false;
    }
    for (const auto& line : lines)
      of << line << '\n';
    of.flush();
    if (!of) {
      Logger::Error("[" + component + "] write failed " + tmp_path);
      (void)unlink(tmp_path.c_str());
      return false;
    }
  }
  if (rename(tmp_path.c_str(), path.c_str()) != 0) {
    Logger::Error("[" + component + "] rename failed " + path);
    (void)unlink(tmp_path.c_str());
    return false;
  }
  return true;
}

}  // namespace ferry::store
