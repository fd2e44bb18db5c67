// Repository: Ferry
// Component: JSONL helpers shared by the durable tables
// Copyright (c) 2025 Ferry

#pragma once

#include <string>
#include <vector>

namespace ferry::store {

std::string JsonEscape(const std::string& s);

// Finds "key":"..." at or after *pos, unescapes into *out and moves *pos
// past the closing quote. Returns false if absent or unterminated.
bool ParseJsonStringValue(const std::string& line, const std::string& key,
                          size_t* pos, std::string* out);
bool ParseJsonNumberValue(const std::string& line, const std::string& key,
                          size_t* pos, double* out);

// Reads every non-empty line of `path`; empty when the file is missing.
std::vector<std::string> ReadLines(const std::string& path);

// Rewrites `path` whole through a temp file + rename. Logs under
// `component` and returns false on failure, leaving the old file intact.
bool WriteLinesAtomically(const std::string& path, const std::vector<std::string>& lines,
                          const std::string& component);

}  // namespace ferry::store
