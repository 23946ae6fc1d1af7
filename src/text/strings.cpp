// Glyph Programming Language - String Helpers
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "text/strings.hpp"

namespace glyph {

namespace {
const char* kWhitespace = " \t\n\r\f\v";
}

std::string trim(std::string_view text) {
  size_t start = text.find_first_not_of(kWhitespace);
  if (start == std::string_view::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(kWhitespace);
  return std::string(text.substr(start, end - start + 1));
}

std::vector<std::string> split(std::string_view text, std::string_view delimiter) {
  std::vector<std::string> parts;
  if (delimiter.empty()) {
    parts.emplace_back(text);
    return parts;
  }

  size_t start = 0;
  while (true) {
    size_t pos = text.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(text.substr(start));
      break;
    }
    parts.emplace_back(text.substr(start, pos - start));
    start = pos + delimiter.size();
  }
  return parts;
}

bool startsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool isWhitespace(std::string_view cluster) {
  return !cluster.empty() && cluster.find_first_not_of(kWhitespace) == std::string_view::npos;
}

}  // namespace glyph
