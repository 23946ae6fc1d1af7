// Glyph Programming Language - Source Intake
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "parser/source.hpp"

#include "text/strings.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace glyph {

std::string stripComment(std::string_view line) {
  size_t pos = line.find("//");
  while (pos != std::string_view::npos) {
    size_t after = pos + 2;
    if (after == line.size() || isWhitespace(line.substr(after, 1))) {
      return std::string(line.substr(0, pos));
    }
    pos = line.find("//", pos + 1);
  }
  return std::string(line);
}

Program loadProgram(std::string_view source) {
  Program program;
  int lineNumber = 0;
  for (const auto& raw : split(source, "\n")) {
    lineNumber++;
    std::string text = trim(stripComment(raw));
    if (text.empty())
      continue;
    program.push_back({std::move(text), lineNumber});
  }
  return program;
}

Program readProgramFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw std::runtime_error("Could not open file " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return loadProgram(buffer.str());
}

}  // namespace glyph
