// Glyph Programming Language - Source Intake Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace glyph {

// A statement line with its physical line number (1-indexed)
struct SourceLine {
  std::string text;
  int line;
};

using Program = std::vector<SourceLine>;

// Split source into statement lines: comments (`// ...`) stripped, lines
// trimmed, blank lines dropped.
Program loadProgram(std::string_view source);

// Read and load a program file. Throws std::runtime_error if unreadable.
Program readProgramFile(const std::string& path);

// Remove a trailing `//` comment (marker followed by whitespace or line end)
std::string stripComment(std::string_view line);

}  // namespace glyph
