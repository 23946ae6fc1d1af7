// Glyph Programming Language - Statement Dispatcher Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "parser/symbols.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glyph {

// One parsed line, consumed immediately by the interpreter.
//  Assign:            args = [name, value] (both trimmed)
//  Print/Conditional: args = the grapheme clusters after the symbol
struct Statement {
  SymbolKind kind;
  std::string token;
  std::vector<std::string> args;
};

// Find the leftmost statement symbol (👉 🗣️ ❓) in the line.
// Returns nullopt when there is none: the line is a function call.
std::optional<Statement> parseLine(std::string_view line);

}  // namespace glyph
