// Glyph Programming Language - Symbol Table Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <optional>
#include <string_view>

namespace glyph {

enum class SymbolKind {
  Assign,
  Print,
  Conditional,
  Arrow,
  Equals,
  Concat,
  FunctionMark,
  StatementSeparator
};

// Operator tokens. Each is exactly one grapheme cluster.
namespace symbols {
inline constexpr std::string_view ASSIGN = "👉";
inline constexpr std::string_view PRINT = "🗣️";
inline constexpr std::string_view COND = "❓";
inline constexpr std::string_view ARROW = "▶️";
inline constexpr std::string_view EQUALS = "🟰";
inline constexpr std::string_view CONCAT = "➕";
inline constexpr std::string_view FN_MARK = "🔧";
inline constexpr std::string_view STMT_SEP = "🫷";
}  // namespace symbols

std::string_view symbolToken(SymbolKind kind);
std::string_view symbolName(SymbolKind kind);

// Any operator whose token equals the cluster
std::optional<SymbolKind> lookupSymbol(std::string_view cluster);

// Only the operators that introduce a statement (assign, print, conditional)
std::optional<SymbolKind> lookupStatementSymbol(std::string_view cluster);

}  // namespace glyph
