// Glyph Programming Language - Symbol Table
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "parser/symbols.hpp"

#include <array>

namespace glyph {

namespace {

struct SymbolInfo {
  SymbolKind kind;
  std::string_view token;
  std::string_view name;
  bool startsStatement;
};

constexpr std::array<SymbolInfo, 8> kSymbols = {{
    {SymbolKind::Assign, symbols::ASSIGN, "ASSIGN", true},
    {SymbolKind::Print, symbols::PRINT, "PRINT", true},
    {SymbolKind::Conditional, symbols::COND, "COND", true},
    {SymbolKind::Arrow, symbols::ARROW, "ARROW", false},
    {SymbolKind::Equals, symbols::EQUALS, "EQUALS", false},
    {SymbolKind::Concat, symbols::CONCAT, "CONCAT", false},
    {SymbolKind::FunctionMark, symbols::FN_MARK, "FN_MARK", false},
    {SymbolKind::StatementSeparator, symbols::STMT_SEP, "STMT_SEP", false},
}};

const SymbolInfo& info(SymbolKind kind) {
  for (const auto& entry : kSymbols) {
    if (entry.kind == kind) {
      return entry;
    }
  }
  return kSymbols.front();  // unreachable: every kind has an entry
}

}  // namespace

std::string_view symbolToken(SymbolKind kind) {
  return info(kind).token;
}

std::string_view symbolName(SymbolKind kind) {
  return info(kind).name;
}

std::optional<SymbolKind> lookupSymbol(std::string_view cluster) {
  for (const auto& entry : kSymbols) {
    if (entry.token == cluster) {
      return entry.kind;
    }
  }
  return std::nullopt;
}

std::optional<SymbolKind> lookupStatementSymbol(std::string_view cluster) {
  for (const auto& entry : kSymbols) {
    if (entry.startsStatement && entry.token == cluster) {
      return entry.kind;
    }
  }
  return std::nullopt;
}

}  // namespace glyph
