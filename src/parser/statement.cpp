// Glyph Programming Language - Statement Dispatcher
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "parser/statement.hpp"

#include "text/grapheme.hpp"
#include "text/strings.hpp"

#include <cstddef>

namespace glyph {

std::optional<Statement> parseLine(std::string_view line) {
  auto clusters = segment(line);

  for (size_t i = 0; i < clusters.size(); ++i) {
    auto kind = lookupStatementSymbol(clusters[i]);
    if (!kind)
      continue;

    Statement stmt{*kind, clusters[i], {}};
    if (*kind == SymbolKind::Assign) {
      stmt.args.push_back(trim(join(clusters, 0, i)));
      stmt.args.push_back(trim(join(clusters, i + 1)));
    } else {
      stmt.args.assign(clusters.begin() + static_cast<std::ptrdiff_t>(i) + 1, clusters.end());
    }
    return stmt;
  }

  return std::nullopt;
}

}  // namespace glyph
