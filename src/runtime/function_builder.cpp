// Glyph Programming Language - Function Literal Builder
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "runtime/function_builder.hpp"

#include "error/errors.hpp"
#include "parser/symbols.hpp"
#include "text/grapheme.hpp"
#include "text/strings.hpp"

namespace glyph {

std::optional<FunctionValue> createFunction(std::string_view raw, const Tracer& tracer) {
  auto clusters = segment(raw);
  if (clusters.empty() || (clusters[0] != symbols::FN_MARK && clusters[0] != symbols::ARROW)) {
    return std::nullopt;
  }

  // Index 0 when the literal starts with ▶️ (no parameter list)
  auto arrowIndex = findSymbol(clusters, symbols::ARROW);
  if (!arrowIndex) {
    GlyphError error(ErrorCategory::MalformedFunctionLiteral,
                     "Function definition missing " + std::string(symbols::ARROW));
    error.setExplanation("A function literal needs ▶️ between its parameters and its body.")
        .addSuggestion("Separate the parameters from the body with ▶️",
                       std::string(raw) + std::string(symbols::ARROW) + "🗣️...");
    throw error;
  }

  FunctionValue fn;
  for (size_t i = 1; i < *arrowIndex; ++i) {
    fn.params.push_back(clusters[i]);
  }
  fn.body = split(join(clusters, *arrowIndex + 1), symbols::STMT_SEP);

  tracer.log("Created function: ", formatList(fn.params), " ", formatList(fn.body));
  return fn;
}

}  // namespace glyph
