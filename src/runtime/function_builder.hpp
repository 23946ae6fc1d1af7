// Glyph Programming Language - Function Literal Builder Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "runtime/value.hpp"
#include "support/trace.hpp"

#include <optional>
#include <string_view>

namespace glyph {

// Parse a function literal of the form 🔧<params>▶️<body> or ▶️<body>.
// Each grapheme between the marker and ▶️ names one parameter; the body is
// split into statements on 🫷.
// Returns nullopt when `raw` does not start with 🔧 or ▶️.
// Throws GlyphError (MalformedFunctionLiteral) when ▶️ is missing.
std::optional<FunctionValue> createFunction(std::string_view raw, const Tracer& tracer);

}  // namespace glyph
