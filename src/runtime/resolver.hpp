// Glyph Programming Language - Value Resolution Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "runtime/environment.hpp"
#include "support/trace.hpp"

#include <string>
#include <string_view>

namespace glyph {

// Follow an alias chain from `name`: while the current binding is text that
// is itself a bound name, look that name up next. Returns the last text value
// found, or `name` itself when it has no text binding.
// A self alias (X -> X) stops immediately; a longer cycle (A -> B -> A) does
// not terminate.
std::string resolveValue(const std::string& name, const Environment& env, const Tracer& tracer);

// Evaluate a ➕ expression. Each trimmed part that is a single grapheme is
// resolved as a variable; longer parts are literal text. Parts are joined
// without a separator.
std::string parseConcat(std::string_view raw, const Environment& env, const Tracer& tracer);

}  // namespace glyph
