// Glyph Programming Language - Trace Channel
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "support/trace.hpp"

#include "error/errors.hpp"

namespace glyph {

void Tracer::write(const std::string& message) const {
  *out_ << errors::GRAY << " [V] " << "\033[39;2m" << message << "\033[22m" << errors::RESET
        << "\n";
}

std::string formatList(const std::vector<std::string>& items) {
  std::string result = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0)
      result += ", ";
    result += "\"" + items[i] + "\"";
  }
  result += "]";
  return result;
}

}  // namespace glyph
