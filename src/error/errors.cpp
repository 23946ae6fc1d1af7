// Glyph Programming Language - Error Handling
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "error/errors.hpp"

#include <algorithm>
#include <sstream>

namespace glyph {

namespace errors {

// ANSI color codes
const char* RED = "\033[31m";
const char* YELLOW = "\033[33m";
const char* GREEN = "\033[32m";
const char* CYAN = "\033[36m";
const char* MAGENTA = "\033[35m";
const char* GRAY = "\033[90m";
const char* BOLD = "\033[1m";
const char* DIM = "\033[2m";
const char* RESET = "\033[0m";

}  // namespace errors

namespace {
// Deep recursion produces one entry per frame
constexpr size_t MAX_RELATED_SHOWN = 8;
}  // namespace

std::string categoryName(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::MalformedFunctionLiteral:
    return "Malformed Function Literal";
  case ErrorCategory::MalformedConditional:
    return "Malformed Conditional";
  case ErrorCategory::ArityMismatch:
    return "Arity Mismatch";
  case ErrorCategory::UnresolvedStatement:
    return "Unresolved Statement";
  case ErrorCategory::ResourceExhausted:
    return "Resource Exhausted";
  }
  return "Error";
}

const char* GlyphError::what() const noexcept {
  return title_.c_str();
}

std::string GlyphError::display() const {
  std::ostringstream oss;

  // Header
  oss << errors::RED << errors::BOLD << categoryName(category_) << errors::RESET << ": " << title_
      << "\n\n";

  // Location and the offending statement
  if (location_.line > 0) {
    oss << "  " << errors::DIM;
    if (location_.line < 10)
      oss << " ";
    oss << location_.line << " | " << errors::RESET;
    oss << errors::BOLD << sourceCode_ << errors::RESET << "\n\n";
  } else if (!sourceCode_.empty()) {
    oss << "  " << errors::DIM << "   | " << errors::RESET << errors::BOLD << sourceCode_
        << errors::RESET << "\n\n";
  }

  // Explanation
  if (!explanation_.empty()) {
    oss << "  " << errors::CYAN << explanation_ << errors::RESET << "\n\n";
  }

  // Suggestions
  if (!suggestions_.empty()) {
    oss << "  " << errors::GREEN << "Suggestions:" << errors::RESET << "\n\n";

    for (size_t i = 0; i < suggestions_.size(); ++i) {
      oss << "  " << (i + 1) << ". " << suggestions_[i].description << "\n";

      if (!suggestions_[i].code.empty()) {
        oss << "\n     " << errors::DIM << suggestions_[i].code << errors::RESET << "\n";
      }

      oss << "\n";
    }
  }

  // Related info (call chain, innermost first)
  if (!relatedInfo_.empty()) {
    oss << "  " << errors::YELLOW << "Related:" << errors::RESET << "\n";
    size_t shown = std::min(relatedInfo_.size(), MAX_RELATED_SHOWN);
    for (size_t i = 0; i < shown; ++i) {
      oss << "    - " << relatedInfo_[i] << "\n";
    }
    if (relatedInfo_.size() > shown) {
      oss << "    " << errors::DIM << "... and " << (relatedInfo_.size() - shown) << " more"
          << errors::RESET << "\n";
    }
    oss << "\n";
  }

  return oss.str();
}

}  // namespace glyph
