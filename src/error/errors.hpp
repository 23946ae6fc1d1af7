// Glyph Programming Language - Error Types Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace glyph {

// Source location in a program (1-indexed, 0 = unknown)
struct SourceLocation {
  int line;
  int column;

  SourceLocation()
      : line(0)
      , column(0) {}
  SourceLocation(int l, int c)
      : line(l)
      , column(c) {}
};

// Suggested fix for an error
struct ErrorSuggestion {
  std::string description;
  std::string code;

  ErrorSuggestion(std::string desc, std::string c = "")
      : description(std::move(desc))
      , code(std::move(c)) {}
};

// Error categories. Every one of them aborts the current run.
enum class ErrorCategory {
  MalformedFunctionLiteral,
  MalformedConditional,
  ArityMismatch,
  UnresolvedStatement,
  ResourceExhausted
};

std::string categoryName(ErrorCategory category);

// Rich error with context and suggestions
class GlyphError : public std::exception {
private:
  ErrorCategory category_;
  std::string title_;
  std::string explanation_;
  std::string sourceCode_;
  SourceLocation location_;
  std::vector<ErrorSuggestion> suggestions_;
  std::vector<std::string> relatedInfo_;

public:
  GlyphError(ErrorCategory cat, std::string title, SourceLocation loc = SourceLocation())
      : category_(cat)
      , title_(std::move(title))
      , location_(loc) {}

  // Setters for builder pattern
  GlyphError& setExplanation(std::string expl) {
    explanation_ = std::move(expl);
    return *this;
  }

  GlyphError& setSourceCode(std::string source) {
    sourceCode_ = std::move(source);
    return *this;
  }

  GlyphError& setLocation(SourceLocation loc) {
    location_ = loc;
    return *this;
  }

  GlyphError& addSuggestion(std::string desc, std::string code = "") {
    suggestions_.emplace_back(std::move(desc), std::move(code));
    return *this;
  }

  GlyphError& addRelatedInfo(std::string info) {
    relatedInfo_.push_back(std::move(info));
    return *this;
  }

  // Exception interface: the plain title
  const char* what() const noexcept override;

  // Display formatted error
  std::string display() const;

  // Getters
  ErrorCategory category() const { return category_; }
  const std::string& title() const { return title_; }
  const std::string& explanation() const { return explanation_; }
  const std::string& sourceCode() const { return sourceCode_; }
  const SourceLocation& location() const { return location_; }
  const std::vector<ErrorSuggestion>& suggestions() const { return suggestions_; }
  const std::vector<std::string>& relatedInfo() const { return relatedInfo_; }
};

namespace errors {

// ANSI color codes
extern const char* RED;
extern const char* YELLOW;
extern const char* GREEN;
extern const char* CYAN;
extern const char* MAGENTA;
extern const char* GRAY;
extern const char* BOLD;
extern const char* DIM;
extern const char* RESET;

}  // namespace errors

}  // namespace glyph
