// Glyph Programming Language - Interpreter Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "parser/source.hpp"
#include "parser/statement.hpp"
#include "runtime/environment.hpp"
#include "runtime/value.hpp"
#include "support/trace.hpp"
#include "text/grapheme.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace glyph {

struct InterpreterOptions {
  bool traceEnabled = false;
  // Nested function calls and conditional blocks allowed; 0 = unlimited
  std::size_t maxCallDepth = 1000;
};

// Positional arguments of a call line whose first cluster is the function
// name. Whitespace-separated words when the rest of the line contains
// whitespace, otherwise one argument per grapheme.
std::vector<std::string> callArguments(const Graphemes& clusters);

class Interpreter {
public:
  explicit Interpreter(InterpreterOptions options = InterpreterOptions(),
                       std::ostream& out = std::cout,
                       std::ostream& traceOut = std::cerr);

  // Execute a program against the global environment. Fatal errors propagate
  // as GlyphError tagged with the failing top-level line.
  void run(const Program& program);
  void runSource(std::string_view source);

  // Execute one top-level statement (REPL input)
  void runLine(const std::string& line, int lineNumber = 0);

  // The interpreter loop: run statement lines in order inside `env`
  void execute(const std::vector<std::string>& lines, Environment& env);
  void executeLine(const std::string& line, Environment& env);

  Environment& globals() { return globals_; }
  const Environment& globals() const { return globals_; }

  // Drop every global binding
  void reset();

  const InterpreterOptions& options() const { return options_; }
  void setTraceEnabled(bool enabled);

private:
  void evalAssign(const Statement& stmt, Environment& env);
  void evalPrint(const Statement& stmt, Environment& env);
  void evalConditional(const Statement& stmt, Environment& env);
  void callFunction(const std::string& line, Environment& env);
  void runBody(const FunctionValue& fn, Environment& scope, const std::string& label);

  InterpreterOptions options_;
  std::ostream& out_;
  Tracer tracer_;
  Environment globals_;
  std::size_t depth_ = 0;
};

}  // namespace glyph
