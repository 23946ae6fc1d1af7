// Glyph Programming Language - REPL Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "cli/interpreter/interpreter.hpp"
#include "cli/repl/session.hpp"

#include <optional>
#include <string>
#include <vector>

// Forward declare for linenoise callbacks
struct linenoiseCompletions;

namespace glyph {

// Interactive terminal front-end: line editing, history and completion
// around a REPLSession

class REPL {
private:
  REPLSession session_;
  std::string historyFile_;

public:
  explicit REPL(Interpreter& interp);

  // Set up completion hooks and load history
  void initialize();

  // Run the REPL loop until :quit or EOF
  void run();

  REPLSession& session() { return session_; }

  // Expose completion for linenoise hook
  std::vector<std::string> getCompletions(const std::string& input) const;

  // Friend functions for linenoise callbacks
  friend void completionHook(const char* buf, linenoiseCompletions* lc);
  friend char* hintsHook(const char* buf, int* color, int* bold);

private:
  // nullopt on EOF (Ctrl-D)
  std::optional<std::string> readInput();
};

}  // namespace glyph
