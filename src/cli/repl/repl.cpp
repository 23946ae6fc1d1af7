// Glyph Programming Language - REPL Implementation
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "cli/repl/repl.hpp"

#include <cstdlib>
#include <cstring>
#include <linenoise.h>

namespace glyph {

namespace {

// Global pointer to REPL instance for callback
REPL* g_replInstance = nullptr;

std::string historyPath() {
  const char* home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/.glyph_history";
  }
  return ".glyph_history";
}

}  // namespace

// Bridge function for linenoise completion
void completionHook(const char* buf, linenoiseCompletions* lc) {
  if (!g_replInstance)
    return;

  auto matches = g_replInstance->getCompletions(buf);
  for (const auto& match : matches) {
    linenoiseAddCompletion(lc, match.c_str());
  }
}

// Bridge function for linenoise hints (inline suggestions)
char* hintsHook(const char* buf, int* color, int* bold) {
  if (!g_replInstance)
    return nullptr;

  std::string input(buf);
  if (input.empty())
    return nullptr;

  auto matches = g_replInstance->getCompletions(input);

  // Single match that extends input: show as inline hint
  if (matches.size() == 1 && matches[0] != input) {
    *color = 90;  // Gray color
    *bold = 0;
    std::string hint = matches[0].substr(input.length());
    return strdup(hint.c_str());
  }

  return nullptr;
}

REPL::REPL(Interpreter& interp)
    : session_(interp)
    , historyFile_(historyPath()) {}

void REPL::initialize() {
  g_replInstance = this;
  linenoiseSetCompletionCallback(completionHook);
  linenoiseSetHintsCallback(hintsHook);
  linenoiseSetFreeHintsCallback(free);

  linenoiseHistoryLoad(historyFile_.c_str());
}

std::vector<std::string> REPL::getCompletions(const std::string& input) const {
  return session_.getCompletions(input);
}

std::optional<std::string> REPL::readInput() {
  char* line = linenoise("glyph> ");
  if (line == nullptr) {
    // EOF or error
    return std::nullopt;
  }

  std::string input(line);
  free(line);  // linenoise allocates with malloc

  if (!input.empty()) {
    linenoiseHistoryAdd(input.c_str());
    // Save history incrementally
    linenoiseHistorySave(historyFile_.c_str());
  }
  return input;
}

void REPL::run() {
  session_.printWelcome();
  session_.start();

  while (session_.running()) {
    auto input = readInput();
    if (!input) {
      break;
    }
    session_.processLine(*input);
  }
}

}  // namespace glyph
