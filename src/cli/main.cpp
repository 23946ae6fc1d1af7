// Glyph Programming Language - Main Entry Point
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "cli/interpreter/interpreter.hpp"
#include "error/errors.hpp"
#include "parser/source.hpp"
#include "parser/statement.hpp"
#include "support/trace.hpp"
#include "text/grapheme.hpp"

#ifdef GLYPH_HAVE_LINENOISE
#include "cli/repl/repl.hpp"
#endif

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr const char* VERSION = "0.1.0";

using glyph::errors::BOLD;
using glyph::errors::GREEN;
using glyph::errors::RED;
using glyph::errors::RESET;

void printUsage(const char* program) {
  std::cout << BOLD << "Usage:" << RESET << std::endl;
  std::cout << "  " << program << " " << GREEN << "repl" << RESET
            << "           - Start interactive REPL" << std::endl;
  std::cout << "  " << program << " " << GREEN << "run" << RESET
            << " FILE       - Execute a Glyph file" << std::endl;
  std::cout << "  " << program << " " << GREEN << "tokens" << RESET
            << " FILE    - Show the graphemes and statement kind of each line" << std::endl;
  std::cout << "\n" << BOLD << "Options:" << RESET << std::endl;
  std::cout << "  --trace          Print evaluation trace to stderr (also VERBOSE=true)"
            << std::endl;
  std::cout << "  --max-depth N    Limit nested calls and blocks (0 = unlimited, default 1000)"
            << std::endl;
  std::cout << "  --version        Show version" << std::endl;
  std::cout << "  --help           Show this message" << std::endl;
}

// Start interactive REPL session
int runRepl(const glyph::InterpreterOptions& options) {
#ifdef GLYPH_HAVE_LINENOISE
  glyph::Interpreter interpreter(options);
  glyph::REPL repl(interpreter);
  repl.initialize();
  repl.run();
  return 0;
#else
  (void)options;
  std::cerr << RED << "Error:" << RESET
            << " interactive mode is not available (built without linenoise)" << std::endl;
  return 1;
#endif
}

// Execute Glyph source file
int runFile(const std::string& filename, const glyph::InterpreterOptions& options) {
  glyph::Interpreter interpreter(options);
  try {
    interpreter.run(glyph::readProgramFile(filename));
  } catch (const glyph::GlyphError& e) {
    std::cerr << e.display();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << RED << "Error:" << RESET << " " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

// Dump how each line is split into graphemes and dispatched
int showTokens(const std::string& filename) {
  glyph::Program program;
  try {
    program = glyph::readProgramFile(filename);
  } catch (const std::exception& e) {
    std::cerr << RED << "Error:" << RESET << " " << e.what() << std::endl;
    return 1;
  }

  for (const auto& line : program) {
    std::cout << BOLD << line.line << RESET << ": " << glyph::formatList(glyph::segment(line.text));
    if (auto stmt = glyph::parseLine(line.text)) {
      std::cout << " " << GREEN << glyph::symbolName(stmt->kind) << RESET;
    } else {
      std::cout << " " << GREEN << "CALL" << RESET;
    }
    std::cout << std::endl;
  }
  return 0;
}

bool parseDepth(const std::string& text, std::size_t& depth) {
  try {
    size_t used = 0;
    unsigned long value = std::stoul(text, &used);
    if (used != text.size()) {
      return false;
    }
    depth = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

// Main entry point for the Glyph interpreter
// Handles command-line arguments and routes to appropriate subcommands
int main(int argc, char* argv[]) {
  glyph::InterpreterOptions options;

  const char* verbose = std::getenv("VERBOSE");
  if (verbose && std::string(verbose) == "true") {
    options.traceEnabled = true;
  }

  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--trace") {
      options.traceEnabled = true;
    } else if (arg == "--max-depth") {
      if (i + 1 >= argc || !parseDepth(argv[i + 1], options.maxCallDepth)) {
        std::cerr << RED << "Error:" << RESET << " --max-depth expects a non-negative number"
                  << std::endl;
        return 1;
      }
      ++i;
    } else if (arg == "--version") {
      std::cout << "glyph " << VERSION << std::endl;
      return 0;
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty() || (positional[0] == "repl" && positional.size() == 1)) {
    return runRepl(options);
  } else if (positional[0] == "run" && positional.size() == 2) {
    return runFile(positional[1], options);
  } else if (positional[0] == "tokens" && positional.size() == 2) {
    return showTokens(positional[1]);
  }

  printUsage(argv[0]);
  return 1;
}
