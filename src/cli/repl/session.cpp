// Glyph Programming Language - REPL Session
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "cli/repl/session.hpp"

#include "error/errors.hpp"
#include "parser/source.hpp"
#include "text/strings.hpp"

#include <algorithm>

namespace glyph {

using errors::BOLD;
using errors::CYAN;
using errors::GREEN;
using errors::MAGENTA;
using errors::RED;
using errors::RESET;
using errors::YELLOW;

// REPLContext Implementation

std::vector<std::string> REPLContext::getBindings() const {
  std::vector<std::string> names;
  for (const auto& [name, _] : interp_.globals().entries()) {
    names.push_back(name);
  }
  return names;
}

bool REPLContext::loadFile(const std::string& filename) {
  try {
    auto program = readProgramFile(filename);
    interp_.run(program);
    return true;
  } catch (const GlyphError& e) {
    err_ << RED << "Error loading " << filename << ":" << RESET << "\n" << e.display();
  } catch (const std::exception& e) {
    err_ << RED << "Error:" << RESET << " " << e.what() << std::endl;
  }
  return false;
}

// CompletionEngine Implementation

void CompletionEngine::setCommandNames(const std::vector<std::string>& commands) {
  commands_ = commands;
}

void CompletionEngine::setBindingsProvider(std::function<std::vector<std::string>()> provider) {
  getBindings_ = std::move(provider);
}

std::vector<std::string> CompletionEngine::complete(const std::string& input) const {
  if (input.empty()) {
    return {};
  }

  // If starts with ':', complete command names
  if (input[0] == ':') {
    auto matches = filterMatches(input.substr(1), commands_);
    for (auto& match : matches) {
      match = ":" + match;
    }
    return matches;
  }

  if (!getBindings_) {
    return {};
  }
  return filterMatches(input, getBindings_());
}

std::vector<std::string> CompletionEngine::filterMatches(
    const std::string& prefix, const std::vector<std::string>& candidates) {
  std::vector<std::string> matches;
  for (const auto& candidate : candidates) {
    if (startsWith(candidate, prefix)) {
      matches.push_back(candidate);
    }
  }
  return matches;
}

// CommandRegistry Implementation

void CommandRegistry::registerCommand(std::shared_ptr<REPLCommand> cmd) {
  std::string name = cmd->name();
  commands_[name] = cmd;

  // Register aliases
  for (const auto& alias : cmd->aliases()) {
    aliases_[alias] = name;
  }
}

std::shared_ptr<REPLCommand> CommandRegistry::getCommand(const std::string& name) const {
  auto it = commands_.find(name);
  if (it != commands_.end()) {
    return it->second;
  }

  auto aliasIt = aliases_.find(name);
  if (aliasIt != aliases_.end()) {
    return commands_.at(aliasIt->second);
  }

  return nullptr;
}

std::vector<std::string> CommandRegistry::getAllCommandNames() const {
  std::vector<std::string> names;
  for (const auto& [name, _] : commands_) {
    names.push_back(name);
  }
  return names;
}

std::vector<std::pair<std::string, std::string>> CommandRegistry::getAllCommands() const {
  std::vector<std::pair<std::string, std::string>> result;
  for (const auto& [name, cmd] : commands_) {
    result.push_back({name, cmd->description()});
  }
  return result;
}

bool CommandRegistry::hasCommand(const std::string& name) const {
  return commands_.count(name) > 0 || aliases_.count(name) > 0;
}

// REPLSession Implementation

REPLSession::REPLSession(Interpreter& interp, std::ostream& out, std::ostream& err)
    : ctx_(interp, out, err)
    , registry_()
    , completion_()
    , running_(false) {
  registerBuiltinCommands();
  completion_.setCommandNames(registry_.getAllCommandNames());
  completion_.setBindingsProvider([this]() { return ctx_.getBindings(); });
}

void REPLSession::registerBuiltinCommands() {
  registry_.registerCommand(std::make_shared<HelpCommand>(registry_));
  registry_.registerCommand(std::make_shared<QuitCommand>(*this));
  registry_.registerCommand(std::make_shared<InfoCommand>());
  registry_.registerCommand(std::make_shared<BrowseCommand>());
  registry_.registerCommand(std::make_shared<LoadCommand>());
  registry_.registerCommand(std::make_shared<ReloadCommand>());
  registry_.registerCommand(std::make_shared<ClearCommand>());
  registry_.registerCommand(std::make_shared<TraceCommand>());
}

std::vector<std::string> REPLSession::getCompletions(const std::string& input) const {
  return completion_.complete(input);
}

void REPLSession::printWelcome() {
  std::ostream& out = ctx_.out();
  out << CYAN << "👉 🗣️ ❓ ▶️ 🟰 ➕ 🔧 🫷" << RESET << "\n\n";
  out << BOLD << "Glyph REPL" << RESET << " v0.1" << std::endl;
  out << "Type " << GREEN << ":help" << RESET << " for commands, " << GREEN << ":quit" << RESET
      << " to exit.\n"
      << std::endl;
}

void REPLSession::processLine(const std::string& input) {
  std::string trimmed = trim(input);
  if (trimmed.empty()) {
    return;
  }

  // Check if it's a command
  if (trimmed[0] == ':') {
    std::string cmdLine = trimmed.substr(1);
    size_t spacePos = cmdLine.find(' ');
    std::string cmdName, args;

    if (spacePos != std::string::npos) {
      cmdName = cmdLine.substr(0, spacePos);
      args = trim(cmdLine.substr(spacePos + 1));
    } else {
      cmdName = cmdLine;
    }

    auto cmd = registry_.getCommand(cmdName);
    if (cmd) {
      try {
        cmd->execute(args, ctx_);
      } catch (const std::exception& e) {
        ctx_.err() << RED << "Command error:" << RESET << " " << e.what() << std::endl;
      }
    } else {
      ctx_.err() << RED << "Unknown command:" << RESET << " :" << cmdName << "\n";
      ctx_.out() << "Type " << GREEN << ":help" << RESET << " for available commands."
                 << std::endl;
    }
    return;
  }

  // Not a command - run as a statement. Bindings made before a failure stay.
  ctx_.inputCount++;
  try {
    ctx_.interp().runLine(trimmed, ctx_.inputCount);
  } catch (const GlyphError& e) {
    ctx_.err() << e.display();
  } catch (const std::exception& e) {
    ctx_.err() << RED << "Error:" << RESET << " " << e.what() << std::endl;
  }
}

// Built-in Commands Implementation

void QuitCommand::execute(const std::string&, REPLContext& ctx) {
  ctx.out() << "Goodbye!" << std::endl;
  session_.stop();
}

void HelpCommand::execute(const std::string&, REPLContext& ctx) {
  std::ostream& out = ctx.out();
  out << "\n" << BOLD << "Glyph REPL Commands:" << RESET << "\n";

  auto commands = registry_.getAllCommands();
  std::sort(commands.begin(), commands.end());

  for (const auto& [name, desc] : commands) {
    auto cmd = registry_.getCommand(name);
    out << "  " << GREEN << cmd->usage() << RESET;

    auto aliases = cmd->aliases();
    if (!aliases.empty()) {
      out << " (";
      for (size_t i = 0; i < aliases.size(); ++i) {
        if (i > 0)
          out << ", ";
        out << ":" << aliases[i];
      }
      out << ")";
    }

    out << "\n    " << desc << "\n";
  }

  out << "\n" << BOLD << "Examples:" << RESET << "\n";
  out << "  😃👉Happy\n";
  out << "  🗣️😃\n";
  out << "  😡👉🔧🔍▶️🗣️Got ➕🔍\n";
  out << "  😡 Hello\n";
  out << "  ❓😃🟰Happy▶️🗣️Yes\n" << std::endl;
}

void InfoCommand::execute(const std::string& args, REPLContext& ctx) {
  if (args.empty()) {
    ctx.err() << YELLOW << "Usage:" << RESET << " :info NAME" << std::endl;
    return;
  }

  const Value* value = ctx.interp().globals().get(args);
  if (!value) {
    ctx.err() << RED << "Error:" << RESET << " Binding '" << args << "' not found.\n";
    ctx.err() << "  Use " << GREEN << ":browse" << RESET << " to see all bindings." << std::endl;
    return;
  }

  std::ostream& out = ctx.out();
  out << BOLD << CYAN << args << RESET << "\n";
  std::visit(overload{[&out](const TextValue& t) {
                        out << "  Kind: " << MAGENTA << "text" << RESET << "\n";
                        out << "  Value: " << GREEN << t.value << RESET << "\n";
                      },
                      [&out](const FunctionValue& f) {
                        out << "  Kind: " << MAGENTA << "function" << RESET << "\n";
                        out << "  Parameters: " << f.params.size() << "\n";
                        for (const auto& line : f.body) {
                          out << "    " << GREEN << line << RESET << "\n";
                        }
                      }},
             value->data);
  out << std::endl;
}

void BrowseCommand::execute(const std::string&, REPLContext& ctx) {
  std::ostream& out = ctx.out();
  out << BOLD << "Bindings in scope:" << RESET << "\n\n";

  auto bindings = ctx.interp().globals().entries();
  if (bindings.empty()) {
    out << "  (No bindings)\n";
    out << "  Try defining something with " << GREEN << "😃👉Happy" << RESET << "\n\n";
    return;
  }

  for (const auto& [name, value] : bindings) {
    out << "  " << BOLD << CYAN << name << RESET << " " << symbols::ASSIGN << " "
        << valueToString(value) << "\n";
  }

  out << "\n"
      << YELLOW << "Total: " << bindings.size() << " binding(s)" << RESET << "\n"
      << std::endl;
}

void LoadCommand::execute(const std::string& args, REPLContext& ctx) {
  if (args.empty()) {
    ctx.err() << YELLOW << "Usage:" << RESET << " :load FILE" << std::endl;
    return;
  }

  ctx.lastLoadedFile = args;
  if (ctx.loadFile(args)) {
    ctx.out() << GREEN << "Loaded " << args << RESET << std::endl;
  }
}

void ReloadCommand::execute(const std::string&, REPLContext& ctx) {
  if (ctx.lastLoadedFile.empty()) {
    ctx.err() << YELLOW << "Warning:" << RESET
              << " No file has been loaded yet. Use :load FILE first." << std::endl;
    return;
  }

  LoadCommand loadCmd;
  loadCmd.execute(ctx.lastLoadedFile, ctx);
}

void ClearCommand::execute(const std::string&, REPLContext& ctx) {
  ctx.interp().reset();
  ctx.out() << YELLOW << "Cleared all bindings." << RESET << std::endl;
}

void TraceCommand::execute(const std::string& args, REPLContext& ctx) {
  bool enabled = !ctx.interp().options().traceEnabled;
  if (args == "on") {
    enabled = true;
  } else if (args == "off") {
    enabled = false;
  } else if (!args.empty()) {
    ctx.err() << YELLOW << "Usage:" << RESET << " :trace [on|off]" << std::endl;
    return;
  }

  ctx.interp().setTraceEnabled(enabled);
  ctx.out() << "Tracing " << (enabled ? "on" : "off") << std::endl;
}

}  // namespace glyph
