// Glyph Programming Language - REPL Session Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "cli/interpreter/interpreter.hpp"

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace glyph {

// Forward declarations
class REPLContext;
class REPLSession;

// REPL Command Base Class

class REPLCommand {
public:
  virtual ~REPLCommand() = default;

  // Command metadata
  virtual std::string name() const = 0;
  virtual std::vector<std::string> aliases() const { return {}; }
  virtual std::string description() const = 0;
  virtual std::string usage() const { return ":" + name(); }

  // Execute the command
  virtual void execute(const std::string& args, REPLContext& ctx) = 0;
};

// REPL Context (Shared State)

class REPLContext {
private:
  Interpreter& interp_;
  std::ostream& out_;
  std::ostream& err_;

public:
  std::string lastLoadedFile;
  int inputCount = 0;

  REPLContext(Interpreter& interp, std::ostream& out, std::ostream& err)
      : interp_(interp)
      , out_(out)
      , err_(err) {}

  Interpreter& interp() { return interp_; }
  std::ostream& out() { return out_; }
  std::ostream& err() { return err_; }

  std::vector<std::string> getBindings() const;

  // Run a program file into the session; reports errors, returns success
  bool loadFile(const std::string& filename);
};

// Tab Completion Engine

class CompletionEngine {
private:
  std::vector<std::string> commands_;
  std::function<std::vector<std::string>()> getBindings_;

public:
  void setCommandNames(const std::vector<std::string>& commands);
  void setBindingsProvider(std::function<std::vector<std::string>()> provider);

  // ":" + command for command input, bound names otherwise
  std::vector<std::string> complete(const std::string& input) const;

private:
  static std::vector<std::string> filterMatches(const std::string& prefix,
                                                const std::vector<std::string>& candidates);
};

// Command Registry

class CommandRegistry {
private:
  std::map<std::string, std::shared_ptr<REPLCommand>> commands_;
  std::map<std::string, std::string> aliases_;  // alias -> canonical name

public:
  void registerCommand(std::shared_ptr<REPLCommand> cmd);
  std::shared_ptr<REPLCommand> getCommand(const std::string& name) const;
  std::vector<std::string> getAllCommandNames() const;
  std::vector<std::pair<std::string, std::string>> getAllCommands() const;

  bool hasCommand(const std::string& name) const;
};

// Line processing and command dispatch, independent of the terminal

class REPLSession {
private:
  REPLContext ctx_;
  CommandRegistry registry_;
  CompletionEngine completion_;

  bool running_;

public:
  explicit REPLSession(Interpreter& interp,
                       std::ostream& out = std::cout,
                       std::ostream& err = std::cerr);

  // Run one line of input: a :command or a statement
  void processLine(const std::string& input);

  void printWelcome();

  bool running() const { return running_; }
  void start() { running_ = true; }
  void stop() { running_ = false; }

  std::vector<std::string> getCompletions(const std::string& input) const;

  REPLContext& context() { return ctx_; }
  CommandRegistry& registry() { return registry_; }

private:
  void registerBuiltinCommands();
};

// Built-in Commands

class QuitCommand : public REPLCommand {
  REPLSession& session_;

public:
  explicit QuitCommand(REPLSession& session)
      : session_(session) {}
  std::string name() const override { return "quit"; }
  std::vector<std::string> aliases() const override { return {"q", "exit"}; }
  std::string description() const override { return "Exit the REPL"; }
  void execute(const std::string& args, REPLContext& ctx) override;
};

class HelpCommand : public REPLCommand {
  CommandRegistry& registry_;

public:
  explicit HelpCommand(CommandRegistry& registry)
      : registry_(registry) {}
  std::string name() const override { return "help"; }
  std::vector<std::string> aliases() const override { return {"h", "?"}; }
  std::string description() const override { return "Show help message"; }
  void execute(const std::string& args, REPLContext& ctx) override;
};

class InfoCommand : public REPLCommand {
public:
  std::string name() const override { return "info"; }
  std::vector<std::string> aliases() const override { return {"i"}; }
  std::string description() const override { return "Show the value bound to a name"; }
  std::string usage() const override { return ":info NAME"; }
  void execute(const std::string& args, REPLContext& ctx) override;
};

class BrowseCommand : public REPLCommand {
public:
  std::string name() const override { return "browse"; }
  std::vector<std::string> aliases() const override { return {"b"}; }
  std::string description() const override { return "List all bindings in scope"; }
  void execute(const std::string& args, REPLContext& ctx) override;
};

class LoadCommand : public REPLCommand {
public:
  std::string name() const override { return "load"; }
  std::vector<std::string> aliases() const override { return {"l"}; }
  std::string description() const override { return "Load and execute a file"; }
  std::string usage() const override { return ":load FILE"; }
  void execute(const std::string& args, REPLContext& ctx) override;
};

class ReloadCommand : public REPLCommand {
public:
  std::string name() const override { return "reload"; }
  std::vector<std::string> aliases() const override { return {"r"}; }
  std::string description() const override { return "Reload the last loaded file"; }
  void execute(const std::string& args, REPLContext& ctx) override;
};

class ClearCommand : public REPLCommand {
public:
  std::string name() const override { return "clear"; }
  std::string description() const override { return "Clear REPL state (drop all bindings)"; }
  void execute(const std::string& args, REPLContext& ctx) override;
};

class TraceCommand : public REPLCommand {
public:
  std::string name() const override { return "trace"; }
  std::vector<std::string> aliases() const override { return {"v"}; }
  std::string description() const override { return "Toggle evaluation tracing"; }
  std::string usage() const override { return ":trace [on|off]"; }
  void execute(const std::string& args, REPLContext& ctx) override;
};

}  // namespace glyph
