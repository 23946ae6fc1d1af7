// Glyph Programming Language - Interpreter Implementation
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "cli/interpreter/interpreter.hpp"

#include "error/errors.hpp"
#include "parser/symbols.hpp"
#include "runtime/function_builder.hpp"
#include "runtime/resolver.hpp"
#include "text/strings.hpp"

#include <algorithm>
#include <optional>

namespace glyph {

namespace {

// Tracks nesting of function calls and conditional blocks
class DepthGuard {
public:
  DepthGuard(std::size_t& depth, std::size_t limit)
      : depth_(depth) {
    if (limit > 0 && depth_ >= limit) {
      throw GlyphError(ErrorCategory::ResourceExhausted,
                       "Maximum call depth exceeded (" + std::to_string(limit) + ")")
          .setExplanation("Functions or conditional blocks nested too deeply, usually "
                          "unbounded recursion.")
          .addSuggestion("Make sure every recursive function reaches a ❓ branch that stops "
                         "calling itself");
    }
    ++depth_;
  }
  ~DepthGuard() { --depth_; }

  DepthGuard(const DepthGuard&) = delete;
  DepthGuard& operator=(const DepthGuard&) = delete;

private:
  std::size_t& depth_;
};

std::optional<FunctionValue> functionBinding(const Environment& env, const std::string& name) {
  const Value* value = env.get(name);
  if (!value) {
    return std::nullopt;
  }
  return std::visit(overload{[](const TextValue&) -> std::optional<FunctionValue> {
                               return std::nullopt;
                             },
                             [](const FunctionValue& f) -> std::optional<FunctionValue> {
                               return f;
                             }},
                    value->data);
}

GlyphError unresolvedStatement(const std::string& line,
                               const std::string& name,
                               const Environment& env) {
  GlyphError error(ErrorCategory::UnresolvedStatement, "Unknown syntax or function call: " + line);

  if (const Value* value = env.get(name)) {
    error.setExplanation("'" + name + "' holds text (\"" + valueToString(*value) +
                         "\"), not a function.");
  } else {
    error.setExplanation("The line has no 👉, 🗣️ or ❓ and '" + name +
                         "' is not a defined function.");
  }

  std::string callable;
  for (const auto& [binding, value] : env.entries()) {
    if (std::holds_alternative<FunctionValue>(value.data)) {
      if (!callable.empty())
        callable += " ";
      callable += binding;
    }
  }
  if (!callable.empty()) {
    error.addSuggestion("Call one of the defined functions", callable);
  } else {
    error.addSuggestion("Define a function before calling it", name + "👉🔧▶️🗣️...");
  }
  return error;
}

}  // namespace

std::vector<std::string> callArguments(const Graphemes& clusters) {
  std::vector<std::string> args;
  if (clusters.size() < 2) {
    return args;
  }

  bool spaced = std::any_of(clusters.begin() + 1, clusters.end(),
                            [](const std::string& c) { return isWhitespace(c); });
  if (!spaced) {
    args.assign(clusters.begin() + 1, clusters.end());
    return args;
  }

  std::string word;
  for (size_t i = 1; i < clusters.size(); ++i) {
    if (isWhitespace(clusters[i])) {
      if (!word.empty()) {
        args.push_back(word);
        word.clear();
      }
    } else {
      word += clusters[i];
    }
  }
  if (!word.empty()) {
    args.push_back(word);
  }
  return args;
}

Interpreter::Interpreter(InterpreterOptions options, std::ostream& out, std::ostream& traceOut)
    : options_(options)
    , out_(out)
    , tracer_(traceOut, options.traceEnabled) {}

void Interpreter::setTraceEnabled(bool enabled) {
  options_.traceEnabled = enabled;
  tracer_.setEnabled(enabled);
}

void Interpreter::reset() {
  globals_.clear();
  depth_ = 0;
}

void Interpreter::run(const Program& program) {
  for (const auto& line : program) {
    runLine(line.text, line.line);
  }
}

void Interpreter::runSource(std::string_view source) {
  run(loadProgram(source));
}

void Interpreter::runLine(const std::string& line, int lineNumber) {
  try {
    executeLine(line, globals_);
  } catch (GlyphError& e) {
    e.setLocation(SourceLocation(lineNumber, 1)).setSourceCode(trim(line));
    throw;
  }
}

void Interpreter::execute(const std::vector<std::string>& lines, Environment& env) {
  for (const auto& line : lines) {
    executeLine(line, env);
  }
}

void Interpreter::executeLine(const std::string& line, Environment& env) {
  std::string trimmed = trim(line);
  if (trimmed.empty())
    return;

  tracer_.log("Processing line: ", trimmed);

  if (auto stmt = parseLine(trimmed)) {
    tracer_.log("Found token: ", stmt->token, " ", formatList(stmt->args));
    switch (stmt->kind) {
    case SymbolKind::Assign:
      evalAssign(*stmt, env);
      break;
    case SymbolKind::Print:
      evalPrint(*stmt, env);
      break;
    case SymbolKind::Conditional:
      evalConditional(*stmt, env);
      break;
    default:
      // parseLine only yields statement symbols
      break;
    }
    return;
  }

  callFunction(trimmed, env);
}

void Interpreter::evalAssign(const Statement& stmt, Environment& env) {
  const std::string& name = stmt.args[0];
  const std::string& valueRaw = stmt.args[1];
  if (name.empty() || valueRaw.empty())
    return;

  if (auto fn = createFunction(valueRaw, tracer_)) {
    tracer_.log("Assigned function to ", name);
    env.set(name, makeFunction(std::move(*fn)));
  } else {
    std::string resolved = parseConcat(valueRaw, env, tracer_);
    tracer_.log("Assigned ", name, " = ", resolved);
    env.set(name, makeText(std::move(resolved)));
  }
}

void Interpreter::evalPrint(const Statement& stmt, Environment& env) {
  std::string raw;
  for (const auto& arg : stmt.args) {
    raw += arg;
  }
  out_ << parseConcat(raw, env, tracer_) << std::endl;
}

void Interpreter::evalConditional(const Statement& stmt, Environment& env) {
  std::string raw;
  for (const auto& arg : stmt.args) {
    raw += arg;
  }
  auto clusters = segment(raw);

  auto arrowIndex = findSymbol(clusters, symbols::ARROW);
  if (!arrowIndex) {
    throw GlyphError(ErrorCategory::MalformedConditional,
                     "Missing " + std::string(symbols::ARROW) + " in conditional")
        .setExplanation("A conditional needs ▶️ between its condition and its body.")
        .addSuggestion("Write the condition, then ▶️, then the statements to run",
                       "❓A🟰B▶️🗣️Same");
  }

  std::string condition = trim(join(clusters, 0, *arrowIndex));
  std::string body = trim(join(clusters, *arrowIndex + 1));

  auto conditionClusters = segment(condition);
  auto equalsIndex = findSymbol(conditionClusters, symbols::EQUALS);
  if (!equalsIndex) {
    throw GlyphError(ErrorCategory::MalformedConditional,
                     "Missing " + std::string(symbols::EQUALS) + " in conditional")
        .setExplanation("The condition \"" + condition + "\" does not compare two values.")
        .addSuggestion("Compare two values with 🟰", "❓" + condition + "🟰...▶️" + body);
  }

  std::string lhs = parseConcat(join(conditionClusters, 0, *equalsIndex), env, tracer_);
  std::string rhs = parseConcat(join(conditionClusters, *equalsIndex + 1), env, tracer_);

  tracer_.log("Conditional evaluated: \"", condition, "\" → \"", lhs, " = ", rhs, "\"");

  if (lhs != rhs) {
    tracer_.log("Condition was falsey, skipping block");
    return;
  }

  auto block = createFunction(std::string(symbols::ARROW) + body, tracer_);
  if (block && block->params.empty()) {
    tracer_.log("Executing conditional function block");
    Environment scope(&env);
    runBody(*block, scope, "conditional block");
  }
}

void Interpreter::callFunction(const std::string& line, Environment& env) {
  auto clusters = segment(line);
  const std::string& name = clusters.front();

  // Copied: the body may rebind the name while it runs
  auto fn = functionBinding(env, name);
  if (!fn) {
    throw unresolvedStatement(line, name, env);
  }

  auto args = callArguments(clusters);
  if (fn->params.empty() && !args.empty()) {
    throw GlyphError(ErrorCategory::ArityMismatch,
                     "Function '" + name + "' takes no args but got some")
        .setExplanation("'" + name + "' was defined without parameters but was called with " +
                        std::to_string(args.size()) + " argument(s).")
        .addSuggestion("Call it on its own", name);
  }

  Environment scope(&env);
  for (size_t i = 0; i < fn->params.size(); ++i) {
    scope.define(fn->params[i], makeText(i < args.size() ? args[i] : ""));
  }

  tracer_.log("Invoking function ", name, " ", formatList(fn->body));
  runBody(*fn, scope, "function '" + name + "'");
}

void Interpreter::runBody(const FunctionValue& fn, Environment& scope, const std::string& label) {
  DepthGuard guard(depth_, options_.maxCallDepth);
  try {
    execute(fn.body, scope);
  } catch (GlyphError& e) {
    e.addRelatedInfo("in " + label);
    throw;
  }
}

}  // namespace glyph
