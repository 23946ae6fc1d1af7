// Glyph Programming Language - Value Resolution
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "runtime/resolver.hpp"

#include "parser/symbols.hpp"
#include "text/grapheme.hpp"
#include "text/strings.hpp"

#include <optional>
#include <vector>

namespace glyph {

namespace {

// Text bound to `name`, or nothing when unbound or bound to a function
std::optional<std::string> textBinding(const std::string& name, const Environment& env) {
  const Value* value = env.get(name);
  if (!value) {
    return std::nullopt;
  }
  return std::visit(overload{[](const TextValue& t) -> std::optional<std::string> { return t.value; },
                             [](const FunctionValue&) -> std::optional<std::string> {
                               return std::nullopt;
                             }},
                    value->data);
}

}  // namespace

std::string resolveValue(const std::string& name, const Environment& env, const Tracer& tracer) {
  std::vector<std::string> trace{name};
  std::optional<std::string> current = textBinding(name, env);
  std::string result = current ? *current : name;

  // A name bound to its own spelling is a fixed point; stop there
  while (current && *current != trace.back() && env.has(*current)) {
    trace.push_back(*current);
    current = textBinding(*current, env);
    if (current) {
      result = *current;
    }
  }

  if (tracer.enabled()) {
    if (trace.size() > 1) {
      std::string chain;
      for (size_t i = 0; i < trace.size(); ++i) {
        if (i > 0)
          chain += " → ";
        chain += trace[i];
      }
      tracer.log("Resolved ", name, " through chain: ", chain, " = ", result);
    } else {
      tracer.log("Resolved ", name, " = ", result);
    }
  }

  return result;
}

std::string parseConcat(std::string_view raw, const Environment& env, const Tracer& tracer) {
  std::string result;
  for (const auto& part : split(raw, symbols::CONCAT)) {
    std::string trimmed = trim(part);
    auto clusters = segment(trimmed);
    std::string resolved = clusters.size() == 1 ? resolveValue(clusters[0], env, tracer) : trimmed;
    tracer.log("Parsed concat part \"", part, "\" → \"", resolved, "\"");
    result += resolved;
  }
  return result;
}

}  // namespace glyph
