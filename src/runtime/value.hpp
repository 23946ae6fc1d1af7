// Glyph Programming Language - Runtime Values Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <string>
#include <variant>
#include <vector>

namespace glyph {

template <class... Ts>
struct overload : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overload(Ts...) -> overload<Ts...>;

struct TextValue {
  std::string value;
};

// A function literal: fixed parameter list and the statement lines of its body
struct FunctionValue {
  std::vector<std::string> params;
  std::vector<std::string> body;
};

struct Value {
  std::variant<TextValue, FunctionValue> data;
};

inline Value makeText(std::string text) {
  return Value{TextValue{std::move(text)}};
}

inline Value makeFunction(FunctionValue fn) {
  return Value{std::move(fn)};
}

// Display form used by the REPL: text as-is, functions as 🔧params▶️body
std::string valueToString(const Value& value);

}  // namespace glyph
