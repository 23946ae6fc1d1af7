// Glyph Programming Language - Runtime Values
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "runtime/value.hpp"

#include "parser/symbols.hpp"

namespace glyph {

std::string valueToString(const Value& value) {
  return std::visit(overload{[](const TextValue& t) { return t.value; },
                             [](const FunctionValue& f) {
                               std::string res(symbols::FN_MARK);
                               for (const auto& param : f.params) {
                                 res += param;
                               }
                               res += symbols::ARROW;
                               for (size_t i = 0; i < f.body.size(); ++i) {
                                 if (i > 0)
                                   res += symbols::STMT_SEP;
                                 res += f.body[i];
                               }
                               return res;
                             }},
                    value.data);
}

}  // namespace glyph
