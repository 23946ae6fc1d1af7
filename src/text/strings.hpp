// Glyph Programming Language - String Helpers Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace glyph {

// Strip leading and trailing ASCII whitespace
std::string trim(std::string_view text);

// Split on every occurrence of delimiter. Always yields at least one part,
// empty parts are kept ("a,,b" -> "a", "", "b").
std::vector<std::string> split(std::string_view text, std::string_view delimiter);

bool startsWith(std::string_view text, std::string_view prefix);

// True when every byte of the cluster is ASCII whitespace (and it is non-empty)
bool isWhitespace(std::string_view cluster);

}  // namespace glyph
