// Glyph Programming Language - Grapheme Segmentation Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <unicode/brkiter.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glyph {

using Graphemes = std::vector<std::string>;

// Splits UTF-8 text into user-perceived characters (extended grapheme
// clusters) with ICU's character break rules. Cluster boundaries are byte
// offsets into the input, so joining the result reproduces the input exactly,
// including malformed UTF-8.
class GraphemeSegmenter {
public:
  GraphemeSegmenter();

  GraphemeSegmenter(const GraphemeSegmenter&) = delete;
  GraphemeSegmenter& operator=(const GraphemeSegmenter&) = delete;

  Graphemes segment(std::string_view text);

private:
  std::unique_ptr<icu::BreakIterator> iterator_;
};

// Segment with the process-wide segmenter
Graphemes segment(std::string_view text);

// Concatenate clusters [begin, end)
std::string join(const Graphemes& clusters, size_t begin = 0, size_t end = std::string::npos);

// Index of the leftmost cluster equal to token, searching from `from`
std::optional<size_t> findSymbol(const Graphemes& clusters, std::string_view token, size_t from = 0);

}  // namespace glyph
