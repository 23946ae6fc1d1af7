// Glyph Programming Language - Grapheme Segmentation
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "text/grapheme.hpp"

#include <unicode/locid.h>
#include <unicode/utext.h>

#include <algorithm>
#include <stdexcept>

namespace glyph {

GraphemeSegmenter::GraphemeSegmenter() {
  UErrorCode status = U_ZERO_ERROR;
  iterator_.reset(icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
  if (U_FAILURE(status) || !iterator_) {
    throw std::runtime_error(std::string("Could not create grapheme break iterator: ") +
                             u_errorName(status));
  }
}

Graphemes GraphemeSegmenter::segment(std::string_view text) {
  Graphemes clusters;
  if (text.empty()) {
    return clusters;
  }

  UErrorCode status = U_ZERO_ERROR;
  icu::LocalUTextPointer utext(
      utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status));
  if (U_FAILURE(status)) {
    throw std::runtime_error(std::string("Could not open UTF-8 text: ") + u_errorName(status));
  }

  iterator_->setText(utext.getAlias(), status);
  if (U_FAILURE(status)) {
    throw std::runtime_error(std::string("Could not segment text: ") + u_errorName(status));
  }

  // UTF-8 UText: boundaries are native (byte) indices
  size_t start = static_cast<size_t>(iterator_->first());
  for (int32_t end = iterator_->next(); end != icu::BreakIterator::DONE;
       end = iterator_->next()) {
    size_t stop = std::min(static_cast<size_t>(end), text.size());
    if (stop > start) {
      clusters.emplace_back(text.substr(start, stop - start));
      start = stop;
    }
  }
  if (start < text.size()) {
    clusters.emplace_back(text.substr(start));
  }

  return clusters;
}

Graphemes segment(std::string_view text) {
  static GraphemeSegmenter segmenter;
  return segmenter.segment(text);
}

std::string join(const Graphemes& clusters, size_t begin, size_t end) {
  std::string result;
  end = std::min(end, clusters.size());
  for (size_t i = begin; i < end; ++i) {
    result += clusters[i];
  }
  return result;
}

std::optional<size_t> findSymbol(const Graphemes& clusters, std::string_view token, size_t from) {
  for (size_t i = from; i < clusters.size(); ++i) {
    if (clusters[i] == token) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace glyph
