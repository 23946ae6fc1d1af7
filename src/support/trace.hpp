// Glyph Programming Language - Trace Channel Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace glyph {

// Debug trace output. Messages are dropped unless the tracer is enabled;
// callers pass the pieces and the tracer only formats them when enabled.
class Tracer {
public:
  explicit Tracer(std::ostream& out, bool enabled = false)
      : out_(&out)
      , enabled_(enabled) {}

  bool enabled() const { return enabled_; }
  void setEnabled(bool enabled) { enabled_ = enabled; }

  template <typename... Parts>
  void log(const Parts&... parts) const {
    if (!enabled_)
      return;
    std::ostringstream oss;
    (oss << ... << parts);
    write(oss.str());
  }

private:
  void write(const std::string& message) const;

  std::ostream* out_;
  bool enabled_;
};

// Renders a list as [a, b, c] for trace messages
std::string formatList(const std::vector<std::string>& items);

}  // namespace glyph
