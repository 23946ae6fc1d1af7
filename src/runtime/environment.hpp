// Glyph Programming Language - Environment Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "runtime/value.hpp"

#include <map>
#include <string>

namespace glyph {

// One scope frame. Owns its local bindings and points (non-owning) at the
// enclosing frame. Child frames live on the stack of the call or conditional
// block that created them and must not outlive their parent.
class Environment {
public:
  Environment() = default;
  explicit Environment(Environment* parent)
      : parent_(parent) {}

  Environment(const Environment&) = delete;
  Environment& operator=(const Environment&) = delete;

  // Local frame first, then the parent chain. nullptr when unbound.
  const Value* get(const std::string& name) const;
  bool has(const std::string& name) const;

  // Assignment: mutates the nearest frame that already binds `name`,
  // otherwise binds it in this frame.
  void set(const std::string& name, Value value);

  // Always binds in this frame (parameters shadow outer names)
  void define(const std::string& name, Value value);

  bool hasLocal(const std::string& name) const { return local_.count(name) > 0; }

  // Every visible binding, inner frames overriding outer ones
  std::map<std::string, Value> entries() const;

  void clear() { local_.clear(); }

  Environment* parent() const { return parent_; }

private:
  Environment* owner(const std::string& name);

  std::map<std::string, Value> local_;
  Environment* parent_ = nullptr;
};

}  // namespace glyph
