// Glyph Programming Language - Environment
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "runtime/environment.hpp"

namespace glyph {

const Value* Environment::get(const std::string& name) const {
  for (const Environment* frame = this; frame; frame = frame->parent_) {
    auto it = frame->local_.find(name);
    if (it != frame->local_.end()) {
      return &it->second;
    }
  }
  return nullptr;
}

bool Environment::has(const std::string& name) const {
  return get(name) != nullptr;
}

Environment* Environment::owner(const std::string& name) {
  for (Environment* frame = this; frame; frame = frame->parent_) {
    if (frame->hasLocal(name)) {
      return frame;
    }
  }
  return nullptr;
}

void Environment::set(const std::string& name, Value value) {
  Environment* target = owner(name);
  if (!target) {
    target = this;
  }
  target->local_[name] = std::move(value);
}

void Environment::define(const std::string& name, Value value) {
  local_[name] = std::move(value);
}

std::map<std::string, Value> Environment::entries() const {
  std::map<std::string, Value> result;
  if (parent_) {
    result = parent_->entries();
  }
  for (const auto& [name, value] : local_) {
    result[name] = value;
  }
  return result;
}

}  // namespace glyph
