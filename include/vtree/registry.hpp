#pragma once

// Named render routines over a vtree::store, grouped by prefix.

#include <algorithm>
#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vtree.hpp"

namespace vtree {

// A render routine writes into the store's output buffer and reports failure through the
// returned error.
using render_fn = std::function<error(store&)>;

struct template_entry {
  std::string prefix;
  std::string key;
  render_fn render;
};

// Key for a template file: path relative to `root`, separators normalized to '/', extension dropped.
// "src/app/views/users/index.zmpl" under "src/app/views" becomes "users/index".
inline std::string template_key(std::string_view root, std::string_view path) {
  std::string p(path);
  std::string r(root);
  std::replace(p.begin(), p.end(), '\\', '/');
  std::replace(r.begin(), r.end(), '\\', '/');
  while (!r.empty() && r.back() == '/') r.pop_back();

  std::string_view rel(p);
  if (!r.empty() && detail::starts_with(rel, r)) {
    const std::string_view rest = rel.substr(r.size());
    if (rest.empty() || rest.front() == '/') rel = rest;
  }
  while (!rel.empty() && rel.front() == '/') rel.remove_prefix(1);

  const std::size_t slash = rel.rfind('/');
  const std::size_t base = (slash == std::string_view::npos) ? 0 : slash + 1;
  const std::size_t dot = rel.rfind('.');
  // Dotfiles keep their name.
  if (dot != std::string_view::npos && dot > base) rel = rel.substr(0, dot);
  return std::string(rel);
}

class template_registry {
public:
  void add(std::string prefix, std::string key, render_fn fn) {
    entries_.push_back(template_entry{std::move(prefix), std::move(key), std::move(fn)});
  }

  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }

  const std::vector<template_entry>& entries() const noexcept { return entries_; }

  // Keys must be unique within a prefix. Reports the first duplicate as "prefix:key".
  error validate() const {
    std::set<std::pair<std::string_view, std::string_view>> seen;
    for (const auto& t : entries_) {
      if (!seen.emplace(t.prefix, t.key).second) {
        return make_error(error_code::duplicate_template, t.prefix + ":" + t.key);
      }
    }
    return error{};
  }

  const template_entry* find(std::string_view key) const noexcept {
    for (const auto& t : entries_) {
      if (t.key == key) return &t;
    }
    return nullptr;
  }

  const template_entry* find_prefixed(std::string_view prefix, std::string_view key) const noexcept {
    for (const auto& t : entries_) {
      if (t.prefix == prefix && t.key == key) return &t;
    }
    return nullptr;
  }

  // Render `key` against `st` from an empty output buffer and hand back the text.
  result<std::string> render(std::string_view key, store& st) const {
    result<std::string> r;
    const template_entry* t = find(key);
    if (t == nullptr) {
      r.err = make_error(error_code::unknown_reference, key);
      return r;
    }
    st.clear_output();
    r.err = t->render(st);
    if (!r.err) r.val = std::string(st.output());
    return r;
  }

  // Render `key` into the current output with `args` as the overlay, restoring the previous
  // overlay afterwards. The partial's trailing newline is chomped.
  error render_partial(std::string_view key, store& st, object* args) const {
    const template_entry* t = find(key);
    if (t == nullptr) return make_error(error_code::unknown_reference, key);

    overlay_guard guard(st, args);
    error e = t->render(st);
    if (e) return e;
    st.chomp_output_buffer();
    return error{};
  }

private:
  struct overlay_guard {
    overlay_guard(store& st, object* args) : st_(st), saved_(st.partial_data()) { st_.set_partial_data(args); }
    ~overlay_guard() { st_.set_partial_data(saved_); }
    overlay_guard(const overlay_guard&) = delete;
    overlay_guard& operator=(const overlay_guard&) = delete;

    store& st_;
    object* saved_;
  };

  std::vector<template_entry> entries_;
};

} // namespace vtree
