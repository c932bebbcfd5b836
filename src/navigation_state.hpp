#pragma once
/*
 * NavigationState
 *
 * Purpose: the loaded document plus the selected operation, shared by all panes.
 * Access: SharedNavigationState hands out scoped read (shared) or write
 * (exclusive) views; a write replaces the whole value so readers never see a
 * half-updated selection.
 */
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include "openapi_document.hpp"

struct NavigationState {
  std::shared_ptr<const OpenApiDocument> document;
  std::optional<int> selected;

  // Selected operation, nullptr when nothing (valid) is selected.
  const Operation* active_operation() const;
  NavigationState with_selection(std::optional<int> idx) const;
  bool operator==(const NavigationState& o) const { return document == o.document && selected == o.selected; }
};

class SharedNavigationState {
public:
  class ReadView {
  public:
    ReadView(const NavigationState& s, std::shared_mutex& m) : lock_(m), state_(s) {}
    const NavigationState& operator*() const { return state_; }
    const NavigationState* operator->() const { return &state_; }
  private:
    std::shared_lock<std::shared_mutex> lock_;
    const NavigationState& state_;
  };

  class WriteView {
  public:
    WriteView(NavigationState& s, std::shared_mutex& m) : lock_(m), state_(s) {}
    const NavigationState& current() const { return state_; }
    void replace(NavigationState next) { state_ = std::move(next); }
  private:
    std::unique_lock<std::shared_mutex> lock_;
    NavigationState& state_;
  };

  explicit SharedNavigationState(NavigationState initial = {}) : state_(std::move(initial)) {}
  SharedNavigationState(const SharedNavigationState&) = delete;
  SharedNavigationState& operator=(const SharedNavigationState&) = delete;

  ReadView read() const { return ReadView(state_, mutex_); }
  WriteView write() { return WriteView(state_, mutex_); }
  NavigationState snapshot() const { return *read(); }
  void replace(NavigationState next) { write().replace(std::move(next)); }

private:
  mutable std::shared_mutex mutex_;
  NavigationState state_;
};
