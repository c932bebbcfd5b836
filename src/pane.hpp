#pragma once
/*
 * Pane
 *
 * Purpose: focusable UI region driven by App.
 * Contract: handle_* only translate input into an Action (no state change);
 * update() is the only mutation point and is idempotent for a given Action
 * and NavigationState; draw() only reads the pane's cache.
 * Errors: every fallible step reports through Error& and returns false.
 */
#include <optional>
#include <string>
#include "action.hpp"
#include "input.hpp"
#include "surface.hpp"
#include "theme.hpp"
#include "types.hpp"

class Pane {
public:
  virtual ~Pane() = default;

  virtual const char* title() const = 0;
  virtual bool init(Error& err) { (void)err; return true; }
  virtual void focus() { focused_ = true; }
  virtual void unfocus() { focused_ = false; }
  bool focused() const { return focused_; }

  virtual std::optional<Action> handle_key_event(int key) = 0;
  // `row`/`col` are relative to the pane's area.
  virtual std::optional<Action> handle_mouse_event(const MouseEvent& ev, int row, int col) = 0;
  virtual bool update(const Action& action, std::optional<Action>& follow_up, Error& err) = 0;
  virtual bool draw(Surface& surface, Error& err) = 0;

protected:
  explicit Pane(const Theme& theme) : theme_(theme) {}
  BorderType border_type() const { return focused_ ? BorderType::Thick : BorderType::Plain; }
  Style border_style() const { return focused_ ? theme_.focused_border : Style{}; }
  void draw_frame(Surface& surface) const { surface.box(border_type(), border_style(), title()); }

  const Theme& theme_;
  bool focused_ = false;
};

// Up/Down/PageUp/PageDown/Home/End keys shared by the scrollable panes.
std::optional<Action> scroll_key_action(int key);
std::optional<Action> scroll_mouse_action(const MouseEvent& ev);
