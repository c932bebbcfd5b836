#pragma once
/*
 * Action
 *
 * Purpose: immutable intent routed through the update loop.
 * Routing: Update is broadcast to every pane; controller actions (focus, quit,
 * resize, tick) are consumed by App; everything else goes to the focused pane.
 */
#include <string_view>

enum class ActionKind {
  Tick,
  Resize,
  Quit,
  FocusNext,
  FocusPrev,
  Focus,
  Up,
  Down,
  PageUp,
  PageDown,
  Top,
  Bottom,
  Select,
  Submit,
  NextTab,
  PrevTab,
  Update,
};

struct Action {
  ActionKind kind = ActionKind::Tick;
  int arg = 0;

  static Action of(ActionKind k, int a = 0) { return Action{k, a}; }
  bool operator==(const Action&) const = default;
};

inline bool is_broadcast(const Action& a) { return a.kind == ActionKind::Update; }

inline bool is_controller_action(const Action& a) {
  switch (a.kind) {
    case ActionKind::Tick:
    case ActionKind::Resize:
    case ActionKind::Quit:
    case ActionKind::FocusNext:
    case ActionKind::FocusPrev:
    case ActionKind::Focus:
      return true;
    default:
      return false;
  }
}

std::string_view action_name(ActionKind kind);
