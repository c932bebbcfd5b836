#include "pane.hpp"
#include <ncurses.h>

std::optional<Action> scroll_key_action(int key) {
  switch (key) {
    case 'j': case KEY_DOWN: return Action::of(ActionKind::Down);
    case 'k': case KEY_UP: return Action::of(ActionKind::Up);
    case KEY_NPAGE: case 'D' - 64: return Action::of(ActionKind::PageDown);
    case KEY_PPAGE: case 'U' - 64: return Action::of(ActionKind::PageUp);
    case 'g': case KEY_HOME: return Action::of(ActionKind::Top);
    case 'G': case KEY_END: return Action::of(ActionKind::Bottom);
    default: return std::nullopt;
  }
}

std::optional<Action> scroll_mouse_action(const MouseEvent& ev) {
  if (ev.button == MouseButton::WheelUp) return Action::of(ActionKind::Up);
  if (ev.button == MouseButton::WheelDown) return Action::of(ActionKind::Down);
  return std::nullopt;
}
