#include "action.hpp"

std::string_view action_name(ActionKind kind) {
  switch (kind) {
    case ActionKind::Tick: return "Tick";
    case ActionKind::Resize: return "Resize";
    case ActionKind::Quit: return "Quit";
    case ActionKind::FocusNext: return "FocusNext";
    case ActionKind::FocusPrev: return "FocusPrev";
    case ActionKind::Focus: return "Focus";
    case ActionKind::Up: return "Up";
    case ActionKind::Down: return "Down";
    case ActionKind::PageUp: return "PageUp";
    case ActionKind::PageDown: return "PageDown";
    case ActionKind::Top: return "Top";
    case ActionKind::Bottom: return "Bottom";
    case ActionKind::Select: return "Select";
    case ActionKind::Submit: return "Submit";
    case ActionKind::NextTab: return "NextTab";
    case ActionKind::PrevTab: return "PrevTab";
    case ActionKind::Update: return "Update";
  }
  return "?";
}
