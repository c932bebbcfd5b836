#include "navigation_pane.hpp"
#include <algorithm>
#include <limits>
#include <ncurses.h>
#include <spdlog/spdlog.h>
#include "schema_view.hpp"

static constexpr int kMethodWidth = 7;

bool NavigationPane::init(Error&) {
  auto w = state_.write();
  const NavigationState& cur = w.current();
  if (!cur.selected && cur.document && !cur.document->operations().empty()) {
    w.replace(cur.with_selection(0));
  }
  return true;
}

std::optional<Action> NavigationPane::handle_key_event(int key) {
  if (key == '\n' || key == '\r' || key == KEY_ENTER) return Action::of(ActionKind::Submit);
  return scroll_key_action(key);
}

std::optional<Action> NavigationPane::handle_mouse_event(const MouseEvent& ev, int row, int) {
  if (ev.button == MouseButton::Left) {
    int list_row = row - 1;
    if (list_row < 0 || list_row >= list_rows_) return std::nullopt;
    std::optional<int> sel = state_.read()->selected;
    return Action::of(ActionKind::Select, top_for(sel.value_or(0), list_rows_) + list_row);
  }
  return scroll_mouse_action(ev);
}

int NavigationPane::top_for(int selected, int rows) const {
  return rows <= 0 ? 0 : std::max(0, selected - rows + 1);
}

bool NavigationPane::select(int idx, std::optional<Action>& follow_up) {
  auto w = state_.write();
  const NavigationState& cur = w.current();
  if (!cur.document || cur.document->operations().empty()) return false;
  int last = static_cast<int>(cur.document->operations().size()) - 1;
  idx = std::clamp(idx, 0, last);
  if (cur.selected && *cur.selected == idx) return false;
  w.replace(cur.with_selection(idx));
  const Operation* op = cur.document->operation(idx);
  spdlog::debug("selected {} {}", op->method, op->path);
  follow_up = Action::of(ActionKind::Update);
  return true;
}

bool NavigationPane::update(const Action& action, std::optional<Action>& follow_up, Error&) {
  follow_up.reset();
  int sel = state_.read()->selected.value_or(-1);
  switch (action.kind) {
    case ActionKind::Down: select(sel < 0 ? 0 : sel + 1, follow_up); break;
    case ActionKind::Up: select(sel < 0 ? 0 : sel - 1, follow_up); break;
    case ActionKind::PageDown: select(std::max(sel, 0) + SchemaView::kPageLines, follow_up); break;
    case ActionKind::PageUp: select(sel - SchemaView::kPageLines, follow_up); break;
    case ActionKind::Top: select(0, follow_up); break;
    case ActionKind::Bottom: select(std::numeric_limits<int>::max(), follow_up); break;
    case ActionKind::Select: select(action.arg, follow_up); break;
    case ActionKind::Submit: follow_up = Action::of(ActionKind::Update); break;
    default: break;
  }
  return true;
}

bool NavigationPane::draw(Surface& surface, Error&) {
  draw_frame(surface);
  Surface list = surface.inner(1, 1);
  list_rows_ = list.rows();
  auto view = state_.read();
  if (!view->document) return true;
  const auto& ops = view->document->operations();
  if (ops.empty()) {
    list.draw(0, 0, "no operations", theme_.muted);
    return true;
  }
  int sel = view->selected.value_or(-1);
  int top = top_for(std::max(sel, 0), list.rows());
  for (int i = 0; i < list.rows(); ++i) {
    int idx = top + i;
    if (idx >= static_cast<int>(ops.size())) break;
    const Operation& op = ops[static_cast<size_t>(idx)];
    int col = list.draw(i, 0, idx == sel ? SchemaView::kMarker : "  ");
    std::string method = op.method;
    method.resize(static_cast<size_t>(std::max<int>(kMethodWidth, static_cast<int>(method.size()))), ' ');
    col += list.draw(i, col, method, method_style(op.method));
    Style path_style = op.deprecated ? theme_.muted : Style{};
    if (idx == sel) path_style.attrs |= AttrBold;
    list.draw(i, col, op.path, path_style);
  }
  return true;
}
