#include "schema_pane.hpp"
#include <ncurses.h>
#include <spdlog/spdlog.h>

std::optional<Action> SchemaPane::handle_key_event(int key) {
  switch (key) {
    case '[': case KEY_LEFT: case 'h': return Action::of(ActionKind::PrevTab);
    case ']': case KEY_RIGHT: case 'l': return Action::of(ActionKind::NextTab);
    default: return scroll_key_action(key);
  }
}

std::optional<Action> SchemaPane::handle_mouse_event(const MouseEvent& ev, int, int) {
  return scroll_mouse_action(ev);
}

bool SchemaPane::build_schema(const NavigationState& s, const std::vector<MediaContent>& contents, int idx,
                              std::vector<HighlightedLine>& lines, Error& err) const {
  lines.clear();
  if (!s.document || idx < 0 || idx >= static_cast<int>(contents.size())) return true;
  const YAML::Node& schema = contents[static_cast<size_t>(idx)].schema;
  if (!schema.IsDefined()) return true;
  return builder_.build(*s.document, schema, lines, err);
}

bool SchemaPane::reload(Error& err) {
  NavigationState s = state_.snapshot();
  std::vector<std::string> tabs;
  int tab = -1;
  std::vector<HighlightedLine> lines;
  if (!load(s, tabs, tab, lines, err)) {
    spdlog::error("{}: rebuild failed: {}", title(), err.message);
    return false;
  }
  tabs_ = std::move(tabs);
  tab_ = tab;
  view_.replace(std::move(lines));
  spdlog::debug("{}: cache rebuilt ({} lines)", title(), view_.lines().size());
  return true;
}

bool SchemaPane::switch_tab(int delta, Error& err) {
  if (tabs_.empty()) return true;
  int n = static_cast<int>(tabs_.size());
  int next = tab_ < 0 ? (delta > 0 ? 0 : n - 1) : ((tab_ + delta) % n + n) % n;
  if (next == tab_) return true;
  NavigationState s = state_.snapshot();
  std::vector<HighlightedLine> lines;
  if (!load_tab(s, next, lines, err)) return false;
  tab_ = next;
  view_.replace(std::move(lines));
  return true;
}

bool SchemaPane::update(const Action& action, std::optional<Action>& follow_up, Error& err) {
  follow_up.reset();
  switch (action.kind) {
    case ActionKind::Update: return reload(err);
    case ActionKind::NextTab: return switch_tab(1, err);
    case ActionKind::PrevTab: return switch_tab(-1, err);
    default: view_.scroll(action.kind); return true;
  }
}

void SchemaPane::draw_tabs(Surface& row) const {
  int col = 0;
  for (size_t i = 0; i < tabs_.size(); ++i) {
    if (i > 0) col += row.draw(0, col, "·", theme_.tab);
    col += row.draw(0, col, " ");
    col += row.draw(0, col, tabs_[i], static_cast<int>(i) == tab_ ? theme_.tab_selected : theme_.tab);
    col += row.draw(0, col, " ");
  }
}

bool SchemaPane::draw(Surface& surface, Error&) {
  if (!tabs_.empty()) {
    Surface inner = surface.inner(1, 1);
    Surface tab_row = inner.sub(Rect{0, 0, 1, inner.cols()});
    draw_tabs(tab_row);
    Surface body = inner.sub(Rect{2, 0, inner.rows() - 2, inner.cols()});
    int used = draw_caption(body);
    Surface list = body.sub(Rect{used, 0, body.rows() - used, body.cols()});
    view_.draw(list);
  }
  draw_frame(surface);
  return true;
}
