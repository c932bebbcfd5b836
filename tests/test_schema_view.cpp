#include "headless_terminal.hpp"
#include "highlighted_document.hpp"
#include "schema_view.hpp"
#include <cassert>
#include <random>
#include <string>
#include <vector>

static std::vector<HighlightedLine> make_lines(int n) {
  std::vector<HighlightedLine> lines;
  for (int i = 0; i < n; ++i) {
    lines.push_back(HighlightedLine{StyledFragment{Style{}, gutter_text(i + 1)},
                                    StyledFragment{Style{Color::Blue, AttrNone}, "line" + std::to_string(i + 1)}});
  }
  return lines;
}

static bool cursor_in_bounds(const SchemaView& v) {
  if (v.lines().empty()) return v.cursor() == 0;
  return v.cursor() >= 0 && v.cursor() < static_cast<int>(v.lines().size());
}

static void test_cursor_stops_at_last_line() {
  SchemaView v;
  v.replace(make_lines(4));
  for (int i = 0; i < 5; ++i) v.scroll(ActionKind::Down);
  assert(v.cursor() == 3);
  v.scroll(ActionKind::Up);
  assert(v.cursor() == 2);
  v.scroll(ActionKind::Top);
  assert(v.cursor() == 0);
  v.scroll(ActionKind::Up);
  assert(v.cursor() == 0);
  v.scroll(ActionKind::Bottom);
  assert(v.cursor() == 3);
  v.scroll(ActionKind::PageUp);
  assert(v.cursor() == 0);
}

static void test_cursor_bound_under_random_actions() {
  std::mt19937 rng(7);
  const ActionKind kinds[] = {ActionKind::Up, ActionKind::Down, ActionKind::PageUp, ActionKind::PageDown,
                              ActionKind::Top, ActionKind::Bottom, ActionKind::Tick};
  for (int len = 0; len <= 25; ++len) {
    SchemaView v;
    v.replace(make_lines(len));
    assert(v.cursor() == 0);
    for (int step = 0; step < 200; ++step) {
      v.scroll(kinds[rng() % (sizeof(kinds) / sizeof(kinds[0]))]);
      assert(cursor_in_bounds(v));
    }
    v.replace(make_lines(len / 2));
    assert(v.cursor() == 0);
  }
}

static void test_empty_view_ignores_scrolling() {
  SchemaView v;
  v.scroll(ActionKind::Down);
  v.scroll(ActionKind::PageDown);
  v.scroll(ActionKind::Bottom);
  assert(v.cursor() == 0 && v.empty());
  HeadlessTerminal term(5, 20);
  Surface s(term, Rect{0, 0, 5, 20});
  v.draw(s);
  for (int r = 0; r < 5; ++r) assert(term.row_text(r).empty());
}

static void test_draw_marks_cursor_and_follows_it() {
  SchemaView v;
  v.replace(make_lines(10));
  HeadlessTerminal term(3, 20);
  Surface s(term, Rect{0, 0, 3, 20});
  v.draw(s);
  assert(term.row_text(0) == "→  1   line1");
  assert(term.row_text(1) == "   2   line2");
  assert(term.style_at(0, 7) == (Style{Color::Blue, AttrNone}));

  for (int i = 0; i < 5; ++i) v.scroll(ActionKind::Down);
  term.clear();
  v.draw(s);
  assert(term.row_text(0) == "   4   line4");
  assert(term.row_text(2) == "→  6   line6");
}

static void test_draw_clips_to_width() {
  SchemaView v;
  v.replace(make_lines(1));
  HeadlessTerminal term(2, 30);
  Surface s(term, Rect{1, 2, 1, 8});
  v.draw(s);
  assert(term.row_text(0).empty());
  assert(term.row_text(1) == "  →  1   l");
}

int main() {
  test_cursor_stops_at_last_line();
  test_cursor_bound_under_random_actions();
  test_empty_view_ignores_scrolling();
  test_draw_marks_cursor_and_follows_it();
  test_draw_clips_to_width();
  return 0;
}
