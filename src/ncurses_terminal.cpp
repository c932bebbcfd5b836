#include "ncurses_terminal.hpp"
#include <ncurses.h>
#include <string>

static short curses_color(Color c) {
  switch (c) {
    case Color::Black: return COLOR_BLACK;
    case Color::Red: return COLOR_RED;
    case Color::Green: return COLOR_GREEN;
    case Color::Yellow: return COLOR_YELLOW;
    case Color::Blue: return COLOR_BLUE;
    case Color::Magenta: return COLOR_MAGENTA;
    case Color::Cyan: return COLOR_CYAN;
    case Color::White: return COLOR_WHITE;
    case Color::Default: break;
  }
  return -1;
}

// pair n+1 holds Color value n; pair 1 is the default pair
static short pair_for(Color c) { return static_cast<short>(static_cast<int>(c) + 1); }

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    bool default_bg = use_default_colors() == OK;
    for (int c = static_cast<int>(Color::Default); c <= static_cast<int>(Color::White); ++c) {
      short fg = curses_color(static_cast<Color>(c));
      if (!default_bg && fg < 0) fg = COLOR_WHITE;
      init_pair(pair_for(static_cast<Color>(c)), fg, default_bg ? -1 : COLOR_BLACK);
    }
    colors_ = true;
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, std::string_view text, Style style) {
  attr_t a = A_NORMAL;
  if (style.attrs & AttrBold) a |= A_BOLD;
  if (style.attrs & AttrDim) a |= A_DIM;
  if (style.attrs & AttrUnderline) a |= A_UNDERLINE;
  if (style.attrs & AttrReverse) a |= A_REVERSE;
  if (colors_) a |= COLOR_PAIR(pair_for(style.fg));
  attron(a);
  std::string s(text);
  // writing into the bottom-right cell reports ERR although the glyph is drawn
  (void)mvaddnstr(row, col, s.c_str(), static_cast<int>(s.size()));
  attroff(a);
}

bool NcursesTerminal::refresh() { return ::refresh() != ERR; }
