#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, styled draw, refresh).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Text is UTF-8; every code point occupies one cell.
 */
#include <string_view>
#include "types.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, std::string_view text, Style style) = 0;
  virtual bool refresh() = 0;
};
