#pragma once
/*
 * Surface
 *
 * Purpose: clipped drawing into one pane's area of an ITerminal.
 * Coordinates passed to draw/fill are relative to the area; anything outside
 * the area is dropped rather than wrapped.
 */
#include <string_view>
#include "iterminal.hpp"
#include "types.hpp"

class Surface {
public:
  Surface(ITerminal& term, Rect area) : term_(term), area_(area) {}
  int rows() const { return area_.height; }
  int cols() const { return area_.width; }

  // Returns the number of cells drawn.
  int draw(int row, int col, std::string_view text, Style style = {});
  void fill(int row, int col, int width, std::string_view glyph, Style style = {});
  void box(BorderType type, Style style, std::string_view title = {});
  Surface inner(int vertical, int horizontal) const;
  Surface sub(Rect rel) const;

private:
  ITerminal& term_;
  Rect area_;
};
