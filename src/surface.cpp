#include "surface.hpp"
#include <algorithm>
#include "utf8.hpp"

namespace {
struct BoxGlyphs {
  const char* h; const char* v;
  const char* tl; const char* tr; const char* bl; const char* br;
};
constexpr BoxGlyphs kPlain{"─", "│", "┌", "┐", "└", "┘"};
constexpr BoxGlyphs kThick{"━", "┃", "┏", "┓", "┗", "┛"};
}

int Surface::draw(int row, int col, std::string_view text, Style style) {
  if (row < 0 || row >= area_.height || col >= area_.width) return 0;
  if (col < 0) {
    int skip = -col;
    text = text.substr(utf8_prefix(text, skip).size());
    col = 0;
  }
  std::string_view vis = utf8_prefix(text, area_.width - col);
  if (vis.empty()) return 0;
  term_.draw_text(area_.row + row, area_.col + col, vis, style);
  return utf8_length(vis);
}

void Surface::fill(int row, int col, int width, std::string_view glyph, Style style) {
  for (int i = 0; i < width; ++i) draw(row, col + i, glyph, style);
}

void Surface::box(BorderType type, Style style, std::string_view title) {
  if (area_.height < 2 || area_.width < 2) return;
  const BoxGlyphs& g = type == BorderType::Thick ? kThick : kPlain;
  int last_row = area_.height - 1;
  int last_col = area_.width - 1;
  draw(0, 0, g.tl, style);
  draw(0, last_col, g.tr, style);
  draw(last_row, 0, g.bl, style);
  draw(last_row, last_col, g.br, style);
  fill(0, 1, area_.width - 2, g.h, style);
  fill(last_row, 1, area_.width - 2, g.h, style);
  for (int r = 1; r < last_row; ++r) {
    draw(r, 0, g.v, style);
    draw(r, last_col, g.v, style);
  }
  if (!title.empty() && area_.width > 2) {
    Surface top = sub(Rect{0, 1, 1, area_.width - 2});
    top.draw(0, 0, title, style);
  }
}

Surface Surface::inner(int vertical, int horizontal) const {
  Rect r{area_.row + vertical, area_.col + horizontal,
         std::max(0, area_.height - 2 * vertical), std::max(0, area_.width - 2 * horizontal)};
  return Surface(term_, r);
}

Surface Surface::sub(Rect rel) const {
  int row = std::clamp(rel.row, 0, area_.height);
  int col = std::clamp(rel.col, 0, area_.width);
  Rect r{area_.row + row, area_.col + col,
         std::clamp(rel.height, 0, area_.height - row), std::clamp(rel.width, 0, area_.width - col)};
  return Surface(term_, r);
}
