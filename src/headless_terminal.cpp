#include "headless_terminal.hpp"
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  clear();
}

void HeadlessTerminal::clear() {
  cells_.assign(static_cast<size_t>(rows_ * cols_), " ");
  styles_.assign(static_cast<size_t>(rows_ * cols_), Style{});
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
}

void HeadlessTerminal::draw_text(int row, int col, std::string_view text, Style style) {
  if (row < 0 || row >= rows_) return;
  for (auto& cp : utf8_split(text)) {
    if (col >= cols_) break;
    if (col >= 0) {
      size_t idx = static_cast<size_t>(row * cols_ + col);
      cells_[idx] = cp;
      styles_[idx] = style;
    }
    col++;
  }
}

const std::string& HeadlessTerminal::cell(int row, int col) const {
  return cells_[static_cast<size_t>(row * cols_ + col)];
}

Style HeadlessTerminal::style_at(int row, int col) const {
  return styles_[static_cast<size_t>(row * cols_ + col)];
}

std::string HeadlessTerminal::row_text(int row, int col, int width) const {
  std::string s;
  for (int c = col; c < col + width && c < cols_; ++c) s += cell(row, c);
  return s;
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string s = row_text(row, 0, cols_);
  size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}
