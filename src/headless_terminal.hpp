#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal recording a cell grid, for automated tests and
 * render verification.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, std::string_view text, Style style) override;
  bool refresh() override { refresh_count_++; return !fail_refresh_; }

  void resize(int rows, int cols);
  void set_fail_refresh(bool v) { fail_refresh_ = v; }
  int refresh_count() const { return refresh_count_; }
  const std::string& cell(int row, int col) const;
  Style style_at(int row, int col) const;
  // Row text with trailing blanks removed.
  std::string row_text(int row) const;
  std::string row_text(int row, int col, int width) const;

private:
  int rows_;
  int cols_;
  int refresh_count_ = 0;
  bool fail_refresh_ = false;
  std::vector<std::string> cells_;
  std::vector<Style> styles_;
};
