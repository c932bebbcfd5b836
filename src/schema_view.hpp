#pragma once
/*
 * SchemaView
 *
 * Purpose: render cache (highlighted lines) plus scroll cursor, shared by the
 * request and response panes.
 * Invariant: 0 <= cursor < lines.size() when non-empty, else cursor == 0.
 */
#include <vector>
#include "action.hpp"
#include "surface.hpp"
#include "theme.hpp"
#include "yaml_highlighter.hpp"

class SchemaView {
public:
  static constexpr int kPageLines = 10;
  static constexpr const char* kMarker = "→ ";

  const std::vector<HighlightedLine>& lines() const { return lines_; }
  int cursor() const { return cursor_; }
  bool empty() const { return lines_.empty(); }

  void replace(std::vector<HighlightedLine> lines);
  // Applies Up/Down/PageUp/PageDown/Top/Bottom; other actions are ignored.
  void scroll(ActionKind kind);
  void draw(Surface& surface) const;

private:
  std::vector<HighlightedLine> lines_;
  int cursor_ = 0;
};
