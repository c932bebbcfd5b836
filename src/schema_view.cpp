#include "schema_view.hpp"
#include <algorithm>

void SchemaView::replace(std::vector<HighlightedLine> lines) {
  lines_ = std::move(lines);
  cursor_ = 0;
}

void SchemaView::scroll(ActionKind kind) {
  int last = std::max(static_cast<int>(lines_.size()) - 1, 0);
  switch (kind) {
    case ActionKind::Down: cursor_ = std::min(cursor_ + 1, last); break;
    case ActionKind::Up: cursor_ = std::max(cursor_ - 1, 0); break;
    case ActionKind::PageDown: cursor_ = std::min(cursor_ + kPageLines, last); break;
    case ActionKind::PageUp: cursor_ = std::max(cursor_ - kPageLines, 0); break;
    case ActionKind::Top: cursor_ = 0; break;
    case ActionKind::Bottom: cursor_ = last; break;
    default: break;
  }
}

void SchemaView::draw(Surface& surface) const {
  int rows = surface.rows();
  if (rows <= 0 || lines_.empty()) return;
  int top = std::max(0, cursor_ - rows + 1);
  for (int i = 0; i < rows; ++i) {
    int idx = top + i;
    if (idx >= static_cast<int>(lines_.size())) break;
    int col = surface.draw(i, 0, idx == cursor_ ? kMarker : "  ");
    for (const auto& frag : lines_[static_cast<size_t>(idx)]) {
      col += surface.draw(i, col, frag.text, frag.style);
      if (col >= surface.cols()) break;
    }
  }
}
