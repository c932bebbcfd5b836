#include "pane_layout.hpp"
#include <algorithm>

static int clamp_split(int total, float ratio, int fixed) {
  if (total <= 1) return total;
  int primary = fixed > 0 ? fixed : static_cast<int>(total * ratio);
  primary = std::clamp(primary, 1, total - 1);
  return primary;
}

std::unique_ptr<SplitNode> make_leaf(int pane) {
  auto n = std::make_unique<SplitNode>();
  n->type = SplitNode::Type::Leaf;
  n->pane = pane;
  return n;
}

std::unique_ptr<SplitNode> make_split(SplitNode::Type type, std::unique_ptr<SplitNode> a, std::unique_ptr<SplitNode> b,
                                      float ratio, int fixed) {
  auto n = std::make_unique<SplitNode>();
  n->type = type;
  n->a = std::move(a);
  n->b = std::move(b);
  n->ratio = ratio;
  n->fixed = fixed;
  return n;
}

void collect_layout(const SplitNode& node, const Rect& area, std::vector<PaneRect>& out) {
  if (area.height <= 0 || area.width <= 0) return;
  if (node.type == SplitNode::Type::Leaf) {
    out.push_back(PaneRect{node.pane, area});
    return;
  }
  if (node.type == SplitNode::Type::Vertical) {
    int left_w = clamp_split(area.width, node.ratio, node.fixed);
    Rect left{area.row, area.col, area.height, left_w};
    Rect right{area.row, area.col + left_w, area.height, area.width - left_w};
    if (node.a) collect_layout(*node.a, left, out);
    if (node.b) collect_layout(*node.b, right, out);
  } else {
    int top_h = clamp_split(area.height, node.ratio, node.fixed);
    Rect top{area.row, area.col, top_h, area.width};
    Rect bottom{area.row + top_h, area.col, area.height - top_h, area.width};
    if (node.a) collect_layout(*node.a, top, out);
    if (node.b) collect_layout(*node.b, bottom, out);
  }
}

int pane_at(const std::vector<PaneRect>& rects, int row, int col) {
  for (size_t i = 0; i < rects.size(); ++i) {
    if (rects[i].rect.contains(row, col)) return static_cast<int>(i);
  }
  return -1;
}
