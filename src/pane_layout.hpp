#pragma once
/*
 * PaneLayout
 *
 * Purpose: split tree assigning screen rectangles to panes.
 * A split gives its first child `fixed` cells when fixed > 0, otherwise
 * `ratio` of the available space; the second child takes the rest.
 */
#include <memory>
#include <vector>
#include "types.hpp"

struct PaneRect {
  int pane = 0;
  Rect rect;
};

struct SplitNode {
  enum class Type { Leaf, Vertical, Horizontal };
  Type type = Type::Leaf;
  int pane = 0; // valid when leaf
  std::unique_ptr<SplitNode> a;
  std::unique_ptr<SplitNode> b;
  float ratio = 0.5f; // left/top share for split nodes
  int fixed = 0;
};

std::unique_ptr<SplitNode> make_leaf(int pane);
std::unique_ptr<SplitNode> make_split(SplitNode::Type type, std::unique_ptr<SplitNode> a, std::unique_ptr<SplitNode> b,
                                      float ratio, int fixed = 0);
void collect_layout(const SplitNode& node, const Rect& area, std::vector<PaneRect>& out);
// Index into `rects` of the pane containing (row, col), or -1.
int pane_at(const std::vector<PaneRect>& rects, int row, int col);
