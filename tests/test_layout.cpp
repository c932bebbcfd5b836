#include "pane_layout.hpp"
#include <cassert>
#include <vector>

static Rect rect_for_pane(const std::vector<PaneRect>& rs, int pane) {
  for (const auto& r : rs) if (r.pane == pane) return r.rect;
  return Rect{-1, -1, -1, -1};
}

int main() {
  auto leaf = make_leaf(0);
  Rect screen{0, 0, 24, 80};
  std::vector<PaneRect> rs;
  collect_layout(*leaf, screen, rs);
  assert(rs.size() == 1);
  assert(rs[0].rect.width == 80);

  using T = SplitNode::Type;
  auto root = make_split(T::Vertical, make_leaf(0),
                         make_split(T::Horizontal, make_leaf(1),
                                    make_split(T::Horizontal, make_leaf(2), make_leaf(3), 0.5f),
                                    0.5f, 4),
                         1.0f / 3.0f);
  rs.clear();
  collect_layout(*root, screen, rs);
  assert(rs.size() == 4);
  Rect nav = rect_for_pane(rs, 0);
  Rect addr = rect_for_pane(rs, 1);
  Rect req = rect_for_pane(rs, 2);
  Rect resp = rect_for_pane(rs, 3);
  assert(nav.width == 26 && nav.height == 24);
  assert(nav.width + addr.width == 80);
  assert(addr.height == 4 && addr.col == 26);
  assert(req.row == 4 && req.height + resp.height == 20);
  assert(resp.row == req.row + req.height);

  // fixed size never starves the second child
  Rect tiny{0, 0, 3, 80};
  rs.clear();
  collect_layout(*root, tiny, rs);
  assert(rect_for_pane(rs, 1).height == 2);

  rs.clear();
  collect_layout(*root, screen, rs);
  assert(rs[pane_at(rs, 0, 0)].pane == 0);
  assert(rs[pane_at(rs, 2, 30)].pane == 1);
  assert(rs[pane_at(rs, 23, 79)].pane == 3);
  assert(pane_at(rs, 24, 0) == -1);

  // empty area yields nothing
  rs.clear();
  collect_layout(*root, Rect{0, 0, 0, 80}, rs);
  assert(rs.empty());
  return 0;
}
