#include "response_pane.hpp"

bool ResponsePane::build_response(const NavigationState& s, const std::vector<ResponseInfo>& responses, int tab,
                                  std::vector<HighlightedLine>& lines, Error& err) {
  if (tab < 0 || tab >= static_cast<int>(responses.size())) {
    lines.clear();
    caption_.clear();
    return true;
  }
  const ResponseInfo& r = responses[static_cast<size_t>(tab)];
  if (!build_schema(s, r.contents, json_content_index(r.contents), lines, err)) return false;
  caption_ = r.description;
  return true;
}

bool ResponsePane::load(const NavigationState& s, std::vector<std::string>& tabs, int& tab,
                        std::vector<HighlightedLine>& lines, Error& err) {
  const Operation* op = s.active_operation();
  if (!op) { caption_.clear(); return true; }
  std::vector<ResponseInfo> responses;
  if (!response_infos(*s.document, *op, responses, err)) return false;
  for (const auto& r : responses) tabs.push_back(r.status);
  tab = responses.empty() ? -1 : 0;
  return build_response(s, responses, tab, lines, err);
}

bool ResponsePane::load_tab(const NavigationState& s, int tab, std::vector<HighlightedLine>& lines, Error& err) {
  const Operation* op = s.active_operation();
  if (!op) { lines.clear(); return true; }
  std::vector<ResponseInfo> responses;
  if (!response_infos(*s.document, *op, responses, err)) return false;
  return build_response(s, responses, tab, lines, err);
}

int ResponsePane::draw_caption(Surface& body) const {
  if (caption_.empty() || body.rows() < 2) return 0;
  body.draw(0, 0, caption_, theme_.muted);
  return 1;
}
