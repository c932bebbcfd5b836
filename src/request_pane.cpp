#include "request_pane.hpp"

bool RequestPane::load(const NavigationState& s, std::vector<std::string>& tabs, int& tab,
                       std::vector<HighlightedLine>& lines, Error& err) {
  const Operation* op = s.active_operation();
  if (!op) { caption_.clear(); return true; }
  RequestBodyInfo body;
  if (!request_body_info(*s.document, *op, body, err)) return false;
  for (const auto& c : body.contents) tabs.push_back(c.media_type);
  tab = json_content_index(body.contents);
  if (!build_schema(s, body.contents, tab, lines, err)) return false;
  caption_ = body.description;
  if (body.required) caption_ = caption_.empty() ? "required" : "required · " + caption_;
  return true;
}

bool RequestPane::load_tab(const NavigationState& s, int tab, std::vector<HighlightedLine>& lines, Error& err) {
  const Operation* op = s.active_operation();
  if (!op) { lines.clear(); return true; }
  RequestBodyInfo body;
  if (!request_body_info(*s.document, *op, body, err)) return false;
  return build_schema(s, body.contents, tab, lines, err);
}

int RequestPane::draw_caption(Surface& body) const {
  if (caption_.empty() || body.rows() < 2) return 0;
  body.draw(0, 0, caption_, theme_.muted);
  return 1;
}
