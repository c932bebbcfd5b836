#include "address_pane.hpp"

bool AddressPane::update(const Action& action, std::optional<Action>& follow_up, Error&) {
  follow_up.reset();
  if (action.kind != ActionKind::Update) return true;
  auto view = state_.read();
  const Operation* op = view->active_operation();
  method_.clear();
  path_.clear();
  detail_.clear();
  description_.clear();
  deprecated_ = false;
  if (!op) return true;
  method_ = op->method;
  path_ = op->path;
  deprecated_ = op->deprecated;
  if (!op->operation_id.empty()) detail_ = op->operation_id;
  if (!op->summary.empty()) detail_ += (detail_.empty() ? "" : " · ") + op->summary;
  description_ = op->description.substr(0, op->description.find('\n'));
  if (!description_.empty()) detail_ += (detail_.empty() ? "" : " · ") + description_;
  if (!op->tags.empty()) {
    std::string tags;
    for (const auto& t : op->tags) tags += (tags.empty() ? "#" : " #") + t;
    detail_ += (detail_.empty() ? "" : "  ") + tags;
  }
  return true;
}

bool AddressPane::draw(Surface& surface, Error&) {
  draw_frame(surface);
  if (method_.empty()) return true;
  Surface inner = surface.inner(1, 1);
  int col = inner.draw(0, 1, method_, method_style(method_));
  inner.draw(0, col + 2, path_, Style{Color::Default, AttrBold});
  Style detail_style = theme_.muted;
  std::string detail = deprecated_ ? "[deprecated] " + detail_ : detail_;
  inner.draw(1, 1, detail, detail_style);
  return true;
}
