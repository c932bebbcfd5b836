#include "theme.hpp"

Theme solarized_dark_theme() {
  Theme t;
  t.name = "solarized-dark";
  t.token(TokenKind::Dash) = {Color::Default, AttrDim};
  t.token(TokenKind::Key) = {Color::Blue, AttrNone};
  t.token(TokenKind::RefKey) = {Color::Magenta, AttrBold};
  t.token(TokenKind::Colon) = {Color::Default, AttrDim};
  t.token(TokenKind::Punctuation) = {Color::Default, AttrDim};
  t.token(TokenKind::String) = {Color::Cyan, AttrNone};
  t.token(TokenKind::Number) = {Color::Magenta, AttrNone};
  t.token(TokenKind::Bool) = {Color::Yellow, AttrNone};
  t.token(TokenKind::Null) = {Color::Yellow, AttrDim};
  t.token(TokenKind::RefValue) = {Color::Green, AttrUnderline};
  t.token(TokenKind::Comment) = {Color::Default, AttrDim};
  t.token(TokenKind::BlockIndicator) = {Color::Yellow, AttrNone};
  t.token(TokenKind::BlockText) = {Color::Cyan, AttrNone};
  return t;
}

Theme mono_theme() {
  Theme t;
  t.name = "mono";
  t.token(TokenKind::Key) = {Color::Default, AttrBold};
  t.token(TokenKind::RefKey) = {Color::Default, AttrBold | AttrUnderline};
  t.token(TokenKind::RefValue) = {Color::Default, AttrUnderline};
  t.token(TokenKind::Comment) = {Color::Default, AttrDim};
  t.focused_border = {Color::Default, AttrBold};
  t.tab_selected = {Color::Default, AttrBold | AttrUnderline};
  return t;
}

std::optional<Theme> theme_by_name(const std::string& name) {
  if (name == "solarized-dark" || name == "solarized") return solarized_dark_theme();
  if (name == "mono" || name == "monochrome") return mono_theme();
  return std::nullopt;
}

Style method_style(const std::string& method) {
  if (method == "GET") return {Color::Green, AttrBold};
  if (method == "POST") return {Color::Yellow, AttrBold};
  if (method == "PUT") return {Color::Blue, AttrBold};
  if (method == "PATCH") return {Color::Magenta, AttrBold};
  if (method == "DELETE") return {Color::Red, AttrBold};
  return {Color::Cyan, AttrBold};
}
