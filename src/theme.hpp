#pragma once
/*
 * Theme
 *
 * Purpose: fixed mapping from YAML token kinds and UI elements to Style.
 * Built-ins: "solarized-dark" (default) and "mono".
 */
#include <array>
#include <optional>
#include <string>
#include "types.hpp"

enum class TokenKind {
  Text,
  Indent,
  Dash,
  Key,
  RefKey,
  Colon,
  Punctuation,
  String,
  Number,
  Bool,
  Null,
  RefValue,
  Comment,
  BlockIndicator,
  BlockText,
  Count,
};

struct Theme {
  std::string name;
  std::array<Style, static_cast<size_t>(TokenKind::Count)> tokens{};
  Style gutter{Color::Default, AttrDim};
  Style focused_border{Color::Cyan, AttrBold};
  Style tab{Color::Default, AttrDim};
  Style tab_selected{Color::White, AttrBold | AttrUnderline};
  Style status{Color::Default, AttrReverse};
  Style muted{Color::Default, AttrDim};

  const Style& token(TokenKind k) const { return tokens[static_cast<size_t>(k)]; }
  Style& token(TokenKind k) { return tokens[static_cast<size_t>(k)]; }
};

Theme solarized_dark_theme();
Theme mono_theme();
std::optional<Theme> theme_by_name(const std::string& name);
Style method_style(const std::string& method);
