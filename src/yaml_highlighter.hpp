#pragma once
/*
 * YamlHighlighter
 *
 * Purpose: line-oriented lexer for block-style YAML, mapping tokens to styles
 * through a Theme.
 * State: block scalar bodies ("|" / ">") span lines, so lines must be fed in
 * order; reset() before a new document.
 */
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "theme.hpp"
#include "types.hpp"

struct Token {
  TokenKind kind;
  std::string text;
};

struct StyledFragment {
  Style style;
  std::string text;
  bool operator==(const StyledFragment&) const = default;
};

using HighlightedLine = std::vector<StyledFragment>;

class YamlLexer {
public:
  bool tokenize(std::string_view line, std::vector<Token>& out, Error& err);
  void reset() { block_indent_ = -1; line_no_ = 0; }

private:
  void lex_value(std::string_view rest, bool after_ref_key, std::vector<Token>& out);
  void lex_flow(std::string_view rest, std::vector<Token>& out);
  int block_indent_ = -1;
  int line_no_ = 0;
};

class YamlHighlighter {
public:
  explicit YamlHighlighter(Theme theme) : theme_(std::move(theme)) {}
  bool highlight_line(std::string_view line, HighlightedLine& out, Error& err);
  void reset() { lexer_.reset(); }

private:
  Theme theme_;
  YamlLexer lexer_;
};

TokenKind classify_scalar(std::string_view s);
