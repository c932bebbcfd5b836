#include "yaml_highlighter.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::vector<Token> lex(YamlLexer& lx, const std::string& line) {
  std::vector<Token> out;
  Error err;
  bool ok = lx.tokenize(line, out, err);
  assert(ok);
  return out;
}

static bool kinds_are(const std::vector<Token>& t, const std::vector<TokenKind>& k) {
  if (t.size() != k.size()) return false;
  for (size_t i = 0; i < t.size(); ++i) if (t[i].kind != k[i]) return false;
  return true;
}

static void test_key_value() {
  YamlLexer lx;
  auto t = lex(lx, "  name: Rex");
  assert(kinds_are(t, {TokenKind::Indent, TokenKind::Key, TokenKind::Colon, TokenKind::Text, TokenKind::String}));
  assert(t[0].text == "  ");
  assert(t[1].text == "name");
  assert(t[4].text == "Rex");

  t = lex(lx, "properties:");
  assert(kinds_are(t, {TokenKind::Key, TokenKind::Colon}));

  t = lex(lx, "url: http://example.com/a");
  assert(t.back().kind == TokenKind::String && t.back().text == "http://example.com/a");
}

static void test_sequence_items() {
  YamlLexer lx;
  auto t = lex(lx, "- type: string");
  assert(kinds_are(t, {TokenKind::Dash, TokenKind::Text, TokenKind::Key, TokenKind::Colon, TokenKind::Text,
                       TokenKind::String}));
  t = lex(lx, "    - 42");
  assert(kinds_are(t, {TokenKind::Indent, TokenKind::Dash, TokenKind::Text, TokenKind::Number}));
}

static void test_scalar_kinds() {
  YamlLexer lx;
  assert(lex(lx, "minimum: 3").back().kind == TokenKind::Number);
  assert(lex(lx, "nullable: true").back().kind == TokenKind::Bool);
  assert(lex(lx, "default: null").back().kind == TokenKind::Null);
  assert(lex(lx, "pattern: \"^a: b$\"").back().kind == TokenKind::String);
  assert(classify_scalar("-3.5") == TokenKind::Number);
  assert(classify_scalar("1e10") == TokenKind::Number);
  assert(classify_scalar("0x1F") == TokenKind::Number);
  assert(classify_scalar("1.2.0") == TokenKind::String);
  assert(classify_scalar("e10") == TokenKind::String);
  assert(classify_scalar("~") == TokenKind::Null);
  assert(classify_scalar("False") == TokenKind::Bool);
}

static void test_ref_and_flow() {
  YamlLexer lx;
  auto t = lex(lx, "$ref: '#/components/schemas/Pet'");
  assert(kinds_are(t, {TokenKind::RefKey, TokenKind::Colon, TokenKind::Text, TokenKind::RefValue}));
  assert(t[3].text == "'#/components/schemas/Pet'");

  t = lex(lx, "enum: []");
  assert(kinds_are(t, {TokenKind::Key, TokenKind::Colon, TokenKind::Text, TokenKind::Punctuation,
                       TokenKind::Punctuation}));

  t = lex(lx, "required: [id, name]");
  assert(t[3].kind == TokenKind::Punctuation && t[4].kind == TokenKind::String && t[4].text == "id");

  t = lex(lx, "\"200\": ok # trailing");
  assert(t[0].kind == TokenKind::Key && t[0].text == "\"200\"");
  assert(t.back().kind == TokenKind::Comment && t.back().text == "# trailing");
}

static void test_block_scalar() {
  YamlLexer lx;
  auto t = lex(lx, "description: |");
  assert(t.back().kind == TokenKind::BlockIndicator);
  t = lex(lx, "  first: line");
  assert(kinds_are(t, {TokenKind::Indent, TokenKind::BlockText}));
  assert(t[1].text == "first: line");
  t = lex(lx, "");
  assert(t.empty());
  t = lex(lx, "  - second");
  assert(kinds_are(t, {TokenKind::Indent, TokenKind::BlockText}));
  t = lex(lx, "type: string");
  assert(kinds_are(t, {TokenKind::Key, TokenKind::Colon, TokenKind::Text, TokenKind::String}));
}

static void test_control_character_is_error() {
  YamlLexer lx;
  std::vector<Token> out;
  Error err;
  assert(lx.tokenize("a: b", out, err));
  assert(!lx.tokenize(std::string("x: \x01"), out, err));
  assert(err.kind == ErrorKind::Highlight);
  assert(err.message == "control character 0x01 at line 2 column 4");
  Error tab;
  assert(lx.tokenize("a:\tb", out, tab));
}

static void test_theme_styles() {
  Theme theme = solarized_dark_theme();
  YamlHighlighter hl(theme);
  HighlightedLine line;
  Error err;
  assert(hl.highlight_line("type: object", line, err));
  assert(line.size() == 4);
  assert(line[0].style == theme.token(TokenKind::Key));
  assert(line[3].style == theme.token(TokenKind::String));
  assert(!(theme.token(TokenKind::Key) == theme.token(TokenKind::String)));

  Theme mono = mono_theme();
  YamlHighlighter plain(mono);
  assert(plain.highlight_line("type: object", line, err));
  assert(line[3].style.fg == Color::Default);
  assert(theme_by_name("mono"));
  assert(!theme_by_name("nope"));
}

int main() {
  test_key_value();
  test_sequence_items();
  test_scalar_kinds();
  test_ref_and_flow();
  test_block_scalar();
  test_control_character_is_error();
  test_theme_styles();
  return 0;
}
