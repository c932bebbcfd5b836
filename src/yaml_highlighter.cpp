#include "yaml_highlighter.hpp"
#include <cctype>
#include <cstdio>

static bool is_blank(std::string_view s) {
  return s.find_first_not_of(' ') == std::string_view::npos;
}

static int indent_of(std::string_view s) {
  size_t n = s.find_first_not_of(' ');
  return n == std::string_view::npos ? static_cast<int>(s.size()) : static_cast<int>(n);
}

// End of a quoted scalar starting at s[0]; npos when unterminated.
static size_t quoted_end(std::string_view s) {
  char q = s[0];
  for (size_t i = 1; i < s.size(); ++i) {
    if (q == '"' && s[i] == '\\') { i++; continue; }
    if (s[i] == q) {
      if (q == '\'' && i + 1 < s.size() && s[i + 1] == '\'') { i++; continue; }
      return i;
    }
  }
  return std::string_view::npos;
}

static bool is_number(std::string_view s) {
  if (s.empty()) return false;
  if (s == ".inf" || s == "-.inf" || s == "+.inf" || s == ".nan" || s == ".NaN") return true;
  size_t i = 0;
  if (s[i] == '-' || s[i] == '+') i++;
  if (s.size() > i + 2 && s[i] == '0' && (s[i + 1] == 'x' || s[i + 1] == 'o')) {
    for (size_t j = i + 2; j < s.size(); ++j) if (!std::isxdigit(static_cast<unsigned char>(s[j]))) return false;
    return true;
  }
  bool digits = false, dot = false, exp = false;
  for (; i < s.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (std::isdigit(c)) { digits = true; continue; }
    if (c == '.' && !dot && !exp) { dot = true; continue; }
    if ((c == 'e' || c == 'E') && digits && !exp) {
      exp = true; digits = false;
      if (i + 1 < s.size() && (s[i + 1] == '-' || s[i + 1] == '+')) i++;
      continue;
    }
    return false;
  }
  return digits;
}

TokenKind classify_scalar(std::string_view s) {
  if (s == "true" || s == "false" || s == "True" || s == "False" || s == "TRUE" || s == "FALSE") return TokenKind::Bool;
  if (s == "null" || s == "Null" || s == "NULL" || s == "~") return TokenKind::Null;
  if (is_number(s)) return TokenKind::Number;
  return TokenKind::String;
}

static bool is_block_indicator(std::string_view s) {
  if (s.empty() || (s[0] != '|' && s[0] != '>')) return false;
  for (size_t i = 1; i < s.size(); ++i) {
    char c = s[i];
    if (c != '-' && c != '+' && !(c >= '1' && c <= '9')) return false;
  }
  return true;
}

static void push(std::vector<Token>& out, TokenKind k, std::string_view text) {
  if (!text.empty()) out.push_back(Token{k, std::string(text)});
}

void YamlLexer::lex_flow(std::string_view rest, std::vector<Token>& out) {
  size_t i = 0;
  while (i < rest.size()) {
    char c = rest[i];
    if (c == '{' || c == '}' || c == '[' || c == ']' || c == ',' || c == ':') {
      push(out, TokenKind::Punctuation, rest.substr(i, 1));
      i++;
    } else if (c == ' ') {
      size_t j = rest.find_first_not_of(' ', i);
      if (j == std::string_view::npos) j = rest.size();
      push(out, TokenKind::Text, rest.substr(i, j - i));
      i = j;
    } else if (c == '"' || c == '\'') {
      size_t e = quoted_end(rest.substr(i));
      size_t len = e == std::string_view::npos ? rest.size() - i : e + 1;
      push(out, TokenKind::String, rest.substr(i, len));
      i += len;
    } else {
      size_t j = rest.find_first_of("{}[],: ", i);
      if (j == std::string_view::npos) j = rest.size();
      std::string_view word = rest.substr(i, j - i);
      push(out, classify_scalar(word), word);
      i = j;
    }
  }
}

void YamlLexer::lex_value(std::string_view rest, bool after_ref_key, std::vector<Token>& out) {
  if (rest.empty()) return;
  if (rest[0] == '"' || rest[0] == '\'') {
    size_t e = quoted_end(rest);
    if (e == std::string_view::npos) { push(out, TokenKind::String, rest); return; }
    push(out, after_ref_key ? TokenKind::RefValue : TokenKind::String, rest.substr(0, e + 1));
    std::string_view tail = rest.substr(e + 1);
    size_t hash = tail.find('#');
    if (hash != std::string_view::npos) {
      push(out, TokenKind::Text, tail.substr(0, hash));
      push(out, TokenKind::Comment, tail.substr(hash));
    } else {
      push(out, TokenKind::Text, tail);
    }
    return;
  }
  if (rest[0] == '{' || rest[0] == '[') { lex_flow(rest, out); return; }
  std::string_view value = rest;
  std::string_view comment;
  size_t hash = rest.find(" #");
  if (hash != std::string_view::npos) {
    value = rest.substr(0, hash);
    comment = rest.substr(hash);
  }
  if (is_block_indicator(value)) {
    push(out, TokenKind::BlockIndicator, value);
    block_indent_ = -2; // resolved by tokenize() once the line's indent is known
  } else if (after_ref_key) {
    push(out, TokenKind::RefValue, value);
  } else {
    push(out, classify_scalar(value), value);
  }
  if (!comment.empty()) {
    push(out, TokenKind::Text, comment.substr(0, 1));
    push(out, TokenKind::Comment, comment.substr(1));
  }
}

bool YamlLexer::tokenize(std::string_view line, std::vector<Token>& out, Error& err) {
  line_no_++;
  out.clear();
  for (size_t i = 0; i < line.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(line[i]);
    if ((c < 0x20 && c != '\t') || c == 0x7f) {
      char buf[96];
      std::snprintf(buf, sizeof(buf), "control character 0x%02x at line %d column %zu", c, line_no_, i + 1);
      return fail(err, ErrorKind::Highlight, buf);
    }
  }
  int indent = indent_of(line);
  if (block_indent_ >= 0) {
    if (is_blank(line) || indent > block_indent_) {
      push(out, TokenKind::Indent, line.substr(0, static_cast<size_t>(indent)));
      push(out, TokenKind::BlockText, line.substr(static_cast<size_t>(indent)));
      return true;
    }
    block_indent_ = -1;
  }
  push(out, TokenKind::Indent, line.substr(0, static_cast<size_t>(indent)));
  std::string_view rest = line.substr(static_cast<size_t>(indent));

  while (!rest.empty() && rest[0] == '-' && (rest.size() == 1 || rest[1] == ' ')) {
    push(out, TokenKind::Dash, rest.substr(0, 1));
    rest.remove_prefix(1);
    size_t sp = rest.find_first_not_of(' ');
    if (sp == std::string_view::npos) sp = rest.size();
    push(out, TokenKind::Text, rest.substr(0, sp));
    rest.remove_prefix(sp);
  }
  if (!rest.empty() && rest[0] == '#') {
    push(out, TokenKind::Comment, rest);
    return true;
  }

  size_t key_end = std::string_view::npos;
  if (!rest.empty() && (rest[0] == '"' || rest[0] == '\'')) {
    size_t e = quoted_end(rest);
    if (e != std::string_view::npos && e + 1 < rest.size() && rest[e + 1] == ':' &&
        (e + 2 == rest.size() || rest[e + 2] == ' ')) {
      key_end = e + 1;
    }
  } else if (!rest.empty() && rest[0] != '{' && rest[0] != '[') {
    size_t colon = rest.find(": ");
    size_t hash = rest.find(" #");
    if (colon != std::string_view::npos && (hash == std::string_view::npos || colon < hash)) key_end = colon;
    else if (rest.back() == ':' && hash == std::string_view::npos) key_end = rest.size() - 1;
  }

  bool after_ref_key = false;
  if (key_end != std::string_view::npos) {
    std::string_view key = rest.substr(0, key_end);
    after_ref_key = key == "$ref" || key == "\"$ref\"" || key == "'$ref'";
    push(out, after_ref_key ? TokenKind::RefKey : TokenKind::Key, key);
    push(out, TokenKind::Colon, rest.substr(key_end, 1));
    rest.remove_prefix(key_end + 1);
    size_t sp = rest.find_first_not_of(' ');
    if (sp == std::string_view::npos) sp = rest.size();
    push(out, TokenKind::Text, rest.substr(0, sp));
    rest.remove_prefix(sp);
  }
  lex_value(rest, after_ref_key, out);
  if (block_indent_ == -2) block_indent_ = indent;
  return true;
}

bool YamlHighlighter::highlight_line(std::string_view line, HighlightedLine& out, Error& err) {
  std::vector<Token> tokens;
  if (!lexer_.tokenize(line, tokens, err)) return false;
  out.clear();
  for (auto& t : tokens) out.push_back(StyledFragment{theme_.token(t.kind), std::move(t.text)});
  return true;
}
