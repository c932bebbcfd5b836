#include "highlighted_document.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "schema_resolver.hpp"
#include "schema_serializer.hpp"

std::string gutter_text(int line_number) {
  std::string num = std::to_string(line_number);
  std::string pad(static_cast<size_t>(std::max(0, HighlightedDocumentBuilder::kGutterDigits - static_cast<int>(num.size()))), ' ');
  return " " + num + pad + " ";
}

std::string line_text(const HighlightedLine& line) {
  std::string s;
  for (const auto& f : line) s += f.text;
  return s;
}

static std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  size_t st = 0;
  while (st < text.size()) {
    size_t pos = text.find('\n', st);
    if (pos == std::string::npos) { lines.emplace_back(text.substr(st)); break; }
    lines.emplace_back(text.substr(st, pos - st));
    st = pos + 1;
  }
  return lines;
}

bool HighlightedDocumentBuilder::highlight_text(const std::string& text, std::vector<HighlightedLine>& out, Error& err) const {
  YamlHighlighter hl(theme_);
  std::vector<HighlightedLine> lines;
  int n = 0;
  for (const auto& raw : split_lines(text)) {
    HighlightedLine line;
    if (!hl.highlight_line(raw, line, err)) return false;
    line.insert(line.begin(), StyledFragment{theme_.gutter, gutter_text(++n)});
    lines.push_back(std::move(line));
  }
  out = std::move(lines);
  return true;
}

bool HighlightedDocumentBuilder::build(const OpenApiDocument& doc, const YAML::Node& schema,
                                       std::vector<HighlightedLine>& out, Error& err) const {
  YAML::Node resolved;
  SchemaResolver resolver(doc);
  if (!resolver.resolve(schema, resolved, err)) return false;
  std::string text;
  if (!serialize_schema(resolved, text, err)) return false;
  if (!highlight_text(text, out, err)) return false;
  spdlog::debug("highlighted schema: {} lines", out.size());
  return true;
}
