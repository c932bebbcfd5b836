#pragma once
/*
 * HighlightedDocumentBuilder
 *
 * Purpose: resolved schema -> ordered highlighted lines with a line-number gutter.
 * Pipeline: resolve $refs, serialize to canonical YAML, lex + theme each line,
 * prepend " N   " gutter. Any stage failure leaves `out` untouched.
 * Pure: equal inputs produce equal output.
 */
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "openapi_document.hpp"
#include "theme.hpp"
#include "types.hpp"
#include "yaml_highlighter.hpp"

class HighlightedDocumentBuilder {
public:
  static constexpr int kGutterDigits = 3;

  explicit HighlightedDocumentBuilder(Theme theme) : theme_(std::move(theme)) {}
  bool build(const OpenApiDocument& doc, const YAML::Node& schema, std::vector<HighlightedLine>& out, Error& err) const;
  bool highlight_text(const std::string& text, std::vector<HighlightedLine>& out, Error& err) const;

private:
  Theme theme_;
};

std::string gutter_text(int line_number);
std::string line_text(const HighlightedLine& line);
