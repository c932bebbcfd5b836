#include "schema_serializer.hpp"
#include <algorithm>
#include <array>
#include <string_view>
#include <vector>
#include "openapi_document.hpp"
#include "yaml_highlighter.hpp"

static constexpr std::array<std::string_view, 40> kKeywordOrder = {
  "$ref", "title", "type", "format", "description", "enum", "const", "default",
  "nullable", "readOnly", "writeOnly", "deprecated", "required",
  "minimum", "exclusiveMinimum", "maximum", "exclusiveMaximum", "multipleOf",
  "minLength", "maxLength", "pattern", "minItems", "maxItems", "uniqueItems",
  "minProperties", "maxProperties",
  "properties", "patternProperties", "additionalProperties", "items", "prefixItems",
  "allOf", "oneOf", "anyOf", "not", "discriminator", "xml", "externalDocs", "example", "examples",
};

enum class ValueKind { Schema, NamedSchemas, SchemaList, Plain };

static ValueKind value_kind(std::string_view key) {
  if (key == "properties" || key == "patternProperties" || key == "$defs" || key == "definitions") return ValueKind::NamedSchemas;
  if (key == "allOf" || key == "oneOf" || key == "anyOf" || key == "prefixItems") return ValueKind::SchemaList;
  if (key == "items" || key == "additionalProperties" || key == "not" || key == "contains" ||
      key == "if" || key == "then" || key == "else" || key == "propertyNames") return ValueKind::Schema;
  return ValueKind::Plain;
}

static size_t keyword_rank(std::string_view key) {
  auto it = std::find(kKeywordOrder.begin(), kKeywordOrder.end(), key);
  return static_cast<size_t>(it - kKeywordOrder.begin());
}

// Keys only: sorting YAML::Node values would assign through the handles.
static std::vector<std::string> map_keys(const YAML::Node& node) {
  std::vector<std::string> keys;
  for (auto it = node.begin(); it != node.end(); ++it) keys.push_back(it->first.Scalar());
  return keys;
}

// Quoted in the source and read back as something other than a string.
static bool needs_quotes(const YAML::Node& node) {
  if (node.Tag() != "!") return false;
  const std::string& s = node.Scalar();
  if (s.empty() || classify_scalar(s) != TokenKind::String) return true;
  static constexpr std::array<std::string_view, 12> kLegacyBools = {
    "yes", "Yes", "YES", "no", "No", "NO", "on", "On", "ON", "off", "Off", "OFF",
  };
  return std::find(kLegacyBools.begin(), kLegacyBools.end(), s) != kLegacyBools.end();
}

static void emit_plain(YAML::Emitter& e, const YAML::Node& node);
static void emit_schema(YAML::Emitter& e, const YAML::Node& node);

static void emit_scalar(YAML::Emitter& e, const YAML::Node& node) {
  if (node.IsNull() || !node.IsDefined()) { e << YAML::Null; return; }
  if (needs_quotes(node)) e << YAML::DoubleQuoted;
  e << node.Scalar();
}

static bool emit_empty(YAML::Emitter& e, const YAML::Node& node) {
  if (node.IsMap() && node.size() == 0) { e << YAML::Flow << YAML::BeginMap << YAML::EndMap; return true; }
  if (node.IsSequence() && node.size() == 0) { e << YAML::Flow << YAML::BeginSeq << YAML::EndSeq; return true; }
  return false;
}

static void emit_plain(YAML::Emitter& e, const YAML::Node& node) {
  if (emit_empty(e, node)) return;
  if (node.IsMap()) {
    auto keys = map_keys(node);
    std::stable_sort(keys.begin(), keys.end());
    e << YAML::BeginMap;
    for (const auto& k : keys) {
      e << YAML::Key << k << YAML::Value;
      emit_plain(e, node_child(node, k));
    }
    e << YAML::EndMap;
  } else if (node.IsSequence()) {
    e << YAML::BeginSeq;
    for (const auto& item : node) emit_plain(e, item);
    e << YAML::EndSeq;
  } else {
    emit_scalar(e, node);
  }
}

static void emit_schema(YAML::Emitter& e, const YAML::Node& node) {
  if (!node.IsMap() || emit_empty(e, node)) { emit_plain(e, node); return; }
  auto keys = map_keys(node);
  std::stable_sort(keys.begin(), keys.end(), [](const std::string& a, const std::string& b){
    size_t ra = keyword_rank(a), rb = keyword_rank(b);
    if (ra != rb) return ra < rb;
    return ra == kKeywordOrder.size() && a < b;
  });
  e << YAML::BeginMap;
  for (const auto& k : keys) {
    const YAML::Node v = node_child(node, k);
    e << YAML::Key << k << YAML::Value;
    switch (value_kind(k)) {
      case ValueKind::Schema:
        emit_schema(e, v);
        break;
      case ValueKind::NamedSchemas:
        if (!v.IsMap() || emit_empty(e, v)) { emit_plain(e, v); break; }
        e << YAML::BeginMap;
        for (auto it = v.begin(); it != v.end(); ++it) {
          e << YAML::Key << it->first.Scalar() << YAML::Value;
          emit_schema(e, it->second);
        }
        e << YAML::EndMap;
        break;
      case ValueKind::SchemaList:
        if (!v.IsSequence() || emit_empty(e, v)) { emit_plain(e, v); break; }
        e << YAML::BeginSeq;
        for (const auto& item : v) emit_schema(e, item);
        e << YAML::EndSeq;
        break;
      case ValueKind::Plain:
        emit_plain(e, v);
        break;
    }
  }
  e << YAML::EndMap;
}

bool serialize_schema(const YAML::Node& schema, std::string& out, Error& err) {
  YAML::Emitter e;
  e.SetIndent(2);
  e.SetMapFormat(YAML::Block);
  e.SetSeqFormat(YAML::Block);
  e.SetNullFormat(YAML::LowerNull);
  e.SetBoolFormat(YAML::TrueFalseBool);
  emit_schema(e, schema);
  if (!e.good()) return fail(err, ErrorKind::Serialization, "cannot serialize schema: " + e.GetLastError());
  out.assign(e.c_str(), e.size());
  return true;
}
