#include "schema_resolver.hpp"
#include <cassert>
#include <string>

static std::shared_ptr<const OpenApiDocument> load(const std::string& components) {
  std::shared_ptr<const OpenApiDocument> doc;
  Error err;
  bool ok = OpenApiDocument::from_string("openapi: 3.1.0\ncomponents:\n  schemas:\n" + components, doc, err);
  assert(ok);
  return doc;
}

static YAML::Node ref_to(const std::string& name) {
  YAML::Node n(YAML::NodeType::Map);
  n.force_insert(std::string("$ref"), "#/components/schemas/" + name);
  return n;
}

static const char* kSchemas =
  "    Pet:\n"
  "      type: object\n"
  "      properties:\n"
  "        tag:\n"
  "          $ref: '#/components/schemas/Tag'\n"
  "        tags:\n"
  "          type: array\n"
  "          items:\n"
  "            $ref: '#/components/schemas/Tag'\n"
  "    Tag:\n"
  "      type: object\n"
  "      properties:\n"
  "        label:\n"
  "          type: string\n"
  "    Node:\n"
  "      type: object\n"
  "      properties:\n"
  "        children:\n"
  "          type: array\n"
  "          items:\n"
  "            $ref: '#/components/schemas/Node'\n"
  "    Alias:\n"
  "      $ref: '#/components/schemas/Tag'\n"
  "    LoopA:\n"
  "      $ref: '#/components/schemas/LoopB'\n"
  "    LoopB:\n"
  "      $ref: '#/components/schemas/LoopA'\n"
  "    Broken:\n"
  "      properties:\n"
  "        x:\n"
  "          $ref: '#/components/schemas/Missing'\n"
  "    Remote:\n"
  "      $ref: 'other.yaml#/Pet'\n";

static void test_nested_refs_are_expanded() {
  auto doc = load(kSchemas);
  SchemaResolver r(*doc);
  YAML::Node out;
  Error err;
  assert(r.resolve(ref_to("Pet"), out, err));
  const YAML::Node props = node_child(out, "properties");
  const YAML::Node tag = node_child(props, "tag");
  assert(!is_ref_object(tag));
  assert(scalar_or(node_child(tag, "type")) == "object");
  const YAML::Node items = node_child(node_child(props, "tags"), "items");
  assert(scalar_or(node_child(node_child(node_child(items, "properties"), "label"), "type")) == "string");

  // the document itself still holds the $ref
  YAML::Node raw;
  assert(doc->resolve("#/components/schemas/Pet/properties/tag", raw, err));
  assert(is_ref_object(raw));
}

static void test_alias_is_followed() {
  auto doc = load(kSchemas);
  SchemaResolver r(*doc);
  YAML::Node out;
  Error err;
  assert(r.resolve(ref_to("Alias"), out, err));
  assert(scalar_or(node_child(out, "type")) == "object");
}

static void test_recursive_schema_keeps_inner_ref() {
  auto doc = load(kSchemas);
  SchemaResolver r(*doc);
  YAML::Node out;
  Error err;
  assert(r.resolve(ref_to("Node"), out, err));
  const YAML::Node items = node_child(node_child(node_child(out, "properties"), "children"), "items");
  assert(is_ref_object(items));
  assert(scalar_or(node_child(items, "$ref")) == "#/components/schemas/Node");
}

static void test_alias_cycle_is_error() {
  auto doc = load(kSchemas);
  SchemaResolver r(*doc);
  YAML::Node out;
  Error err;
  assert(!r.resolve(ref_to("LoopA"), out, err));
  assert(err.kind == ErrorKind::ReferenceResolution);
  assert(err.message.find("cyclic reference") != std::string::npos);
}

static void test_missing_and_external_refs() {
  auto doc = load(kSchemas);
  SchemaResolver r(*doc);
  YAML::Node out;
  Error err;
  assert(!r.resolve(ref_to("Broken"), out, err));
  assert(err.kind == ErrorKind::ReferenceResolution);
  assert(err.message.find("#/components/schemas/Missing") != std::string::npos);

  Error ext;
  assert(!r.resolve(ref_to("Remote"), out, ext));
  assert(ext.kind == ErrorKind::ReferenceResolution);
}

static void test_sibling_keys_override_target() {
  auto doc = load(kSchemas);
  SchemaResolver r(*doc);
  YAML::Node schema = ref_to("Tag");
  schema.force_insert(std::string("description"), std::string("override"));
  YAML::Node out;
  Error err;
  assert(r.resolve(schema, out, err));
  assert(scalar_or(node_child(out, "description")) == "override");
  assert(scalar_or(node_child(out, "type")) == "object");
  assert(!node_child(out, "$ref").IsDefined());
}

static std::string chain(int n) {
  std::string s;
  for (int i = 0; i < n; ++i) {
    s += "    S" + std::to_string(i) + ":\n      type: object\n";
    if (i + 1 < n) {
      s += "      properties:\n        next:\n          $ref: '#/components/schemas/S" + std::to_string(i + 1) + "'\n";
    }
  }
  return s;
}

static void test_depth_limit() {
  auto shallow = load(chain(SchemaResolver::kMaxDepth));
  SchemaResolver ok(*shallow);
  YAML::Node out;
  Error err;
  assert(ok.resolve(ref_to("S0"), out, err));

  auto deep = load(chain(SchemaResolver::kMaxDepth + 8));
  SchemaResolver r(*deep);
  Error derr;
  assert(!r.resolve(ref_to("S0"), out, derr));
  assert(derr.kind == ErrorKind::ReferenceResolution);
  assert(derr.message.find("deeper than 32") != std::string::npos);
}

static std::string fan_out(int n) {
  std::string s;
  for (int i = 0; i < n; ++i) {
    s += "    F" + std::to_string(i) + ":\n      type: object\n";
    if (i + 1 < n) {
      std::string next = "'#/components/schemas/F" + std::to_string(i + 1) + "'";
      s += "      properties:\n        a:\n          $ref: " + next + "\n        b:\n          $ref: " + next + "\n";
    }
  }
  return s;
}

static void test_shared_refs_expand_once() {
  // 2^24 paths if every reference were expanded separately
  const int n = 25;
  auto doc = load(fan_out(n));
  SchemaResolver r(*doc);
  YAML::Node out;
  Error err;
  assert(r.resolve(ref_to("F0"), out, err));
  YAML::Node cur(out);
  for (int i = 0; i + 1 < n; ++i) {
    YAML::Node next = node_child(node_child(cur, "properties"), i % 2 ? "a" : "b");
    assert(next.IsMap());
    assert(!is_ref_object(next));
    cur.reset(next);
  }
  assert(scalar_or(node_child(cur, "type")) == "object");
  assert(!node_child(cur, "properties").IsDefined());
}

static void test_shared_ref_still_honors_depth_limit() {
  std::string s = "    Top:\n      properties:\n"
                  "        shallow:\n          $ref: '#/components/schemas/T0'\n"
                  "        deep:\n          $ref: '#/components/schemas/D0'\n";
  for (int i = 0; i < 10; ++i) {
    s += "    T" + std::to_string(i) + ":\n      type: object\n";
    if (i + 1 < 10) s += "      properties:\n        next:\n          $ref: '#/components/schemas/T" + std::to_string(i + 1) + "'\n";
  }
  for (int i = 0; i < 25; ++i) {
    std::string next = i + 1 < 25 ? "D" + std::to_string(i + 1) : "T0";
    s += "    D" + std::to_string(i) + ":\n      properties:\n        next:\n          $ref: '#/components/schemas/" + next + "'\n";
  }
  auto doc = load(s);
  SchemaResolver r(*doc);
  YAML::Node out;
  Error err;
  assert(!r.resolve(ref_to("Top"), out, err));
  assert(err.kind == ErrorKind::ReferenceResolution);
  assert(err.message.find("deeper than 32") != std::string::npos);

  // the same resolver starts over on the next call
  Error ok;
  assert(r.resolve(ref_to("T0"), out, ok));
}

static void test_recursive_schema_is_not_shared() {
  auto doc = load(std::string(kSchemas) +
    "    Forest:\n      properties:\n"
    "        left:\n          $ref: '#/components/schemas/Node'\n"
    "        right:\n          $ref: '#/components/schemas/Node'\n");
  SchemaResolver r(*doc);
  YAML::Node out;
  Error err;
  assert(r.resolve(ref_to("Forest"), out, err));
  for (const char* side : {"left", "right"}) {
    const YAML::Node tree = node_child(node_child(out, "properties"), side);
    assert(scalar_or(node_child(tree, "type")) == "object");
    const YAML::Node items = node_child(node_child(node_child(tree, "properties"), "children"), "items");
    assert(is_ref_object(items));
  }
}

static void test_quoted_scalars_keep_their_tag() {
  auto doc = load(kSchemas);
  SchemaResolver r(*doc);
  YAML::Node schema = YAML::Load("{type: string, example: \"123\", default: 7}");
  YAML::Node out;
  Error err;
  assert(r.resolve(schema, out, err));
  assert(node_child(out, "example").Tag() == "!");
  assert(node_child(out, "default").Tag() != "!");
}

static void test_plain_schema_is_copied() {
  auto doc = load(kSchemas);
  SchemaResolver r(*doc);
  YAML::Node schema = YAML::Load("{type: string, enum: [a, b], nullable: true}");
  YAML::Node out;
  Error err;
  assert(r.resolve(schema, out, err));
  assert(scalar_or(node_child(out, "type")) == "string");
  assert(node_child(out, "enum").size() == 2);
}

int main() {
  test_nested_refs_are_expanded();
  test_alias_is_followed();
  test_recursive_schema_keeps_inner_ref();
  test_alias_cycle_is_error();
  test_missing_and_external_refs();
  test_sibling_keys_override_target();
  test_depth_limit();
  test_shared_refs_expand_once();
  test_shared_ref_still_honors_depth_limit();
  test_recursive_schema_is_not_shared();
  test_quoted_scalars_keep_their_tag();
  test_plain_schema_is_copied();
  return 0;
}
