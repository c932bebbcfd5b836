#pragma once
/*
 * SchemaResolver
 *
 * Purpose: expand every local $ref inside a schema into a fresh node tree.
 * Bounds: at most kMaxDepth nested expansions; a schema that refers back to
 * one of its own ancestors keeps that inner occurrence as a literal $ref, and
 * an alias chain that never reaches a concrete schema is an error.
 * Expansions are shared within one resolve() call, so a schema referenced
 * from many places is expanded once.
 */
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "openapi_document.hpp"
#include "types.hpp"

class SchemaResolver {
public:
  static constexpr int kMaxDepth = 32;

  explicit SchemaResolver(const OpenApiDocument& doc) : doc_(doc) {}
  bool resolve(const YAML::Node& schema, YAML::Node& out, Error& err);

private:
  bool resolve_node(const YAML::Node& node, int depth, YAML::Node& out, Error& err);
  bool expand_ref(const YAML::Node& node, int depth, YAML::Node& out, Error& err);
  bool expand_target(const std::string& ref, int depth, YAML::Node& out, Error& err);
  bool on_stack(const std::string& ref) const;

  struct Expansion {
    YAML::Node node;
    int height = 0;  // nesting levels used below the referencing depth
  };

  const OpenApiDocument& doc_;
  std::vector<std::string> stack_;
  std::unordered_map<std::string, Expansion> cache_;
  int cuts_ = 0;     // literal $ref emitted for an ancestor
  int reached_ = 0;  // deepest expansion level seen
};
