#pragma once
/*
 * OpenApiDocument
 *
 * Purpose: parsed OpenAPI description (YAML or JSON) plus local reference
 * resolution. Immutable after load; shared read-only between panes.
 * Operations are listed in document order (paths, then method keys).
 */
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "types.hpp"

struct Operation {
  std::string path;
  std::string method; // upper case
  std::string operation_id;
  std::string summary;
  std::string description;
  std::vector<std::string> tags;
  bool deprecated = false;
  YAML::Node node;
};

class OpenApiDocument {
public:
  static bool from_file(const std::filesystem::path& path, std::shared_ptr<const OpenApiDocument>& out, Error& err);
  static bool from_string(const std::string& text, std::shared_ptr<const OpenApiDocument>& out, Error& err);

  const std::vector<Operation>& operations() const { return operations_; }
  const Operation* operation(int idx) const;
  const std::string& title() const { return title_; }
  const std::string& version() const { return version_; }
  const std::string& spec_version() const { return spec_version_; }
  const YAML::Node& root() const { return root_; }

  // Follows a local JSON pointer ("#/components/schemas/Pet").
  bool resolve(const std::string& ref, YAML::Node& out, Error& err) const;
  // Returns node itself, or its target when node is a {$ref: ...} mapping.
  bool resolve_object(const YAML::Node& node, YAML::Node& out, Error& err) const;

private:
  OpenApiDocument() = default;
  bool load(const YAML::Node& root, Error& err);

  YAML::Node root_;
  std::string title_;
  std::string version_;
  std::string spec_version_;
  std::vector<Operation> operations_;
};

// Read-only lookups; yaml-cpp's non-const operator[] inserts missing keys.
YAML::Node node_child(const YAML::Node& node, const std::string& key);
std::string scalar_or(const YAML::Node& node, const std::string& fallback = {});
bool is_ref_object(const YAML::Node& node);
