#include "schema_resolver.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

static YAML::Node ref_node(const std::string& ref) {
  YAML::Node n(YAML::NodeType::Map);
  n.force_insert(std::string("$ref"), ref);
  return n;
}

static std::string join_chain(const std::vector<std::string>& chain, const std::string& last) {
  std::string s;
  for (const auto& r : chain) s += r + " -> ";
  return s + last;
}

bool SchemaResolver::on_stack(const std::string& ref) const {
  return std::find(stack_.begin(), stack_.end(), ref) != stack_.end();
}

bool SchemaResolver::resolve(const YAML::Node& schema, YAML::Node& out, Error& err) {
  stack_.clear();
  cache_.clear();
  cuts_ = 0;
  reached_ = 0;
  YAML::Node result;
  if (!resolve_node(schema, 0, result, err)) return false;
  out.reset(result);
  return true;
}

bool SchemaResolver::resolve_node(const YAML::Node& node, int depth, YAML::Node& out, Error& err) {
  switch (node.Type()) {
    case YAML::NodeType::Map: {
      if (is_ref_object(node)) return expand_ref(node, depth, out, err);
      YAML::Node m(YAML::NodeType::Map);
      for (auto it = node.begin(); it != node.end(); ++it) {
        YAML::Node v;
        if (!resolve_node(it->second, depth, v, err)) return false;
        m.force_insert(it->first.Scalar(), v);
      }
      out.reset(m);
      return true;
    }
    case YAML::NodeType::Sequence: {
      YAML::Node s(YAML::NodeType::Sequence);
      for (const auto& item : node) {
        YAML::Node v;
        if (!resolve_node(item, depth, v, err)) return false;
        s.push_back(v);
      }
      out.reset(s);
      return true;
    }
    case YAML::NodeType::Scalar: {
      YAML::Node v(node.Scalar());
      if (node.Tag() == "!") v.SetTag("!");
      out.reset(v);
      return true;
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      out.reset(YAML::Node(YAML::NodeType::Null));
      return true;
  }
  out.reset(YAML::Node(YAML::NodeType::Null));
  return true;
}

bool SchemaResolver::expand_target(const std::string& ref, int depth, YAML::Node& out, Error& err) {
  std::vector<std::string> chain{ref};
  YAML::Node target;
  if (!doc_.resolve(ref, target, err)) return false;
  while (is_ref_object(target)) {
    std::string next = scalar_or(node_child(target, "$ref"));
    if (std::find(chain.begin(), chain.end(), next) != chain.end()) {
      return fail(err, ErrorKind::ReferenceResolution, "cyclic reference: " + join_chain(chain, next));
    }
    if (on_stack(next)) {
      ++cuts_;
      out.reset(ref_node(ref));
      return true;
    }
    chain.push_back(next);
    YAML::Node t;
    if (!doc_.resolve(next, t, err)) return false;
    target.reset(t);
  }

  stack_.insert(stack_.end(), chain.begin(), chain.end());
  YAML::Node resolved;
  bool ok = resolve_node(target, depth + 1, resolved, err);
  stack_.resize(stack_.size() - chain.size());
  if (!ok) return false;
  out.reset(resolved);
  return true;
}

bool SchemaResolver::expand_ref(const YAML::Node& node, int depth, YAML::Node& out, Error& err) {
  std::string ref = scalar_or(node_child(node, "$ref"));
  if (ref.empty()) return fail(err, ErrorKind::ReferenceResolution, "$ref must be a non-empty string");
  if (on_stack(ref)) {
    ++cuts_;
    out.reset(ref_node(ref));
    return true;
  }
  if (depth + 1 > kMaxDepth) {
    return fail(err, ErrorKind::ReferenceResolution,
                "reference nesting deeper than " + std::to_string(kMaxDepth) + " levels at " + ref);
  }

  YAML::Node resolved;
  auto hit = cache_.find(ref);
  if (hit != cache_.end() && depth + hit->second.height <= kMaxDepth) {
    reached_ = std::max(reached_, depth + hit->second.height);
    resolved.reset(hit->second.node);
  } else {
    int cuts_before = cuts_;
    int reached_before = reached_;
    reached_ = depth + 1;
    if (!expand_target(ref, depth, resolved, err)) return false;
    // only expansions that never met an ancestor are independent of the stack
    if (cuts_ == cuts_before) cache_.emplace(ref, Expansion{resolved, reached_ - depth});
    reached_ = std::max(reached_, reached_before);
  }

  // siblings of $ref override keys of the resolved target
  if (node.size() > 1 && resolved.IsMap()) {
    YAML::Node merged(YAML::NodeType::Map);
    for (auto it = resolved.begin(); it != resolved.end(); ++it) {
      const std::string key = it->first.Scalar();
      if (!node_child(node, key).IsDefined()) merged.force_insert(key, it->second);
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
      const std::string key = it->first.Scalar();
      if (key == "$ref") continue;
      YAML::Node v;
      if (!resolve_node(it->second, depth, v, err)) return false;
      merged.force_insert(key, v);
    }
    resolved.reset(merged);
  }
  spdlog::trace("resolved {} at depth {}", ref, depth + 1);
  out.reset(resolved);
  return true;
}
