#include "openapi_document.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>
#include "file_reader.hpp"

static constexpr std::array<const char*, 8> kMethods = {
  "get", "put", "post", "delete", "options", "head", "patch", "trace"
};
static constexpr int kMaxAliasHops = 32;

YAML::Node node_child(const YAML::Node& node, const std::string& key) {
  if (!node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
  YAML::Node child = node[key];
  // missing keys come back as invalid "zombie" nodes that throw on use
  if (!child.IsDefined()) return YAML::Node(YAML::NodeType::Undefined);
  return child;
}

std::string scalar_or(const YAML::Node& node, const std::string& fallback) {
  if (node.IsDefined() && node.IsScalar()) return node.Scalar();
  return fallback;
}

bool is_ref_object(const YAML::Node& node) {
  return node.IsMap() && node_child(node, "$ref").IsDefined();
}

static bool is_method(const std::string& key) {
  return std::find(kMethods.begin(), kMethods.end(), key) != kMethods.end();
}

static std::string to_upper(std::string s) {
  for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

static std::string unescape_token(const std::string& tok) {
  std::string out;
  out.reserve(tok.size());
  for (size_t i = 0; i < tok.size(); ++i) {
    if (tok[i] == '~' && i + 1 < tok.size()) {
      if (tok[i + 1] == '1') { out += '/'; i++; continue; }
      if (tok[i + 1] == '0') { out += '~'; i++; continue; }
    }
    out += tok[i];
  }
  return out;
}

static bool parse_index(const std::string& tok, size_t& idx) {
  if (tok.empty() || !std::all_of(tok.begin(), tok.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
  idx = 0;
  for (char c : tok) idx = idx * 10 + static_cast<size_t>(c - '0');
  return true;
}

static YAML::Node pointer_step(const YAML::Node& cur, const std::string& tok) {
  size_t idx = 0;
  if (cur.IsMap()) return node_child(cur, tok);
  if (cur.IsSequence() && parse_index(tok, idx) && idx < cur.size()) return cur[idx];
  return YAML::Node(YAML::NodeType::Undefined);
}

bool OpenApiDocument::from_string(const std::string& text, std::shared_ptr<const OpenApiDocument>& out, Error& err) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    return fail(err, ErrorKind::DocumentLoad, std::string("invalid document: ") + e.what());
  }
  std::shared_ptr<OpenApiDocument> doc(new OpenApiDocument());
  if (!doc->load(root, err)) return false;
  out = std::move(doc);
  return true;
}

bool OpenApiDocument::from_file(const std::filesystem::path& path, std::shared_ptr<const OpenApiDocument>& out, Error& err) {
  std::string text, msg;
  if (!mmap_read_file(path, text, msg)) return fail(err, ErrorKind::DocumentLoad, msg);
  if (!from_string(text, out, err)) {
    err.message = path.string() + ": " + err.message;
    return false;
  }
  spdlog::info("loaded {} (openapi {}, {} operations)", path.string(), out->spec_version(), out->operations().size());
  return true;
}

bool OpenApiDocument::load(const YAML::Node& root, Error& err) {
  if (!root.IsDefined() || !root.IsMap()) return fail(err, ErrorKind::DocumentLoad, "document root must be a mapping");
  root_.reset(root);
  YAML::Node ver = node_child(root, "openapi");
  if (!ver.IsDefined()) ver.reset(node_child(root, "swagger"));
  if (!ver.IsDefined() || !ver.IsScalar()) return fail(err, ErrorKind::DocumentLoad, "missing openapi version field");
  spec_version_ = ver.Scalar();
  const YAML::Node info = node_child(root, "info");
  title_ = scalar_or(node_child(info, "title"));
  version_ = scalar_or(node_child(info, "version"));

  const YAML::Node paths = node_child(root, "paths");
  if (!paths.IsDefined() || paths.IsNull()) return true;
  if (!paths.IsMap()) return fail(err, ErrorKind::DocumentLoad, "paths must be a mapping");
  for (auto it = paths.begin(); it != paths.end(); ++it) {
    const std::string path = it->first.Scalar();
    YAML::Node item;
    if (!resolve_object(it->second, item, err)) {
      return fail(err, ErrorKind::DocumentLoad, "path " + path + ": " + err.message);
    }
    if (!item.IsMap()) continue;
    for (auto mt = item.begin(); mt != item.end(); ++mt) {
      const std::string key = mt->first.Scalar();
      const YAML::Node body = mt->second;
      if (!is_method(key) || !body.IsMap()) continue;
      Operation op;
      op.path = path;
      op.method = to_upper(key);
      op.node.reset(body);
      op.operation_id = scalar_or(node_child(body, "operationId"));
      op.summary = scalar_or(node_child(body, "summary"));
      op.description = scalar_or(node_child(body, "description"));
      op.deprecated = scalar_or(node_child(body, "deprecated")) == "true";
      const YAML::Node tags = node_child(body, "tags");
      if (tags.IsSequence()) {
        for (const auto& t : tags) if (t.IsScalar()) op.tags.push_back(t.Scalar());
      }
      operations_.push_back(std::move(op));
    }
  }
  return true;
}

const Operation* OpenApiDocument::operation(int idx) const {
  if (idx < 0 || idx >= static_cast<int>(operations_.size())) return nullptr;
  return &operations_[static_cast<size_t>(idx)];
}

bool OpenApiDocument::resolve(const std::string& ref, YAML::Node& out, Error& err) const {
  if (ref.empty() || ref[0] != '#') {
    return fail(err, ErrorKind::ReferenceResolution, "external references are not supported: " + ref);
  }
  if (ref == "#") { out.reset(root_); return true; }
  if (ref[1] != '/') {
    return fail(err, ErrorKind::ReferenceResolution, "malformed reference: " + ref);
  }
  YAML::Node cur(root_);
  std::stringstream ss(ref.substr(2));
  std::string raw;
  while (std::getline(ss, raw, '/')) {
    YAML::Node next = pointer_step(cur, unescape_token(raw));
    if (!next.IsDefined()) {
      return fail(err, ErrorKind::ReferenceResolution, "reference target not found: " + ref);
    }
    cur.reset(next);
  }
  out.reset(cur);
  return true;
}

bool OpenApiDocument::resolve_object(const YAML::Node& node, YAML::Node& out, Error& err) const {
  YAML::Node cur(node);
  for (int hops = 0; is_ref_object(cur); ++hops) {
    if (hops >= kMaxAliasHops) {
      return fail(err, ErrorKind::ReferenceResolution, "cyclic reference: " + scalar_or(node_child(node, "$ref")));
    }
    YAML::Node next;
    if (!resolve(scalar_or(node_child(cur, "$ref")), next, err)) return false;
    cur.reset(next);
  }
  out.reset(cur);
  return true;
}
