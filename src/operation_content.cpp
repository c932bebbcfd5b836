#include "operation_content.hpp"

static bool collect_contents(const YAML::Node& content, std::vector<MediaContent>& out) {
  out.clear();
  if (!content.IsMap()) return true;
  for (auto it = content.begin(); it != content.end(); ++it) {
    MediaContent mc;
    mc.media_type = it->first.Scalar();
    mc.schema.reset(node_child(it->second, "schema"));
    out.push_back(std::move(mc));
  }
  return true;
}

bool request_body_info(const OpenApiDocument& doc, const Operation& op, RequestBodyInfo& out, Error& err) {
  out = RequestBodyInfo{};
  const YAML::Node raw = node_child(op.node, "requestBody");
  if (!raw.IsDefined()) return true;
  YAML::Node body;
  if (!doc.resolve_object(raw, body, err)) return false;
  out.present = true;
  out.required = scalar_or(node_child(body, "required")) == "true";
  out.description = scalar_or(node_child(body, "description"));
  return collect_contents(node_child(body, "content"), out.contents);
}

bool response_infos(const OpenApiDocument& doc, const Operation& op, std::vector<ResponseInfo>& out, Error& err) {
  out.clear();
  const YAML::Node responses = node_child(op.node, "responses");
  if (!responses.IsMap()) return true;
  for (auto it = responses.begin(); it != responses.end(); ++it) {
    ResponseInfo info;
    info.status = it->first.Scalar();
    YAML::Node resp;
    if (!doc.resolve_object(it->second, resp, err)) return false;
    info.description = scalar_or(node_child(resp, "description"));
    collect_contents(node_child(resp, "content"), info.contents);
    out.push_back(std::move(info));
  }
  return true;
}

int json_content_index(const std::vector<MediaContent>& contents) {
  for (size_t i = 0; i < contents.size(); ++i) {
    if (contents[i].media_type == kJsonMediaType) return static_cast<int>(i);
  }
  for (size_t i = 0; i < contents.size(); ++i) {
    const std::string& mt = contents[i].media_type;
    if (mt.rfind("application/json", 0) == 0 || mt.find("+json") != std::string::npos) return static_cast<int>(i);
  }
  return -1;
}
