#pragma once
/*
 * Operation content
 *
 * Purpose: pick the media-type bodies of an operation's request and responses,
 * following requestBody/response $refs.
 */
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "openapi_document.hpp"
#include "types.hpp"

inline constexpr const char* kJsonMediaType = "application/json";

struct MediaContent {
  std::string media_type;
  YAML::Node schema; // undefined when the media type declares no schema
};

struct RequestBodyInfo {
  bool present = false;
  bool required = false;
  std::string description;
  std::vector<MediaContent> contents;
};

struct ResponseInfo {
  std::string status;
  std::string description;
  std::vector<MediaContent> contents;
};

bool request_body_info(const OpenApiDocument& doc, const Operation& op, RequestBodyInfo& out, Error& err);
bool response_infos(const OpenApiDocument& doc, const Operation& op, std::vector<ResponseInfo>& out, Error& err);
// Index of application/json (or a +json suffix type), -1 when absent.
int json_content_index(const std::vector<MediaContent>& contents);
