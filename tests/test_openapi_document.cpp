#include "openapi_document.hpp"
#include "operation_content.hpp"
#include <cassert>
#include <string>

static std::shared_ptr<const OpenApiDocument> load_petstore() {
  std::shared_ptr<const OpenApiDocument> doc;
  Error err;
  bool ok = OpenApiDocument::from_file(OAVIEW_TEST_DATA "/petstore.yaml", doc, err);
  assert(ok && !err);
  return doc;
}

static void test_operations_in_document_order() {
  auto doc = load_petstore();
  assert(doc->title() == "Petstore");
  assert(doc->version() == "1.2.0");
  assert(doc->spec_version() == "3.0.3");
  const auto& ops = doc->operations();
  assert(ops.size() == 4);
  assert(ops[0].method == "GET" && ops[0].path == "/pets");
  assert(ops[1].method == "POST" && ops[1].path == "/pets");
  assert(ops[2].method == "GET" && ops[2].path == "/pets/{petId}");
  assert(ops[3].method == "DELETE" && ops[3].path == "/pets/{petId}");
  assert(ops[0].operation_id == "listPets");
  assert(ops[0].summary == "List all pets");
  assert(ops[0].tags.size() == 1 && ops[0].tags[0] == "pets");
  assert(!ops[0].deprecated);
  assert(ops[2].deprecated);
  assert(doc->operation(3) == &ops[3]);
  assert(doc->operation(4) == nullptr);
  assert(doc->operation(-1) == nullptr);
}

static void test_resolve_pointer() {
  auto doc = load_petstore();
  Error err;
  YAML::Node pet;
  assert(doc->resolve("#/components/schemas/Pet", pet, err));
  assert(pet.IsMap());
  assert(scalar_or(node_child(pet, "type")) == "object");

  YAML::Node get;
  assert(doc->resolve("#/paths/~1pets/get", get, err));
  assert(scalar_or(node_child(get, "operationId")) == "listPets");

  YAML::Node tag;
  assert(doc->resolve("#/paths/~1pets/get/tags/0", tag, err));
  assert(tag.Scalar() == "pets");

  YAML::Node root;
  assert(doc->resolve("#", root, err));
  assert(root.IsMap());
}

static void test_resolve_errors() {
  auto doc = load_petstore();
  YAML::Node out;
  Error err;
  assert(!doc->resolve("#/components/schemas/Nope", out, err));
  assert(err.kind == ErrorKind::ReferenceResolution);
  assert(err.message.find("#/components/schemas/Nope") != std::string::npos);

  Error ext;
  assert(!doc->resolve("common.yaml#/Pet", out, ext));
  assert(ext.kind == ErrorKind::ReferenceResolution);
  assert(ext.message.find("external") != std::string::npos);

  Error idx;
  assert(!doc->resolve("#/paths/~1pets/get/tags/7", out, idx));
  assert(idx.kind == ErrorKind::ReferenceResolution);

  // a failed lookup must not add keys to the document
  YAML::Node schemas;
  assert(doc->resolve("#/components/schemas", schemas, err));
  assert(schemas.size() == 2);
}

static void test_request_and_responses() {
  auto doc = load_petstore();
  Error err;
  RequestBodyInfo body;
  assert(request_body_info(*doc, doc->operations()[0], body, err));
  assert(!body.present && body.contents.empty());

  assert(request_body_info(*doc, doc->operations()[1], body, err));
  assert(body.present && body.required);
  assert(body.description == "Pet to add");
  assert(body.contents.size() == 2);
  assert(body.contents[0].media_type == "application/json");
  assert(body.contents[1].media_type == "application/xml");
  assert(json_content_index(body.contents) == 0);

  std::vector<ResponseInfo> responses;
  assert(response_infos(*doc, doc->operations()[0], responses, err));
  assert(responses.size() == 2);
  assert(responses[0].status == "200");
  assert(responses[1].status == "default");
  assert(responses[1].description == "Unexpected error");
  assert(responses[1].contents.size() == 1);
}

static void test_json_content_index() {
  std::vector<MediaContent> contents(3);
  contents[0].media_type = "text/plain";
  contents[1].media_type = "application/problem+json";
  contents[2].media_type = "application/json";
  assert(json_content_index(contents) == 2);
  contents.pop_back();
  assert(json_content_index(contents) == 1);
  contents.pop_back();
  assert(json_content_index(contents) == -1);
}

static void test_load_errors() {
  std::shared_ptr<const OpenApiDocument> doc;
  Error e1;
  assert(!OpenApiDocument::from_string("openapi: [3.0", doc, e1));
  assert(e1.kind == ErrorKind::DocumentLoad);

  Error e2;
  assert(!OpenApiDocument::from_string("info:\n  title: x\n", doc, e2));
  assert(e2.kind == ErrorKind::DocumentLoad);
  assert(e2.message == "missing openapi version field");

  Error e3;
  assert(!OpenApiDocument::from_string("- a\n- b\n", doc, e3));
  assert(e3.message == "document root must be a mapping");

  Error e4;
  assert(!OpenApiDocument::from_string("openapi: 3.1.0\npaths: [a]\n", doc, e4));
  assert(e4.message == "paths must be a mapping");

  Error e5;
  assert(!OpenApiDocument::from_file(OAVIEW_TEST_DATA "/does-not-exist.yaml", doc, e5));
  assert(e5.kind == ErrorKind::DocumentLoad);
  assert(!doc);
}

static void test_json_and_empty_documents() {
  std::shared_ptr<const OpenApiDocument> doc;
  Error err;
  const char* json = R"({"openapi": "3.1.0", "info": {"title": "J", "version": "1"},
    "paths": {"/a": {"put": {"responses": {"200": {"description": "ok"}}}, "x-note": "n"}}})";
  assert(OpenApiDocument::from_string(json, doc, err));
  assert(doc->operations().size() == 1);
  assert(doc->operations()[0].method == "PUT");

  assert(OpenApiDocument::from_string("openapi: 3.1.0\n", doc, err));
  assert(doc->operations().empty());
}

int main() {
  test_operations_in_document_order();
  test_resolve_pointer();
  test_resolve_errors();
  test_request_and_responses();
  test_json_content_index();
  test_load_errors();
  test_json_and_empty_documents();
  return 0;
}
