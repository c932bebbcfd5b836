#pragma once
/*
 * SchemaSerializer
 *
 * Purpose: canonical block-style YAML text for a resolved schema.
 * Ordering: schema keywords in a fixed order, unknown keys sorted; property
 * names keep document order. Same input always yields the same text.
 */
#include <string>
#include <yaml-cpp/yaml.h>
#include "types.hpp"

bool serialize_schema(const YAML::Node& schema, std::string& out, Error& err);
