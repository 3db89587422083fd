#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// SchemaViolation - first mismatch found between a value and its schema.
//
// field is a path into the arguments ("recipients[2]", "" for the root).
// ---------------------------------------------------------------------------
struct SchemaViolation {
    std::string field;
    std::string message;
};

/// Check a value against the JSON Schema subset used by tool input schemas:
/// "type" (object, string, integer, number, boolean, array), "properties",
/// "required", "enum", "items", "minimum", "maximum". Unknown keywords and
/// undeclared properties are ignored. Returns nullopt when the value conforms.
std::optional<SchemaViolation> ValidateAgainstSchema(const nlohmann::json& schema,
                                                     const nlohmann::json& value);

} // namespace snap_mcp
