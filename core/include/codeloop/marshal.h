#pragma once

// Variable Marshaler: host variables <-> per-variable JSON envelopes on the
// input/output mounts.
//
// Envelope shapes (one file per variable, vars/<name>.json):
//   {"kind":"value","name":"x","value":<json>}
//   {"kind":"table","name":"df","columns":["a","b"],"data":{"a":[...],"b":[...]}}
//
// The input mount additionally carries manifest.json:
//   {"variables":[{"name":"x","kind":"value","file":"vars/x.json"}, ...]}

#include "value.h"

#include <json-c/json.h>

#include <filesystem>
#include <string>
#include <vector>

namespace codeloop {

// Throws SerializationError if `name` cannot be bound verbatim inside the
// sandbox (not an identifier, a Python keyword, or a reserved bootstrap name).
void validate_variable_name(const std::string& name);

// Encode one variable into a fresh envelope (caller owns the result).
// Throws SerializationError naming the variable and the offending path.
json_object* encode_variable(const std::string& name, const Value& v);

// Decode an envelope. Throws SerializationError on a malformed envelope.
Value decode_envelope(const std::string& name, json_object* envelope);

// Run the full encoder over every variable without touching the filesystem.
void validate_variables(const VariableMap& vars);

// Keep only the variables whose names occur as identifiers in `code`.
VariableMap select_used_variables(const std::string& code, const VariableMap& vars);

// Write vars/<name>.json and manifest.json under input_dir. Everything is
// encoded before the first byte is written, so a bad variable leaves no
// partial bundle behind. Returns the names written, in order.
std::vector<std::string> marshal_variables(const VariableMap& vars, const std::filesystem::path& input_dir);

// Read the declared outputs `names` (as listed in the result summary) from
// output_dir/vars/<name>.json. Other files under vars/ are not touched.
// Throws CaptureFailed on a listed output that is missing, cannot be read
// or cannot be decoded, and on a listed name that is not an identifier.
VariableMap unmarshal_outputs(const std::filesystem::path& output_dir, const std::vector<std::string>& names);

// output_dir-relative path of a declared output ("vars/<name>.json").
std::string declared_output_path(const std::string& name);

// Parse a {name: envelope} object (request files, --vars files).
VariableMap variables_from_json(json_object* obj);

// Short human-readable rendering; lists/maps/tables are elided past max_items.
std::string render_value(const Value& v, size_t max_items = 8);

// Data description handed to the code generator.
std::string describe_variables(const VariableMap& vars);

} // namespace codeloop
