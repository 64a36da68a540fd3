#include "codeloop/marshal.h"
#include "codeloop/errors.h"
#include "codeloop/json_util.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <set>
#include <sstream>
#include <unordered_set>

namespace codeloop {

namespace {

const std::unordered_set<std::string>& python_keywords() {
    static const std::unordered_set<std::string> kw = {
        "False", "None", "True", "and", "as", "assert", "async", "await",
        "break", "class", "continue", "def", "del", "elif", "else", "except",
        "finally", "for", "from", "global", "if", "import", "in", "is",
        "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
        "while", "with", "yield",
    };
    return kw;
}

// Names the bootstrap itself binds in the generated code's scope.
const std::unordered_set<std::string>& reserved_names() {
    static const std::unordered_set<std::string> r = {"emit", "INPUT_DIR", "OUTPUT_DIR"};
    return r;
}

bool is_ident_start(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

struct JsonGuard {
    json_object* o;
    ~JsonGuard() { if (o) json_object_put(o); }
};

json_object* encode_plain(const std::string& name, const Value& v, const std::string& path) {
    switch (v.kind()) {
        case Value::Kind::NUL:
            return nullptr;
        case Value::Kind::BOOL:
            return json_object_new_boolean(v.as_bool() ? 1 : 0);
        case Value::Kind::INT:
            return json_object_new_int64(v.as_int());
        case Value::Kind::DOUBLE:
            if (!std::isfinite(v.as_double())) {
                throw SerializationError(name, path + ": non-finite double has no JSON form");
            }
            return json_object_new_double(v.as_double());
        case Value::Kind::STRING:
            return json_util::new_string(v.as_string());
        case Value::Kind::LIST: {
            json_object* arr = json_object_new_array();
            JsonGuard g{arr};
            const auto& items = v.as_list();
            for (size_t i = 0; i < items.size(); i++) {
                json_object* el = encode_plain(name, items[i], path + "[" + std::to_string(i) + "]");
                json_object_array_add(arr, el);
            }
            g.o = nullptr;
            return arr;
        }
        case Value::Kind::MAP: {
            json_object* obj = json_object_new_object();
            JsonGuard g{obj};
            for (const auto& kv : v.as_map()) {
                json_object* el = encode_plain(name, kv.second, path + "." + kv.first);
                json_object_object_add(obj, kv.first.c_str(), el);
            }
            g.o = nullptr;
            return obj;
        }
        case Value::Kind::TABLE:
            throw SerializationError(name, path + ": tables are only supported as top-level variables");
        case Value::Kind::OPAQUE:
            throw SerializationError(name, path + ": host object of type '" + v.as_string() +
                                           "' has no transfer form");
    }
    throw SerializationError(name, path + ": unknown value kind");
}

json_object* encode_table(const std::string& name, const Table& t) {
    if (t.columns.size() != t.data.size()) {
        throw SerializationError(name, "table has " + std::to_string(t.columns.size()) +
                                       " column names but " + std::to_string(t.data.size()) + " columns");
    }
    std::set<std::string> seen;
    for (const auto& c : t.columns) {
        if (!seen.insert(c).second) throw SerializationError(name, "duplicate table column '" + c + "'");
    }
    const size_t rows = t.rows();

    json_object* env = json_object_new_object();
    JsonGuard g{env};
    json_object_object_add(env, "kind", json_object_new_string("table"));
    json_object_object_add(env, "name", json_util::new_string(name));

    json_object* cols = json_object_new_array();
    json_object_object_add(env, "columns", cols);
    json_object* data = json_object_new_object();
    json_object_object_add(env, "data", data);

    for (size_t ci = 0; ci < t.columns.size(); ci++) {
        const auto& col = t.columns[ci];
        const auto& vals = t.data[ci];
        if (vals.size() != rows) {
            throw SerializationError(name, "ragged table: column '" + col + "' has " +
                                           std::to_string(vals.size()) + " rows, expected " + std::to_string(rows));
        }
        json_object_array_add(cols, json_util::new_string(col));
        json_object* arr = json_object_new_array();
        json_object_object_add(data, col.c_str(), arr);
        for (size_t ri = 0; ri < vals.size(); ri++) {
            const std::string path = col + "[" + std::to_string(ri) + "]";
            if (!vals[ri].is_scalar()) {
                throw SerializationError(name, path + ": table cells must be scalars, got " +
                                               value_kind_name(vals[ri].kind()));
            }
            json_object_array_add(arr, encode_plain(name, vals[ri], path));
        }
    }
    g.o = nullptr;
    return env;
}

Value decode_plain(const std::string& name, json_object* o) {
    if (!o) return Value::null();
    switch (json_object_get_type(o)) {
        case json_type_null: return Value::null();
        case json_type_boolean: return Value::boolean(json_object_get_boolean(o) != 0);
        case json_type_int: return Value::integer(json_object_get_int64(o));
        case json_type_double: return Value::real(json_object_get_double(o));
        case json_type_string:
            return Value::string(std::string(json_object_get_string(o), (size_t)json_object_get_string_len(o)));
        case json_type_array: {
            ValueList items;
            const size_t n = json_object_array_length(o);
            items.reserve(n);
            for (size_t i = 0; i < n; i++) {
                items.push_back(decode_plain(name, json_object_array_get_idx(o, (int)i)));
            }
            return Value::list(std::move(items));
        }
        case json_type_object: {
            ValueMap items;
            json_object_object_foreach(o, k, v) {
                items.emplace(k, decode_plain(name, v));
            }
            return Value::map(std::move(items));
        }
    }
    throw SerializationError(name, "unsupported JSON type in envelope");
}

void write_json_file(const std::filesystem::path& p, json_object* o, const std::string& what) {
    if (json_object_to_file_ext(p.string().c_str(), o, JSON_C_TO_STRING_PLAIN) != 0) {
        throw EnvironmentCreateFailed("cannot write " + what + " to input mount: " + p.string());
    }
}

std::string slurp_file(const std::filesystem::path& p, bool* ok) {
    std::ifstream f(p, std::ios::binary);
    if (!f) { *ok = false; return {}; }
    std::ostringstream ss;
    ss << f.rdbuf();
    *ok = !f.bad();
    return ss.str();
}

} // namespace

void validate_variable_name(const std::string& name) {
    if (name.empty()) throw SerializationError(name, "empty variable name");
    if (!is_ident_start(name[0])) throw SerializationError(name, "not a valid identifier");
    for (char c : name) {
        if (!is_ident_char(c)) throw SerializationError(name, "not a valid identifier");
    }
    if (python_keywords().count(name)) throw SerializationError(name, "name is a Python keyword");
    if (reserved_names().count(name) || name.rfind("__", 0) == 0) {
        throw SerializationError(name, "name is reserved by the sandbox bootstrap");
    }
}

json_object* encode_variable(const std::string& name, const Value& v) {
    validate_variable_name(name);
    if (v.kind() == Value::Kind::TABLE) return encode_table(name, v.as_table());

    json_object* payload = encode_plain(name, v, name);
    json_object* env = json_object_new_object();
    json_object_object_add(env, "kind", json_object_new_string("value"));
    json_object_object_add(env, "name", json_util::new_string(name));
    json_object_object_add(env, "value", payload);
    return env;
}

Value decode_envelope(const std::string& name, json_object* envelope) {
    if (!envelope || !json_object_is_type(envelope, json_type_object)) {
        throw SerializationError(name, "envelope is not a JSON object");
    }
    auto kind = json_util::get_string(envelope, "kind").value_or("value");

    if (kind == "value") {
        json_object* v = nullptr;
        if (!json_object_object_get_ex(envelope, "value", &v)) {
            throw SerializationError(name, "envelope missing 'value'");
        }
        return decode_plain(name, v);
    }

    if (kind == "table") {
        Table t;
        t.columns = json_util::get_string_array(envelope, "columns");
        json_object* data = nullptr;
        if (!json_object_object_get_ex(envelope, "data", &data) || !data ||
            !json_object_is_type(data, json_type_object)) {
            throw SerializationError(name, "table envelope missing 'data' object");
        }
        for (const auto& col : t.columns) {
            json_object* arr = nullptr;
            if (!json_object_object_get_ex(data, col.c_str(), &arr) || !arr ||
                !json_object_is_type(arr, json_type_array)) {
                throw SerializationError(name, "table column '" + col + "' missing from data");
            }
            ValueList vals;
            const size_t n = json_object_array_length(arr);
            vals.reserve(n);
            for (size_t i = 0; i < n; i++) {
                Value cell = decode_plain(name, json_object_array_get_idx(arr, (int)i));
                if (!cell.is_scalar()) {
                    throw SerializationError(name, "table column '" + col + "' holds a non-scalar cell");
                }
                vals.push_back(std::move(cell));
            }
            if (!t.data.empty() && vals.size() != t.data.front().size()) {
                throw SerializationError(name, "ragged table column '" + col + "'");
            }
            t.data.push_back(std::move(vals));
        }
        return Value::table(std::move(t));
    }

    throw SerializationError(name, "unknown envelope kind '" + kind + "'");
}

void validate_variables(const VariableMap& vars) {
    for (const auto& kv : vars) {
        json_object* env = encode_variable(kv.first, kv.second);
        json_object_put(env);
    }
}

VariableMap select_used_variables(const std::string& code, const VariableMap& vars) {
    std::unordered_set<std::string> idents;
    size_t i = 0;
    while (i < code.size()) {
        if (is_ident_start(code[i]) && (i == 0 || !is_ident_char(code[i - 1]))) {
            size_t j = i + 1;
            while (j < code.size() && is_ident_char(code[j])) j++;
            idents.insert(code.substr(i, j - i));
            i = j;
            continue;
        }
        i++;
    }
    VariableMap out;
    for (const auto& kv : vars) {
        if (idents.count(kv.first)) out.emplace(kv.first, kv.second);
    }
    return out;
}

std::vector<std::string> marshal_variables(const VariableMap& vars, const std::filesystem::path& input_dir) {
    // encode everything first: a doomed variable must not leave a half-written bundle
    std::vector<std::pair<std::string, json_util::Doc>> encoded;
    encoded.reserve(vars.size());
    for (const auto& kv : vars) {
        encoded.emplace_back(kv.first, json_util::Doc(encode_variable(kv.first, kv.second)));
    }

    const auto vars_dir = input_dir / "vars";
    std::error_code ec;
    std::filesystem::create_directories(vars_dir, ec);
    if (ec) throw EnvironmentCreateFailed("cannot create " + vars_dir.string() + ": " + ec.message());

    json_util::Doc manifest(json_object_new_object());
    json_object* list = json_object_new_array();
    json_object_object_add(manifest.root, "variables", list);

    std::vector<std::string> names;
    names.reserve(encoded.size());
    for (auto& e : encoded) {
        const std::string rel = "vars/" + e.first + ".json";
        write_json_file(input_dir / rel, e.second.root, "variable '" + e.first + "'");

        json_object* item = json_object_new_object();
        json_object_object_add(item, "name", json_util::new_string(e.first));
        auto kind = json_util::get_string(e.second.root, "kind").value_or("value");
        json_object_object_add(item, "kind", json_util::new_string(kind));
        json_object_object_add(item, "file", json_util::new_string(rel));
        json_object_array_add(list, item);
        names.push_back(e.first);
    }
    write_json_file(input_dir / "manifest.json", manifest.root, "manifest");
    return names;
}

std::string declared_output_path(const std::string& name) {
    return "vars/" + name + ".json";
}

VariableMap unmarshal_outputs(const std::filesystem::path& output_dir, const std::vector<std::string>& names) {
    VariableMap out;
    for (const auto& name : names) {
        if (name.empty() || !is_ident_start(name[0]) ||
            !std::all_of(name.begin(), name.end(), is_ident_char)) {
            throw CaptureFailed("result summary lists an invalid output name '" + name + "'");
        }
        const auto p = output_dir / declared_output_path(name);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(p, ec)) {
            throw CaptureFailed("declared output '" + name + "' is listed but missing");
        }
        bool ok = false;
        std::string body = slurp_file(p, &ok);
        if (!ok) throw CaptureFailed("cannot read declared output " + p.string());
        json_util::Doc doc = json_util::parse(body);
        if (!doc) throw CaptureFailed("declared output '" + name + "' is not valid JSON");
        try {
            out.emplace(name, decode_envelope(name, doc.root));
        } catch (const SerializationError& e) {
            throw CaptureFailed(std::string("declared output decode failed: ") + e.what());
        }
    }
    return out;
}

VariableMap variables_from_json(json_object* obj) {
    VariableMap out;
    if (!obj) return out;
    if (!json_object_is_type(obj, json_type_object)) {
        throw SerializationError("<variables>", "expected a JSON object of name -> envelope");
    }
    json_object_object_foreach(obj, k, v) {
        validate_variable_name(k);
        out.emplace(k, decode_envelope(k, v));
    }
    return out;
}

std::string render_value(const Value& v, size_t max_items) {
    std::ostringstream oss;
    switch (v.kind()) {
        case Value::Kind::NUL: oss << "None"; break;
        case Value::Kind::BOOL: oss << (v.as_bool() ? "True" : "False"); break;
        case Value::Kind::INT: oss << v.as_int(); break;
        case Value::Kind::DOUBLE: oss << v.as_double(); break;
        case Value::Kind::STRING: oss << json_util::quote(v.as_string()); break;
        case Value::Kind::OPAQUE: oss << "<" << v.as_string() << ">"; break;
        case Value::Kind::LIST: {
            const auto& items = v.as_list();
            oss << "[";
            for (size_t i = 0; i < items.size() && i < max_items; i++) {
                if (i) oss << ", ";
                oss << render_value(items[i], max_items);
            }
            if (items.size() > max_items) oss << ", ... (" << items.size() << " items)";
            oss << "]";
            break;
        }
        case Value::Kind::MAP: {
            const auto& items = v.as_map();
            oss << "{";
            size_t i = 0;
            for (const auto& kv : items) {
                if (i == max_items) { oss << ", ... (" << items.size() << " keys)"; break; }
                if (i) oss << ", ";
                oss << json_util::quote(kv.first) << ": " << render_value(kv.second, max_items);
                i++;
            }
            oss << "}";
            break;
        }
        case Value::Kind::TABLE: {
            const auto& t = v.as_table();
            oss << "Table(" << t.rows() << " rows x " << t.columns.size() << " columns)";
            break;
        }
    }
    return oss.str();
}

std::string describe_variables(const VariableMap& vars) {
    if (vars.empty()) return "No data variables available.";

    std::ostringstream oss;
    bool first = true;
    for (const auto& kv : vars) {
        if (!first) oss << "\n\n";
        first = false;
        const Value& v = kv.second;
        oss << "Variable: " << kv.first << "\n";
        switch (v.kind()) {
            case Value::Kind::TABLE: {
                const auto& t = v.as_table();
                oss << "Type: DataFrame\n";
                oss << "Shape: (" << t.rows() << ", " << t.columns.size() << ")\n";
                oss << "Columns: [";
                for (size_t i = 0; i < t.columns.size(); i++) {
                    if (i) oss << ", ";
                    oss << "'" << t.columns[i] << "'";
                }
                oss << "]\n";
                oss << "Sample data (first 3 rows):\n";
                for (size_t r = 0; r < t.rows() && r < 3; r++) {
                    for (size_t c = 0; c < t.columns.size(); c++) {
                        if (c) oss << " | ";
                        oss << render_value(t.data[c][r]);
                    }
                    oss << "\n";
                }
                break;
            }
            case Value::Kind::LIST:
                oss << "Type: list\n";
                oss << "Length: " << v.as_list().size() << "\n";
                oss << "Sample data (first 3 values): " << render_value(v, 3) << "\n";
                break;
            case Value::Kind::MAP:
                oss << "Type: dict\n";
                oss << "Keys: " << v.as_map().size() << "\n";
                oss << "Sample data: " << render_value(v, 3) << "\n";
                break;
            default:
                oss << "Type: " << value_kind_name(v.kind()) << "\n";
                oss << "Value: " << render_value(v) << "\n";
                break;
        }
    }
    return oss.str();
}

} // namespace codeloop
