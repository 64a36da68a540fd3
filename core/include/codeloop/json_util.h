#pragma once

// Thin RAII + accessor layer over json-c.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codeloop::json_util {

// Owns one json-c reference.
struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Give up ownership (e.g. when adding to a parent object).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Truncated or invalid documents yield an empty Doc.
// A bare `null` document also yields an empty Doc; callers parse objects only.
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

inline std::string to_string_plain(json_object* o) {
    const char* s = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    return s ? std::string(s) : std::string("null");
}

inline std::string quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = to_string_plain(o);
    json_object_put(o);
    return out;
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), (int)s.size());
}

inline std::optional<std::string> get_string(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return std::nullopt;
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::optional<int64_t> get_int(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return std::nullopt;
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<bool> get_bool(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return std::nullopt;
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> get_string_array(json_object* o, const char* key) {
    std::vector<std::string> out;
    if (!o || !json_object_is_type(o, json_type_object)) return out;
    json_object* arr = nullptr;
    if (!json_object_object_get_ex(o, key, &arr)) return out;
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, static_cast<int>(i));
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

} // namespace codeloop::json_util
