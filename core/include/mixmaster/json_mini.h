#pragma once

// json_mini.h
//
// Thin helpers over json-c: an owning document handle plus typed field
// accessors that treat "present but wrong type" the same as "absent".

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstddef>
#include <string>
#include <utility>

namespace mixmaster::json_mini {

// Owning handle for a parsed body. An empty Doc says why in `error`.
struct Doc {
    json_object* root{nullptr};
    std::string error;

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root), error(std::move(other.error)) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            reset();
            root = other.root;
            error = std::move(other.error);
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() { reset(); }

    void reset() {
        if (root) json_object_put(root);
        root = nullptr;
    }

    static Doc failed(std::string why) {
        Doc d;
        d.error = std::move(why);
        return d;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: the whole input must be one JSON value (trailing
// whitespace allowed).
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc::failed("out of memory");
    const int len = static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX)));
    Doc doc(json_tokener_parse_ex(tok, json.c_str(), len));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr == json_tokener_continue) return Doc::failed("truncated JSON");
    if (jerr != json_tokener_success) return Doc::failed(json_tokener_error_desc(jerr));
    if (!doc) return Doc::failed("empty JSON");
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return Doc::failed("trailing content");
    }
    return doc;
}

inline bool get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out || !json_object_is_type(o, json_type_object)) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = std::string(json_object_get_string(v), static_cast<size_t>(json_object_get_string_len(v)));
    return true;
}

// Missing or non-string yields defv.
inline std::string get_string_or(json_object* o, const char* k, const std::string& defv) {
    std::string v;
    if (!get_string(o, k, &v)) return defv;
    return v;
}

inline json_object* get_object(json_object* o, const char* k) {
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_object)) return nullptr;
    return v;
}

inline json_object* get_array(json_object* o, const char* k) {
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_array)) return nullptr;
    return v;
}

} // namespace mixmaster::json_mini
