#pragma once

// json_util.h
//
// Thin helpers over json-c for the whole-document read-modify-write style
// used by the queue, the reputation cache and the evolution records.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace hive::json {

// Owning handle for a json-c root object.
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

    // Hands ownership to the caller (e.g. before json_object_object_add).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

inline Doc parse(const std::string& text) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(),
        static_cast<int>(std::min(text.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

inline Doc new_object() { return Doc{json_object_new_object()}; }

inline bool is_object(json_object* o) { return o && json_object_is_type(o, json_type_object); }

// Member lookup; nullptr when absent, null, or `o` is not an object.
inline json_object* member(json_object* o, const char* key) {
    if (!is_object(o)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    return v;
}

inline std::string get_string(json_object* o, const char* key, const std::string& defv = "") {
    json_object* v = member(o, key);
    if (!v || !json_object_is_type(v, json_type_string)) return defv;
    return std::string(json_object_get_string(v));
}

inline std::optional<std::string> get_opt_string(json_object* o, const char* key) {
    json_object* v = member(o, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

inline int64_t get_int(json_object* o, const char* key, int64_t defv = 0) {
    json_object* v = member(o, key);
    if (!v) return defv;
    if (json_object_is_type(v, json_type_int)) return static_cast<int64_t>(json_object_get_int64(v));
    if (json_object_is_type(v, json_type_double)) return static_cast<int64_t>(json_object_get_double(v));
    return defv;
}

inline std::optional<int64_t> get_opt_int(json_object* o, const char* key) {
    json_object* v = member(o, key);
    if (!v) return std::nullopt;
    if (!(json_object_is_type(v, json_type_int) || json_object_is_type(v, json_type_double))) return std::nullopt;
    return get_int(o, key);
}

inline double get_double(json_object* o, const char* key, double defv = 0.0) {
    json_object* v = member(o, key);
    if (!v) return defv;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return defv;
    return json_object_get_double(v);
}

inline bool get_bool(json_object* o, const char* key, bool defv = false) {
    json_object* v = member(o, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return defv;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> get_string_array(json_object* o, const char* key) {
    std::vector<std::string> out;
    json_object* arr = member(o, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

// ---- builders (each add transfers ownership of the new value to `o`) ----

inline void put_string(json_object* o, const char* key, const std::string& v) {
    json_object_object_add(o, key, json_object_new_string_len(v.data(), static_cast<int>(v.size())));
}

inline void put_opt_string(json_object* o, const char* key, const std::optional<std::string>& v) {
    if (v) put_string(o, key, *v);
    else json_object_object_add(o, key, nullptr);
}

inline void put_int(json_object* o, const char* key, int64_t v) {
    json_object_object_add(o, key, json_object_new_int64(v));
}

inline void put_opt_int(json_object* o, const char* key, const std::optional<int64_t>& v) {
    if (v) put_int(o, key, *v);
    else json_object_object_add(o, key, nullptr);
}

inline void put_double(json_object* o, const char* key, double v) {
    json_object_object_add(o, key, json_object_new_double(v));
}

inline void put_bool(json_object* o, const char* key, bool v) {
    json_object_object_add(o, key, json_object_new_boolean(v ? 1 : 0));
}

inline json_object* new_string_array(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) {
        json_object_array_add(arr, json_object_new_string_len(s.data(), static_cast<int>(s.size())));
    }
    return arr;
}

inline void put_string_array(json_object* o, const char* key, const std::vector<std::string>& items) {
    json_object_object_add(o, key, new_string_array(items));
}

inline std::string dump(json_object* o, bool pretty = false) {
    if (!o) return "null";
    int flags = JSON_C_TO_STRING_NOSLASHESCAPE | (pretty ? JSON_C_TO_STRING_PRETTY : JSON_C_TO_STRING_PLAIN);
    return std::string(json_object_to_json_string_ext(o, flags));
}

// Escape a string for embedding inside a JSON string literal (no surrounding quotes).
inline std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"':  oss << "\\\""; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

// ---- whole-file helpers (implemented in json_util.cpp) ----

// Reads the whole file. Returns false if it does not exist or cannot be read.
bool read_text_file(const std::filesystem::path& p, std::string* out);

// Writes <dst>.tmp then renames over dst. Returns empty string on success.
std::string write_atomic(const std::filesystem::path& dst, const std::string& body);

// Reads and parses a JSON file. A missing file yields an empty Doc and
// *missing=true; a present but unparsable file yields an empty Doc and
// *missing=false.
Doc load_file(const std::filesystem::path& p, bool* missing);

} // namespace hive::json
