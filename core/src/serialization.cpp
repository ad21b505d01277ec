#include "evosynth/serialization.h"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace evosynth {

// --- JSON helpers ---

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    return true;
}

bool json_get_int64(json_object* o, const char* k, int64_t* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_int)) return false;
    *out = json_object_get_int64(v);
    return true;
}

void prime_json_hash_seed() {
    json_object* o = json_object_new_object();
    JsonGuard guard(o);
    json_object_object_add(o, "seed", json_object_new_int(0));
}

// --- Script values ---

static json_object* tagged(const char* tag, json_object* payload) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "t", json_object_new_string(tag));
    if (payload) json_object_object_add(o, "v", payload);
    return o;
}

static json_object* encode(const Value& v, int depth);

static json_object* items_to_json(const std::vector<Value>& items, int depth) {
    json_object* arr = json_object_new_array();
    JsonGuard guard(arr);
    for (const auto& it : items) {
        json_object_array_add(arr, encode(it, depth + 1));
    }
    guard.o = nullptr;
    return arr;
}

static json_object* encode(const Value& v, int depth) {
    if (v.obj && depth > kMaxTransferDepth) {
        throw ScriptError("RecursionError", "value nested deeper than " + std::to_string(kMaxTransferDepth) + " levels");
    }
    switch (v.kind) {
        case ValueKind::NONE:
            return tagged("none", nullptr);
        case ValueKind::BOOL:
            return json_object_new_boolean(v.b ? 1 : 0);
        case ValueKind::INT:
            return json_object_new_int64(v.i);
        case ValueKind::FLOAT: {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.17g", v.f);
            return tagged("float", json_object_new_string(buf));
        }
        case ValueKind::STR:
            return json_object_new_string_len(v.s.data(), (int)v.s.size());
        case ValueKind::LIST:
            return tagged("list", items_to_json(v.items(), depth));
        case ValueKind::TUPLE:
            return tagged("tuple", items_to_json(v.items(), depth));
        case ValueKind::SET:
            return tagged("set", items_to_json(set_of(v).members, depth));
        case ValueKind::DICT: {
            json_object* arr = json_object_new_array();
            JsonGuard guard(arr);
            for (const auto& kv : dict_of(v).entries) {
                json_object* pair = json_object_new_array();
                json_object_array_add(arr, pair);
                json_object_array_add(pair, encode(kv.first, depth + 1));
                json_object_array_add(pair, encode(kv.second, depth + 1));
            }
            guard.o = nullptr;
            return tagged("dict", arr);
        }
        case ValueKind::RANGE: {
            const RangeObj& r = range_of(v);
            json_object* arr = json_object_new_array();
            json_object_array_add(arr, json_object_new_int64(r.start));
            json_object_array_add(arr, json_object_new_int64(r.stop));
            json_object_array_add(arr, json_object_new_int64(r.step));
            return tagged("range", arr);
        }
        default:
            break;
    }
    throw ScriptError("TypeError", "cannot transfer value of type '" + type_name(v) + "'");
}

json_object* value_to_json(const Value& v) {
    return encode(v, 1);
}

// Each container level takes up to three JSON levels (tag object, payload
// array, dict pair), plus the result object and its outputs array.
static constexpr int kMaxJsonParseDepth = 3 * kMaxTransferDepth + 4;

static bool decode(json_object* o, Value* out, std::string* err, int depth);

static bool decode_items(json_object* arr, std::vector<Value>* items, std::string* err, int depth) {
    if (!arr || !json_object_is_type(arr, json_type_array)) {
        if (err) *err = "expected array payload";
        return false;
    }
    const size_t n = json_object_array_length(arr);
    items->reserve(n);
    for (size_t i = 0; i < n; i++) {
        Value item;
        if (!decode(json_object_array_get_idx(arr, i), &item, err, depth + 1)) return false;
        items->push_back(std::move(item));
    }
    return true;
}

static bool decode(json_object* o, Value* out, std::string* err, int depth) {
    if (!o) {
        if (err) *err = "null value";
        return false;
    }
    switch (json_object_get_type(o)) {
        case json_type_boolean:
            *out = Value::boolean(json_object_get_boolean(o) != 0);
            return true;
        case json_type_int:
            *out = Value::integer(json_object_get_int64(o));
            return true;
        case json_type_double:
            *out = Value::real(json_object_get_double(o));
            return true;
        case json_type_string:
            *out = Value::str(std::string(json_object_get_string(o), (size_t)json_object_get_string_len(o)));
            return true;
        case json_type_object:
            break;
        default:
            if (err) *err = "unexpected json type";
            return false;
    }
    if (depth > kMaxTransferDepth) {
        if (err) *err = "value nested too deeply";
        return false;
    }

    std::string tag;
    if (!json_get_string(o, "t", &tag)) {
        if (err) *err = "object without tag";
        return false;
    }
    json_object* payload = nullptr;
    json_object_object_get_ex(o, "v", &payload);

    if (tag == "none") {
        *out = Value::none();
        return true;
    }
    if (tag == "float") {
        if (!payload || !json_object_is_type(payload, json_type_string)) {
            if (err) *err = "float payload must be a string";
            return false;
        }
        const char* s = json_object_get_string(payload);
        char* end = nullptr;
        double d = std::strtod(s, &end);
        if (end == s || *end != '\0') {
            if (err) *err = std::string("bad float payload: ") + s;
            return false;
        }
        *out = Value::real(d);
        return true;
    }
    if (tag == "list" || tag == "tuple") {
        std::vector<Value> items;
        if (!decode_items(payload, &items, err, depth)) return false;
        *out = tag == "list" ? Value::list(std::move(items)) : Value::tuple(std::move(items));
        return true;
    }
    if (tag == "set") {
        std::vector<Value> items;
        if (!decode_items(payload, &items, err, depth)) return false;
        Value s = Value::set();
        for (const auto& it : items) set_of(s).add(it);
        *out = std::move(s);
        return true;
    }
    if (tag == "dict") {
        if (!payload || !json_object_is_type(payload, json_type_array)) {
            if (err) *err = "expected array payload";
            return false;
        }
        Value d = Value::dict();
        const size_t n = json_object_array_length(payload);
        for (size_t i = 0; i < n; i++) {
            std::vector<Value> kv;
            if (!decode_items(json_object_array_get_idx(payload, i), &kv, err, depth)) return false;
            if (kv.size() != 2) {
                if (err) *err = "dict entry must be a [key, value] pair";
                return false;
            }
            dict_of(d).put(kv[0], kv[1]);
        }
        *out = std::move(d);
        return true;
    }
    if (tag == "range") {
        std::vector<Value> parts;
        if (!decode_items(payload, &parts, err, depth)) return false;
        if (parts.size() != 3 || parts[0].kind != ValueKind::INT || parts[1].kind != ValueKind::INT ||
            parts[2].kind != ValueKind::INT || parts[2].i == 0) {
            if (err) *err = "bad range payload";
            return false;
        }
        *out = Value::range(parts[0].i, parts[1].i, parts[2].i);
        return true;
    }
    if (err) *err = "unknown tag: " + tag;
    return false;
}

bool value_from_json(json_object* o, Value* out, std::string* err) {
    if (!out) return false;
    try {
        return decode(o, out, err, 1);
    } catch (const ScriptError& e) {
        // unhashable set member or dict key
        if (err) *err = e.what();
        return false;
    }
}

// --- ExecutionResult ---

std::string execution_result_to_json(const ExecutionResult& r) {
    json_object* root = json_object_new_object();
    JsonGuard guard(root);
    json_object_object_add(root, "status", json_object_new_string(exec_status_name(r.status)));
    json_object_object_add(root, "message", json_object_new_string_len(r.message.data(), (int)r.message.size()));
    json_object_object_add(root, "duration_s", json_object_new_double(r.duration_s));
    json_object* outs = json_object_new_array();
    json_object_object_add(root, "outputs", outs);
    for (const auto& v : r.outputs) {
        json_object_array_add(outs, value_to_json(v));
    }
    return json_object_to_json_string_ext(root, JSON_C_TO_STRING_PLAIN);
}

bool execution_result_from_json(const std::string& text, ExecutionResult* out, std::string* err) {
    if (!out) return false;
    json_tokener* tok = json_tokener_new_ex(kMaxJsonParseDepth);
    if (!tok) {
        if (err) *err = "out of memory";
        return false;
    }
    json_object* root = json_tokener_parse_ex(tok, text.c_str(), (int)text.size());
    const bool complete = json_tokener_get_error(tok) == json_tokener_success;
    json_tokener_free(tok);
    if (!root || !complete) {
        if (root) json_object_put(root);
        if (err) *err = "invalid json";
        return false;
    }
    JsonGuard guard(root);
    if (!json_object_is_type(root, json_type_object)) {
        if (err) *err = "result is not an object";
        return false;
    }

    ExecutionResult r;
    std::string status;
    if (!json_get_string(root, "status", &status) || !exec_status_from_name(status, &r.status)) {
        if (err) *err = "missing or unknown status";
        return false;
    }
    json_get_string(root, "message", &r.message);

    json_object* v = nullptr;
    if (json_object_object_get_ex(root, "duration_s", &v) &&
        (json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) {
        r.duration_s = json_object_get_double(v);
    }

    if (json_object_object_get_ex(root, "outputs", &v) && v) {
        try {
            if (!decode_items(v, &r.outputs, err, 0)) return false;
        } catch (const ScriptError& e) {
            if (err) *err = e.what();
            return false;
        }
    }

    *out = std::move(r);
    return true;
}

} // namespace evosynth
