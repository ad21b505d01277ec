#include "evosynth/value.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace evosynth {

const char* value_kind_name(ValueKind k) {
    switch (k) {
        case ValueKind::NONE: return "NoneType";
        case ValueKind::BOOL: return "bool";
        case ValueKind::INT: return "int";
        case ValueKind::FLOAT: return "float";
        case ValueKind::STR: return "str";
        case ValueKind::LIST: return "list";
        case ValueKind::TUPLE: return "tuple";
        case ValueKind::DICT: return "dict";
        case ValueKind::SET: return "set";
        case ValueKind::RANGE: return "range";
        case ValueKind::FUNCTION: return "function";
        case ValueKind::BUILTIN: return "builtin_function_or_method";
        case ValueKind::METHOD: return "method";
        case ValueKind::MODULE: return "module";
    }
    return "object";
}

std::string type_name(const Value& v) {
    return value_kind_name(v.kind);
}

Value Value::boolean(bool v) {
    Value out;
    out.kind = ValueKind::BOOL;
    out.b = v;
    return out;
}

Value Value::integer(int64_t v) {
    Value out;
    out.kind = ValueKind::INT;
    out.i = v;
    return out;
}

Value Value::real(double v) {
    Value out;
    out.kind = ValueKind::FLOAT;
    out.f = v;
    return out;
}

Value Value::str(std::string v) {
    Value out;
    out.kind = ValueKind::STR;
    out.s = std::move(v);
    return out;
}

Value Value::list(std::vector<Value> items) {
    Value out;
    out.kind = ValueKind::LIST;
    auto o = std::make_shared<SeqObj>();
    o->items = std::move(items);
    out.obj = std::move(o);
    return out;
}

Value Value::tuple(std::vector<Value> items) {
    Value out = list(std::move(items));
    out.kind = ValueKind::TUPLE;
    return out;
}

Value Value::dict() {
    Value out;
    out.kind = ValueKind::DICT;
    out.obj = std::make_shared<DictObj>();
    return out;
}

Value Value::set() {
    Value out;
    out.kind = ValueKind::SET;
    out.obj = std::make_shared<SetObj>();
    return out;
}

Value Value::range(int64_t start, int64_t stop, int64_t step) {
    Value out;
    out.kind = ValueKind::RANGE;
    auto o = std::make_shared<RangeObj>();
    o->start = start;
    o->stop = stop;
    o->step = step;
    out.obj = std::move(o);
    return out;
}

std::vector<Value>& Value::items() const {
    return static_cast<SeqObj*>(obj.get())->items;
}

// ---------------------------------------------------------------------------
// Teardown

static void release_values(std::vector<Value>& values, std::vector<std::shared_ptr<Object>>& out) {
    for (auto& v : values) {
        if (v.obj) out.push_back(std::move(v.obj));
    }
    values.clear();
}

void release_objects(std::vector<std::shared_ptr<Object>>& pending) {
    while (!pending.empty()) {
        std::shared_ptr<Object> o = std::move(pending.back());
        pending.pop_back();
        // Sole owner: empty it first so its destructor has nothing to recurse into.
        if (o && o.use_count() == 1) o->releaseChildren(pending);
    }
}

void clear_object(Object& obj) {
    std::vector<std::shared_ptr<Object>> pending;
    obj.releaseChildren(pending);
    release_objects(pending);
}

SeqObj::~SeqObj() { clear_object(*this); }

void SeqObj::releaseChildren(std::vector<std::shared_ptr<Object>>& out) {
    release_values(items, out);
}

DictObj::~DictObj() { clear_object(*this); }

void DictObj::releaseChildren(std::vector<std::shared_ptr<Object>>& out) {
    index.clear();
    for (auto& kv : entries) {
        if (kv.first.obj) out.push_back(std::move(kv.first.obj));
        if (kv.second.obj) out.push_back(std::move(kv.second.obj));
    }
    entries.clear();
}

SetObj::~SetObj() { clear_object(*this); }

void SetObj::releaseChildren(std::vector<std::shared_ptr<Object>>& out) {
    index.clear();
    release_values(members, out);
}

void MethodObj::releaseChildren(std::vector<std::shared_ptr<Object>>& out) {
    if (self.obj) out.push_back(std::move(self.obj));
}

DictObj& dict_of(const Value& v) { return *static_cast<DictObj*>(v.obj.get()); }
SetObj& set_of(const Value& v) { return *static_cast<SetObj*>(v.obj.get()); }
RangeObj& range_of(const Value& v) { return *static_cast<RangeObj*>(v.obj.get()); }

// ---------------------------------------------------------------------------
// Nesting guard

namespace {

thread_local int g_nesting = 0;

struct NestingGuard {
    explicit NestingGuard(const char* where) {
        if (g_nesting >= kMaxNestingDepth) {
            throw ScriptError("RecursionError", std::string("maximum recursion depth exceeded ") + where);
        }
        g_nesting++;
    }
    ~NestingGuard() { g_nesting--; }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;
};

} // namespace

// ---------------------------------------------------------------------------
// Hashing

size_t ValueHash::operator()(const Value& v) const { return hash_value(v); }

bool ValueKeyEq::operator()(const Value& a, const Value& b) const { return values_equal(a, b); }

static size_t mix(size_t h, size_t v) {
    return h ^ (v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

size_t hash_value(const Value& v) {
    switch (v.kind) {
        case ValueKind::NONE: return 0x5bd1e995u;
        case ValueKind::BOOL:
        case ValueKind::INT: return std::hash<int64_t>()(v.asInt());
        case ValueKind::FLOAT: {
            // 2.0 and 2 must land in the same bucket.
            double ip = 0.0;
            if (std::isfinite(v.f) && std::modf(v.f, &ip) == 0.0 &&
                ip >= -9.2e18 && ip <= 9.2e18) {
                return std::hash<int64_t>()(static_cast<int64_t>(ip));
            }
            return std::hash<double>()(v.f);
        }
        case ValueKind::STR: return std::hash<std::string>()(v.s);
        case ValueKind::TUPLE: {
            NestingGuard guard("while hashing");
            size_t h = 0x345678u;
            for (const auto& e : v.items()) h = mix(h, hash_value(e));
            return h;
        }
        case ValueKind::FUNCTION:
        case ValueKind::BUILTIN:
        case ValueKind::MODULE:
            return std::hash<const void*>()(v.obj.get());
        default:
            break;
    }
    throw ScriptError("TypeError", "unhashable type: '" + type_name(v) + "'");
}

// ---------------------------------------------------------------------------
// Dict / set storage

const Value* DictObj::find(const Value& key) const {
    auto it = index.find(key);
    if (it == index.end()) return nullptr;
    return &entries[it->second].second;
}

void DictObj::put(const Value& key, const Value& value) {
    auto it = index.find(key);
    if (it != index.end()) {
        entries[it->second].second = value;
        return;
    }
    index.emplace(key, entries.size());
    entries.emplace_back(key, value);
}

bool DictObj::erase(const Value& key, Value* removed) {
    auto it = index.find(key);
    if (it == index.end()) return false;
    size_t pos = it->second;
    if (removed) *removed = entries[pos].second;
    entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(pos));
    index.clear();
    for (size_t k = 0; k < entries.size(); k++) index.emplace(entries[k].first, k);
    return true;
}

void DictObj::clear() {
    entries.clear();
    index.clear();
}

bool SetObj::add(const Value& v) {
    if (index.count(v)) return false;
    index.emplace(v, members.size());
    members.push_back(v);
    return true;
}

bool SetObj::erase(const Value& v) {
    auto it = index.find(v);
    if (it == index.end()) return false;
    size_t pos = it->second;
    members.erase(members.begin() + static_cast<std::ptrdiff_t>(pos));
    index.clear();
    for (size_t k = 0; k < members.size(); k++) index.emplace(members[k], k);
    return true;
}

int64_t RangeObj::length() const {
    if (step > 0 && start < stop) return (stop - start + step - 1) / step;
    if (step < 0 && start > stop) return (start - stop - step - 1) / (-step);
    return 0;
}

const Value* ModuleObj::attr(const std::string& n) const {
    for (const auto& kv : attrs) {
        if (kv.first == n) return &kv.second;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Equality / ordering

static bool seq_equal(const std::vector<Value>& a, const std::vector<Value>& b) {
    if (a.size() != b.size()) return false;
    for (size_t k = 0; k < a.size(); k++) {
        if (!values_equal(a[k], b[k])) return false;
    }
    return true;
}

bool values_equal(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        if (a.isIntegral() && b.isIntegral()) return a.asInt() == b.asInt();
        return a.asDouble() == b.asDouble();
    }
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case ValueKind::NONE: return true;
        case ValueKind::STR: return a.s == b.s;
        case ValueKind::LIST:
        case ValueKind::TUPLE: {
            if (a.obj == b.obj) return true;
            NestingGuard guard("in comparison");
            return seq_equal(a.items(), b.items());
        }
        case ValueKind::DICT: {
            if (a.obj == b.obj) return true;
            NestingGuard guard("in comparison");
            const auto& da = dict_of(a);
            const auto& db = dict_of(b);
            if (da.entries.size() != db.entries.size()) return false;
            for (const auto& kv : da.entries) {
                const Value* other = db.find(kv.first);
                if (!other || !values_equal(kv.second, *other)) return false;
            }
            return true;
        }
        case ValueKind::SET: {
            if (a.obj == b.obj) return true;
            NestingGuard guard("in comparison");
            const auto& sa = set_of(a);
            const auto& sb = set_of(b);
            if (sa.members.size() != sb.members.size()) return false;
            for (const auto& m : sa.members) {
                if (!sb.contains(m)) return false;
            }
            return true;
        }
        case ValueKind::RANGE: {
            const auto& ra = range_of(a);
            const auto& rb = range_of(b);
            int64_t n = ra.length();
            if (n != rb.length()) return false;
            if (n == 0) return true;
            if (ra.start != rb.start) return false;
            return n == 1 || ra.step == rb.step;
        }
        default:
            return a.obj == b.obj;
    }
}

static bool seq_less(const std::vector<Value>& a, const std::vector<Value>& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t k = 0; k < n; k++) {
        if (!values_equal(a[k], b[k])) return values_less(a[k], b[k]);
    }
    return a.size() < b.size();
}

bool values_less(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        if (a.isIntegral() && b.isIntegral()) return a.asInt() < b.asInt();
        return a.asDouble() < b.asDouble();
    }
    if (a.kind == b.kind) {
        if (a.kind == ValueKind::STR) return a.s < b.s;
        if (a.kind == ValueKind::LIST || a.kind == ValueKind::TUPLE) {
            NestingGuard guard("in comparison");
            return seq_less(a.items(), b.items());
        }
    }
    throw ScriptError("TypeError", "'<' not supported between instances of '" +
                                       type_name(a) + "' and '" + type_name(b) + "'");
}

bool truthy(const Value& v) {
    switch (v.kind) {
        case ValueKind::NONE: return false;
        case ValueKind::BOOL: return v.b;
        case ValueKind::INT: return v.i != 0;
        case ValueKind::FLOAT: return v.f != 0.0;
        case ValueKind::STR: return !v.s.empty();
        case ValueKind::LIST:
        case ValueKind::TUPLE: return !v.items().empty();
        case ValueKind::DICT: return !dict_of(v).entries.empty();
        case ValueKind::SET: return !set_of(v).members.empty();
        case ValueKind::RANGE: return range_of(v).length() > 0;
        default: return true;
    }
}

// ---------------------------------------------------------------------------
// Rendering

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    if (d == 0.0) return std::signbit(d) ? "-0.0" : "0.0";

    // Shortest round-tripping digit string, then Python's repr layout:
    // positional for exponents in [-4, 16), scientific otherwise.
    char buf[64];
    int digits = 1;
    for (; digits <= 17; digits++) {
        std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    std::string sci = buf;
    size_t epos = sci.find('e');
    int exp10 = std::atoi(sci.c_str() + epos + 1);

    if (exp10 >= -4 && exp10 < 16) {
        int decimals = digits - 1 - exp10;
        if (decimals < 1) decimals = 1;
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, d);
        std::string out = buf;
        // Trim padding zeros beyond the shortest representation, keep one.
        while (out.size() > 2 && out.back() == '0' && out[out.size() - 2] != '.') out.pop_back();
        return out;
    }
    return sci;
}

static std::string repr_str(const std::string& s) {
    char quote = '\'';
    if (s.find('\'') != std::string::npos && s.find('"') == std::string::npos) quote = '"';
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back(quote);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c == static_cast<unsigned char>(quote)) {
                    out.push_back('\\');
                    out.push_back(static_cast<char>(c));
                } else if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back(quote);
    return out;
}

namespace {

// Containers currently being rendered, innermost last.
thread_local std::vector<const Object*> g_repr_active;

struct ReprEnter {
    explicit ReprEnter(const Object* o) : guard("while getting the repr of an object") {
        recursive = std::find(g_repr_active.begin(), g_repr_active.end(), o) != g_repr_active.end();
        if (!recursive) g_repr_active.push_back(o);
    }
    ~ReprEnter() {
        if (!recursive) g_repr_active.pop_back();
    }

    NestingGuard guard;
    bool recursive{false};
};

} // namespace

std::string repr(const Value& v) {
    switch (v.kind) {
        case ValueKind::NONE: return "None";
        case ValueKind::BOOL: return v.b ? "True" : "False";
        case ValueKind::INT: return std::to_string(v.i);
        case ValueKind::FLOAT: return format_float(v.f);
        case ValueKind::STR: return repr_str(v.s);
        case ValueKind::LIST:
        case ValueKind::TUPLE: {
            bool tup = v.kind == ValueKind::TUPLE;
            ReprEnter enter(v.obj.get());
            if (enter.recursive) return tup ? "(...)" : "[...]";
            const auto& items = v.items();
            std::ostringstream oss;
            oss << (tup ? "(" : "[");
            for (size_t k = 0; k < items.size(); k++) {
                if (k) oss << ", ";
                oss << repr(items[k]);
            }
            if (tup && items.size() == 1) oss << ",";
            oss << (tup ? ")" : "]");
            return oss.str();
        }
        case ValueKind::DICT: {
            ReprEnter enter(v.obj.get());
            if (enter.recursive) return "{...}";
            std::ostringstream oss;
            oss << "{";
            bool first = true;
            for (const auto& kv : dict_of(v).entries) {
                if (!first) oss << ", ";
                first = false;
                oss << repr(kv.first) << ": " << repr(kv.second);
            }
            oss << "}";
            return oss.str();
        }
        case ValueKind::SET: {
            const auto& m = set_of(v).members;
            if (m.empty()) return "set()";
            ReprEnter enter(v.obj.get());
            if (enter.recursive) return "{...}";
            std::ostringstream oss;
            oss << "{";
            for (size_t k = 0; k < m.size(); k++) {
                if (k) oss << ", ";
                oss << repr(m[k]);
            }
            oss << "}";
            return oss.str();
        }
        case ValueKind::RANGE: {
            const auto& r = range_of(v);
            std::string out = "range(" + std::to_string(r.start) + ", " + std::to_string(r.stop);
            if (r.step != 1) out += ", " + std::to_string(r.step);
            return out + ")";
        }
        case ValueKind::BUILTIN:
            return "<built-in function " + static_cast<BuiltinObj*>(v.obj.get())->name + ">";
        case ValueKind::METHOD:
            return "<bound method " + static_cast<MethodObj*>(v.obj.get())->name + ">";
        case ValueKind::MODULE:
            return "<module '" + static_cast<ModuleObj*>(v.obj.get())->name + "'>";
        case ValueKind::FUNCTION:
            return "<function>";
    }
    return "<object>";
}

std::string to_display(const Value& v) {
    if (v.kind == ValueKind::STR) return v.s;
    return repr(v);
}

} // namespace evosynth
