#include "evosynth/builtins.h"
#include "evosynth/interp.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <numeric>
#include <unordered_map>

namespace evosynth {

namespace {

using MethodImpl = Value (*)(Interpreter& in, const Value& self, std::vector<Value>& args, const KwArgs& kw);

// ---------------------------------------------------------------------------
// Argument helpers

void arity(const std::string& fname, const std::vector<Value>& args, size_t lo, size_t hi) {
    if (args.size() >= lo && args.size() <= hi) return;
    std::string expected;
    if (lo == hi) expected = std::to_string(lo);
    else if (args.size() < lo) expected = "at least " + std::to_string(lo);
    else expected = "at most " + std::to_string(hi);
    throw ScriptError("TypeError", fname + "() expected " + expected + " argument" + (expected == "1" ? "" : "s") +
                                       ", got " + std::to_string(args.size()));
}

void check_kwargs(const std::string& fname, const KwArgs& kw, std::initializer_list<const char*> allowed) {
    for (const auto& k : kw) {
        bool ok = false;
        for (const char* a : allowed) {
            if (k.name == a) ok = true;
        }
        if (!ok) throw ScriptError("TypeError", fname + "() got an unexpected keyword argument '" + k.name + "'");
    }
}

const Value* find_kw(const KwArgs& kw, const char* name) {
    for (const auto& k : kw) {
        if (k.name == name) return &k.value;
    }
    return nullptr;
}

int64_t as_index(const Value& v) {
    if (!v.isIntegral()) {
        throw ScriptError("TypeError", "'" + type_name(v) + "' object cannot be interpreted as an integer");
    }
    return v.asInt();
}

const std::string& as_str(const Value& v, const std::string& context) {
    if (v.kind != ValueKind::STR) {
        throw ScriptError("TypeError", context + " must be str, not " + type_name(v));
    }
    return v.s;
}

int64_t float_to_int(double d) {
    if (std::isnan(d)) throw ScriptError("ValueError", "cannot convert float NaN to integer");
    if (std::isinf(d)) throw ScriptError("OverflowError", "cannot convert float infinity to integer");
    if (d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
        throw ScriptError("OverflowError", "integer overflow");
    }
    return static_cast<int64_t>(d);
}

Value make_builtin(const std::string& name, NativeFn fn) {
    auto b = std::make_shared<BuiltinObj>();
    b->name = name;
    b->fn = std::move(fn);
    Value v;
    v.kind = ValueKind::BUILTIN;
    v.obj = std::move(b);
    return v;
}

Value make_tuple2(Value a, Value b) {
    std::vector<Value> items;
    items.reserve(2);
    items.push_back(std::move(a));
    items.push_back(std::move(b));
    return Value::tuple(std::move(items));
}

void sort_values(Interpreter& in, std::vector<Value>& items, const Value* key, bool reverse) {
    if (!key || key->isNone()) {
        std::stable_sort(items.begin(), items.end(), [&](const Value& a, const Value& b) {
            in.tick();
            return reverse ? values_less(b, a) : values_less(a, b);
        });
        return;
    }
    std::vector<std::pair<Value, Value>> keyed;
    keyed.reserve(items.size());
    for (const auto& x : items) keyed.emplace_back(in.call(*key, std::vector<Value>{x}), x);
    std::stable_sort(keyed.begin(), keyed.end(), [&](const std::pair<Value, Value>& a, const std::pair<Value, Value>& b) {
        in.tick();
        return reverse ? values_less(b.first, a.first) : values_less(a.first, b.first);
    });
    for (size_t k = 0; k < keyed.size(); k++) items[k] = std::move(keyed[k].second);
}

void update_dict(Interpreter& in, const Value& d, const Value& src) {
    if (src.kind == ValueKind::DICT) {
        for (const auto& kv : dict_of(src).entries) dict_of(d).put(kv.first, kv.second);
        return;
    }
    std::vector<Value> elems = in.iterate(src);
    for (size_t k = 0; k < elems.size(); k++) {
        const Value& e = elems[k];
        std::vector<Value> pair;
        if (e.isSequence()) pair = e.items();
        else if (e.kind == ValueKind::STR) pair = in.iterate(e);
        else {
            throw ScriptError("TypeError", "cannot convert dictionary update sequence element #" +
                                               std::to_string(k) + " to a sequence");
        }
        if (pair.size() != 2) {
            throw ScriptError("ValueError", "dictionary update sequence element #" + std::to_string(k) +
                                                " has length " + std::to_string(pair.size()) + "; 2 is required");
        }
        dict_of(d).put(pair[0], pair[1]);
    }
    in.checkItems(dict_of(d).entries.size());
}

// ---------------------------------------------------------------------------
// Numeric conversion

int64_t parse_int(const std::string& text, int base) {
    std::string invalid = "invalid literal for int() with base " + std::to_string(base) + ": " + repr(Value::str(text));
    size_t i = 0;
    size_t n = text.size();
    while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) i++;
    while (n > i && std::isspace(static_cast<unsigned char>(text[n - 1]))) n--;
    bool neg = false;
    if (i < n && (text[i] == '+' || text[i] == '-')) {
        neg = text[i] == '-';
        i++;
    }
    if (i + 1 < n && text[i] == '0') {
        char p = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i + 1])));
        int pb = p == 'x' ? 16 : (p == 'o' ? 8 : (p == 'b' ? 2 : 0));
        if (pb != 0 && (base == 0 || base == pb)) {
            base = pb;
            i += 2;
        }
    }
    if (base == 0) base = 10;
    if (i >= n) throw ScriptError("ValueError", invalid);

    // Accumulate negatively so INT64_MIN parses.
    int64_t acc = 0;
    bool prev_digit = false;
    for (size_t k = i; k < n; k++) {
        char c = text[k];
        if (c == '_' && prev_digit && k + 1 < n) {
            prev_digit = false;
            continue;
        }
        int d = -1;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (std::isalpha(static_cast<unsigned char>(c))) d = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        if (d < 0 || d >= base) throw ScriptError("ValueError", invalid);
        if (__builtin_mul_overflow(acc, static_cast<int64_t>(base), &acc) ||
            __builtin_sub_overflow(acc, static_cast<int64_t>(d), &acc)) {
            throw ScriptError("OverflowError", "integer overflow");
        }
        prev_digit = true;
    }
    if (!prev_digit) throw ScriptError("ValueError", invalid);
    if (neg) return acc;
    if (acc == INT64_MIN) throw ScriptError("OverflowError", "integer overflow");
    return -acc;
}

double parse_float(const std::string& text) {
    std::string invalid = "could not convert string to float: " + repr(Value::str(text));
    size_t i = 0;
    size_t n = text.size();
    while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) i++;
    while (n > i && std::isspace(static_cast<unsigned char>(text[n - 1]))) n--;
    std::string body = text.substr(i, n - i);
    std::string lower;
    for (char c : body) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    std::string unsigned_part = lower;
    double sign = 1.0;
    if (!unsigned_part.empty() && (unsigned_part[0] == '+' || unsigned_part[0] == '-')) {
        if (unsigned_part[0] == '-') sign = -1.0;
        unsigned_part.erase(0, 1);
    }
    if (unsigned_part == "inf" || unsigned_part == "infinity") return sign * HUGE_VAL;
    if (unsigned_part == "nan") return std::nan("");

    std::string cleaned;
    for (char c : body) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
            cleaned.push_back(c);
        } else if (c != '_') {
            throw ScriptError("ValueError", invalid);
        }
    }
    if (cleaned.empty()) throw ScriptError("ValueError", invalid);
    char* end = nullptr;
    double d = std::strtod(cleaned.c_str(), &end);
    if (end != cleaned.c_str() + cleaned.size()) throw ScriptError("ValueError", invalid);
    return d;
}

Value round_value(const Value& x, const Value* ndigits) {
    if (!x.isNumber()) throw ScriptError("TypeError", "type " + type_name(x) + " doesn't define __round__ method");
    if (!ndigits || ndigits->isNone()) {
        if (x.isIntegral()) return Value::integer(x.asInt());
        return Value::integer(float_to_int(std::nearbyint(x.f)));
    }
    int64_t n = as_index(*ndigits);
    if (x.isIntegral()) {
        int64_t v = x.asInt();
        if (n >= 0) return Value::integer(v);
        if (n < -18) return Value::integer(0);
        int64_t p = 1;
        for (int64_t k = 0; k < -n; k++) p *= 10;
        int64_t q = v / p;
        int64_t r = v % p;
        if (r < 0) {
            q -= 1;
            r += p;
        }
        if (2 * r > p || (2 * r == p && (q & 1))) q += 1;
        int64_t out;
        if (__builtin_mul_overflow(q, p, &out)) throw ScriptError("OverflowError", "integer overflow");
        return Value::integer(out);
    }
    double d = x.f;
    if (!std::isfinite(d) || n > 300) return Value::real(d);
    if (n < -308) return Value::real(std::copysign(0.0, d));
    double p = std::pow(10.0, static_cast<double>(n));
    double scaled = d * p;
    if (!std::isfinite(scaled)) return Value::real(d);
    return Value::real(std::nearbyint(scaled) / p);
}

Value abs_value(const Value& x) {
    if (x.isIntegral()) {
        int64_t v = x.asInt();
        if (v == INT64_MIN) throw ScriptError("OverflowError", "integer overflow");
        return Value::integer(v < 0 ? -v : v);
    }
    if (x.kind == ValueKind::FLOAT) return Value::real(std::fabs(x.f));
    throw ScriptError("TypeError", "bad operand type for abs(): '" + type_name(x) + "'");
}

int64_t length_of(const Value& v) {
    switch (v.kind) {
        case ValueKind::STR: return static_cast<int64_t>(v.s.size());
        case ValueKind::LIST:
        case ValueKind::TUPLE: return static_cast<int64_t>(v.items().size());
        case ValueKind::DICT: return static_cast<int64_t>(dict_of(v).entries.size());
        case ValueKind::SET: return static_cast<int64_t>(set_of(v).members.size());
        case ValueKind::RANGE: return range_of(v).length();
        default:
            throw ScriptError("TypeError", "object of type '" + type_name(v) + "' has no len()");
    }
}

Value extremum(Interpreter& in, const std::string& fname, std::vector<Value>& args, const KwArgs& kw, bool want_max) {
    check_kwargs(fname, kw, {"key", "default"});
    const Value* key = find_kw(kw, "key");
    if (key && key->isNone()) key = nullptr;
    const Value* dflt = find_kw(kw, "default");

    std::vector<Value> items;
    if (args.size() == 1) {
        items = in.iterate(args[0]);
    } else if (args.size() >= 2) {
        if (dflt) {
            throw ScriptError("TypeError", "Cannot specify a default for " + fname + "() with multiple positional arguments");
        }
        items = args;
    } else {
        throw ScriptError("TypeError", fname + " expected at least 1 argument, got 0");
    }
    if (items.empty()) {
        if (dflt) return *dflt;
        throw ScriptError("ValueError", fname + "() arg is an empty sequence");
    }

    Value best = items[0];
    Value best_key = key ? in.call(*key, std::vector<Value>{best}) : best;
    for (size_t k = 1; k < items.size(); k++) {
        Value kv = key ? in.call(*key, std::vector<Value>{items[k]}) : items[k];
        bool better = want_max ? values_less(best_key, kv) : values_less(kv, best_key);
        if (better) {
            best = items[k];
            best_key = std::move(kv);
        }
    }
    return best;
}

int64_t mod_pow(int64_t base, int64_t exp, int64_t mod) {
    if (mod == 0) throw ScriptError("ValueError", "pow() 3rd argument cannot be 0");
    if (exp < 0) throw ScriptError("ValueError", "pow() negative exponent with modulus is not supported");
    __int128 m = mod < 0 ? -static_cast<__int128>(mod) : mod;
    __int128 result = 1 % m;
    __int128 b = static_cast<__int128>(base) % m;
    if (b < 0) b += m;
    while (exp > 0) {
        if (exp & 1) result = (result * b) % m;
        b = (b * b) % m;
        exp >>= 1;
    }
    // Sign follows the modulus.
    if (mod < 0 && result != 0) result -= m;
    return static_cast<int64_t>(result);
}

// ---------------------------------------------------------------------------
// Built-in functions

std::unordered_map<std::string, Value> build_builtins() {
    std::unordered_map<std::string, Value> t;
    auto def = [&t](const std::string& name, NativeFn fn) { t.emplace(name, make_builtin(name, std::move(fn))); };

    def("abs", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("abs", kw, {});
        arity("abs", a, 1, 1);
        return abs_value(a[0]);
    });
    def("all", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("all", kw, {});
        arity("all", a, 1, 1);
        bool result = true;
        in.forEach(a[0], [&](const Value& x) {
            if (!truthy(x)) result = false;
            return result;
        });
        return Value::boolean(result);
    });
    def("any", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("any", kw, {});
        arity("any", a, 1, 1);
        bool result = false;
        in.forEach(a[0], [&](const Value& x) {
            if (truthy(x)) result = true;
            return !result;
        });
        return Value::boolean(result);
    });
    def("bool", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("bool", kw, {});
        arity("bool", a, 0, 1);
        return Value::boolean(!a.empty() && truthy(a[0]));
    });
    def("callable", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("callable", kw, {});
        arity("callable", a, 1, 1);
        return Value::boolean(a[0].isCallable());
    });
    def("dict", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        arity("dict", a, 0, 1);
        Value out = Value::dict();
        if (!a.empty()) update_dict(in, out, a[0]);
        for (const auto& k : kw) dict_of(out).put(Value::str(k.name), k.value);
        return out;
    });
    def("enumerate", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("enumerate", kw, {"start"});
        arity("enumerate", a, 1, 2);
        int64_t start = 0;
        if (a.size() == 2) start = as_index(a[1]);
        else if (const Value* s = find_kw(kw, "start")) start = as_index(*s);
        std::vector<Value> out;
        in.forEach(a[0], [&](const Value& x) {
            out.push_back(make_tuple2(Value::integer(start++), x));
            in.checkItems(out.size());
            return true;
        });
        return Value::list(std::move(out));
    });
    def("filter", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("filter", kw, {});
        arity("filter", a, 2, 2);
        std::vector<Value> out;
        in.forEach(a[1], [&](const Value& x) {
            bool keep = a[0].isNone() ? truthy(x) : truthy(in.call(a[0], std::vector<Value>{x}));
            if (keep) out.push_back(x);
            return true;
        });
        return Value::list(std::move(out));
    });
    def("float", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("float", kw, {});
        arity("float", a, 0, 1);
        if (a.empty()) return Value::real(0.0);
        if (a[0].isNumber()) return Value::real(a[0].asDouble());
        if (a[0].kind == ValueKind::STR) return Value::real(parse_float(a[0].s));
        throw ScriptError("TypeError", "float() argument must be a string or a real number, not '" +
                                           type_name(a[0]) + "'");
    });
    def("int", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("int", kw, {"base"});
        arity("int", a, 0, 2);
        const Value* base_v = a.size() == 2 ? &a[1] : find_kw(kw, "base");
        if (a.empty()) return Value::integer(0);
        if (base_v) {
            if (a[0].kind != ValueKind::STR) {
                throw ScriptError("TypeError", "int() can't convert non-string with explicit base");
            }
            int64_t base = as_index(*base_v);
            if (base != 0 && (base < 2 || base > 36)) {
                throw ScriptError("ValueError", "int() base must be >= 2 and <= 36, or 0");
            }
            return Value::integer(parse_int(a[0].s, static_cast<int>(base)));
        }
        if (a[0].isIntegral()) return Value::integer(a[0].asInt());
        if (a[0].kind == ValueKind::FLOAT) return Value::integer(float_to_int(std::trunc(a[0].f)));
        if (a[0].kind == ValueKind::STR) return Value::integer(parse_int(a[0].s, 10));
        throw ScriptError("TypeError", "int() argument must be a string or a real number, not '" +
                                           type_name(a[0]) + "'");
    });
    def("len", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("len", kw, {});
        arity("len", a, 1, 1);
        return Value::integer(length_of(a[0]));
    });
    def("list", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("list", kw, {});
        arity("list", a, 0, 1);
        return Value::list(a.empty() ? std::vector<Value>{} : in.iterate(a[0]));
    });
    def("tuple", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("tuple", kw, {});
        arity("tuple", a, 0, 1);
        return Value::tuple(a.empty() ? std::vector<Value>{} : in.iterate(a[0]));
    });
    def("set", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("set", kw, {});
        arity("set", a, 0, 1);
        Value out = Value::set();
        if (!a.empty()) {
            in.forEach(a[0], [&](const Value& x) {
                set_of(out).add(x);
                return true;
            });
            in.checkItems(set_of(out).members.size());
        }
        return out;
    });
    def("map", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("map", kw, {});
        if (a.size() < 2) throw ScriptError("TypeError", "map() must have at least two arguments.");
        std::vector<std::vector<Value>> columns;
        size_t n = SIZE_MAX;
        for (size_t k = 1; k < a.size(); k++) {
            columns.push_back(in.iterate(a[k]));
            n = std::min(n, columns.back().size());
        }
        std::vector<Value> out;
        out.reserve(n);
        for (size_t r = 0; r < n; r++) {
            std::vector<Value> call_args;
            for (const auto& col : columns) call_args.push_back(col[r]);
            out.push_back(in.call(a[0], std::move(call_args)));
        }
        return Value::list(std::move(out));
    });
    def("max", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        return extremum(in, "max", a, kw, true);
    });
    def("min", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        return extremum(in, "min", a, kw, false);
    });
    def("pow", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("pow", kw, {});
        arity("pow", a, 2, 3);
        if (a.size() == 3 && !a[2].isNone()) {
            if (!a[0].isIntegral() || !a[1].isIntegral() || !a[2].isIntegral()) {
                throw ScriptError("TypeError", "pow() 3rd argument not allowed unless all arguments are integers");
            }
            return Value::integer(mod_pow(a[0].asInt(), a[1].asInt(), a[2].asInt()));
        }
        return binary_op(in, BinaryOp::POW, a[0], a[1]);
    });
    def("range", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("range", kw, {});
        arity("range", a, 1, 3);
        int64_t start = 0;
        int64_t stop = 0;
        int64_t step = 1;
        if (a.size() == 1) {
            stop = as_index(a[0]);
        } else {
            start = as_index(a[0]);
            stop = as_index(a[1]);
            if (a.size() == 3) step = as_index(a[2]);
        }
        if (step == 0) throw ScriptError("ValueError", "range() arg 3 must not be zero");
        return Value::range(start, stop, step);
    });
    def("reversed", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("reversed", kw, {});
        arity("reversed", a, 1, 1);
        if (a[0].kind == ValueKind::SET) throw ScriptError("TypeError", "'set' object is not reversible");
        std::vector<Value> items = in.iterate(a[0]);
        std::reverse(items.begin(), items.end());
        return Value::list(std::move(items));
    });
    def("round", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("round", kw, {"ndigits"});
        arity("round", a, 1, 2);
        const Value* nd = a.size() == 2 ? &a[1] : find_kw(kw, "ndigits");
        return round_value(a[0], nd);
    });
    def("sorted", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("sorted", kw, {"key", "reverse"});
        arity("sorted", a, 1, 1);
        std::vector<Value> items = in.iterate(a[0]);
        const Value* rev = find_kw(kw, "reverse");
        sort_values(in, items, find_kw(kw, "key"), rev && truthy(*rev));
        return Value::list(std::move(items));
    });
    def("str", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("str", kw, {});
        arity("str", a, 0, 1);
        if (a.empty()) return Value::str("");
        std::string s = to_display(a[0]);
        in.checkBytes(s.size());
        return Value::str(std::move(s));
    });
    def("sum", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("sum", kw, {"start"});
        arity("sum", a, 1, 2);
        Value acc = Value::integer(0);
        if (a.size() == 2) acc = a[1];
        else if (const Value* s = find_kw(kw, "start")) acc = *s;
        if (acc.kind == ValueKind::STR) {
            throw ScriptError("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
        }
        in.forEach(a[0], [&](const Value& x) {
            acc = binary_op(in, BinaryOp::ADD, acc, x);
            return true;
        });
        return acc;
    });
    def("zip", [](Interpreter& in, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("zip", kw, {});
        std::vector<std::vector<Value>> columns;
        size_t n = a.empty() ? 0 : SIZE_MAX;
        for (const auto& it : a) {
            columns.push_back(in.iterate(it));
            n = std::min(n, columns.back().size());
        }
        std::vector<Value> out;
        out.reserve(n);
        for (size_t r = 0; r < n; r++) {
            std::vector<Value> row;
            for (const auto& col : columns) row.push_back(col[r]);
            out.push_back(Value::tuple(std::move(row)));
        }
        return Value::list(std::move(out));
    });
    def("ord", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("ord", kw, {});
        arity("ord", a, 1, 1);
        const std::string& s = as_str(a[0], "ord() argument");
        if (s.size() != 1) {
            throw ScriptError("TypeError", "ord() expected a character, but string of length " +
                                               std::to_string(s.size()) + " found");
        }
        return Value::integer(static_cast<unsigned char>(s[0]));
    });
    def("chr", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("chr", kw, {});
        arity("chr", a, 1, 1);
        int64_t c = as_index(a[0]);
        if (c < 0 || c > 255) throw ScriptError("ValueError", "chr() arg not in range(256)");
        return Value::str(std::string(1, static_cast<char>(c)));
    });
    return t;
}

const std::unordered_map<std::string, Value>& builtin_table() {
    static const std::unordered_map<std::string, Value> table = build_builtins();
    return table;
}

// ---------------------------------------------------------------------------
// math module

double num_arg(const std::string& fname, const Value& v) {
    if (!v.isNumber()) throw ScriptError("TypeError", fname + "() must be a real number, not " + type_name(v));
    return v.asDouble();
}

Value math_unary(const std::string& fname, std::vector<Value>& a, double (*f)(double), bool positive_domain) {
    arity(fname, a, 1, 1);
    double x = num_arg(fname, a[0]);
    if (positive_domain && x <= 0.0) throw ScriptError("ValueError", "math domain error");
    double r = f(x);
    if (std::isnan(r) && !std::isnan(x)) throw ScriptError("ValueError", "math domain error");
    if (std::isinf(r) && std::isfinite(x)) throw ScriptError("OverflowError", "math range error");
    return Value::real(r);
}

int64_t gcd_int(int64_t a, int64_t b) {
    if (a == INT64_MIN || b == INT64_MIN) throw ScriptError("OverflowError", "integer overflow");
    a = a < 0 ? -a : a;
    b = b < 0 ? -b : b;
    while (b != 0) {
        int64_t t = a % b;
        a = b;
        b = t;
    }
    return a;
}

Value build_math() {
    auto mod = std::make_shared<ModuleObj>();
    mod->name = "math";
    auto fn = [&mod](const std::string& name, NativeFn f) { mod->attrs.emplace_back(name, make_builtin(name, std::move(f))); };

    fn("sqrt", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("sqrt", kw, {});
        arity("sqrt", a, 1, 1);
        double x = num_arg("sqrt", a[0]);
        if (x < 0.0) throw ScriptError("ValueError", "math domain error");
        return Value::real(std::sqrt(x));
    });
    fn("floor", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("floor", kw, {});
        arity("floor", a, 1, 1);
        if (a[0].isIntegral()) return Value::integer(a[0].asInt());
        return Value::integer(float_to_int(std::floor(num_arg("floor", a[0]))));
    });
    fn("ceil", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("ceil", kw, {});
        arity("ceil", a, 1, 1);
        if (a[0].isIntegral()) return Value::integer(a[0].asInt());
        return Value::integer(float_to_int(std::ceil(num_arg("ceil", a[0]))));
    });
    fn("fabs", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("fabs", kw, {});
        arity("fabs", a, 1, 1);
        return Value::real(std::fabs(num_arg("fabs", a[0])));
    });
    fn("gcd", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("gcd", kw, {});
        int64_t g = 0;
        for (const auto& v : a) g = gcd_int(g, as_index(v));
        return Value::integer(g);
    });
    fn("isqrt", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("isqrt", kw, {});
        arity("isqrt", a, 1, 1);
        int64_t n = as_index(a[0]);
        if (n < 0) throw ScriptError("ValueError", "isqrt() argument must be nonnegative");
        int64_t r = static_cast<int64_t>(std::sqrt(static_cast<double>(n)));
        while (r > 0 && static_cast<__int128>(r) * r > n) r--;
        while (static_cast<__int128>(r + 1) * (r + 1) <= n) r++;
        return Value::integer(r);
    });
    fn("log", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("log", kw, {});
        arity("log", a, 1, 2);
        double x = num_arg("log", a[0]);
        if (x <= 0.0) throw ScriptError("ValueError", "math domain error");
        if (a.size() == 1) return Value::real(std::log(x));
        double base = num_arg("log", a[1]);
        if (base <= 0.0) throw ScriptError("ValueError", "math domain error");
        double den = std::log(base);
        if (den == 0.0) throw ScriptError("ZeroDivisionError", "float division by zero");
        return Value::real(std::log(x) / den);
    });
    fn("log2", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("log2", kw, {});
        return math_unary("log2", a, [](double x) { return std::log2(x); }, true);
    });
    fn("log10", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("log10", kw, {});
        return math_unary("log10", a, [](double x) { return std::log10(x); }, true);
    });
    fn("exp", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("exp", kw, {});
        return math_unary("exp", a, [](double x) { return std::exp(x); }, false);
    });
    fn("sin", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("sin", kw, {});
        return math_unary("sin", a, [](double x) { return std::sin(x); }, false);
    });
    fn("cos", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("cos", kw, {});
        return math_unary("cos", a, [](double x) { return std::cos(x); }, false);
    });
    fn("tan", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("tan", kw, {});
        return math_unary("tan", a, [](double x) { return std::tan(x); }, false);
    });
    fn("pow", [](Interpreter&, std::vector<Value>& a, const KwArgs& kw) {
        check_kwargs("pow", kw, {});
        arity("pow", a, 2, 2);
        double x = num_arg("pow", a[0]);
        double y = num_arg("pow", a[1]);
        if ((x == 0.0 && y < 0.0) || (x < 0.0 && std::isfinite(y) && std::floor(y) != y)) {
            throw ScriptError("ValueError", "math domain error");
        }
        double r = std::pow(x, y);
        if (std::isinf(r) && std::isfinite(x) && std::isfinite(y)) {
            throw ScriptError("OverflowError", "math range error");
        }
        return Value::real(r);
    });
    mod->attrs.emplace_back("pi", Value::real(3.141592653589793));
    mod->attrs.emplace_back("e", Value::real(2.718281828459045));
    mod->attrs.emplace_back("inf", Value::real(HUGE_VAL));

    Value v;
    v.kind = ValueKind::MODULE;
    v.obj = mod;
    return v;
}

// ---------------------------------------------------------------------------
// str methods

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

Value str_split(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("split", kw, {"sep", "maxsplit"});
    arity("split", a, 0, 2);
    const Value* sep_v = !a.empty() ? &a[0] : find_kw(kw, "sep");
    const Value* max_v = a.size() == 2 ? &a[1] : find_kw(kw, "maxsplit");
    int64_t maxsplit = max_v ? as_index(*max_v) : -1;
    const std::string& s = self.s;
    std::vector<Value> out;

    if (!sep_v || sep_v->isNone()) {
        size_t i = 0;
        while (true) {
            while (i < s.size() && is_space(s[i])) i++;
            if (i >= s.size()) break;
            if (maxsplit >= 0 && static_cast<int64_t>(out.size()) == maxsplit) {
                size_t end = s.size();
                while (end > i && is_space(s[end - 1])) end--;
                out.push_back(Value::str(s.substr(i, end - i)));
                break;
            }
            size_t j = i;
            while (j < s.size() && !is_space(s[j])) j++;
            out.push_back(Value::str(s.substr(i, j - i)));
            i = j;
        }
    } else {
        const std::string& sep = as_str(*sep_v, "separator");
        if (sep.empty()) throw ScriptError("ValueError", "empty separator");
        size_t i = 0;
        while (true) {
            size_t j = s.find(sep, i);
            if (j == std::string::npos || (maxsplit >= 0 && static_cast<int64_t>(out.size()) == maxsplit)) {
                out.push_back(Value::str(s.substr(i)));
                break;
            }
            out.push_back(Value::str(s.substr(i, j - i)));
            i = j + sep.size();
        }
    }
    in.checkItems(out.size());
    return Value::list(std::move(out));
}

Value str_join(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("join", kw, {});
    arity("join", a, 1, 1);
    std::string out;
    size_t k = 0;
    in.forEach(a[0], [&](const Value& x) {
        if (x.kind != ValueKind::STR) {
            throw ScriptError("TypeError", "sequence item " + std::to_string(k) + ": expected str instance, " +
                                               type_name(x) + " found");
        }
        if (k++) out += self.s;
        out += x.s;
        in.checkBytes(out.size());
        return true;
    });
    return Value::str(std::move(out));
}

std::string strip_chars(const std::string& s, const Value* chars, bool left, bool right) {
    auto strip_this = [&](char c) {
        if (!chars || chars->isNone()) return is_space(c);
        return as_str(*chars, "strip arg").find(c) != std::string::npos;
    };
    size_t i = 0;
    size_t j = s.size();
    if (left) while (i < j && strip_this(s[i])) i++;
    if (right) while (j > i && strip_this(s[j - 1])) j--;
    return s.substr(i, j - i);
}

Value str_strip(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("strip", kw, {});
    arity("strip", a, 0, 1);
    return Value::str(strip_chars(self.s, a.empty() ? nullptr : &a[0], true, true));
}

Value str_lstrip(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("lstrip", kw, {});
    arity("lstrip", a, 0, 1);
    return Value::str(strip_chars(self.s, a.empty() ? nullptr : &a[0], true, false));
}

Value str_rstrip(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("rstrip", kw, {});
    arity("rstrip", a, 0, 1);
    return Value::str(strip_chars(self.s, a.empty() ? nullptr : &a[0], false, true));
}

Value str_lower(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("lower", kw, {});
    arity("lower", a, 0, 0);
    std::string out = self.s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return Value::str(std::move(out));
}

Value str_upper(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("upper", kw, {});
    arity("upper", a, 0, 0);
    std::string out = self.s;
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return Value::str(std::move(out));
}

Value str_capitalize(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("capitalize", kw, {});
    arity("capitalize", a, 0, 0);
    std::string out = self.s;
    for (size_t k = 0; k < out.size(); k++) {
        unsigned char c = static_cast<unsigned char>(out[k]);
        out[k] = static_cast<char>(k == 0 ? std::toupper(c) : std::tolower(c));
    }
    return Value::str(std::move(out));
}

Value str_title(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("title", kw, {});
    arity("title", a, 0, 0);
    std::string out = self.s;
    bool prev_cased = false;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        ch = static_cast<char>(prev_cased ? std::tolower(c) : std::toupper(c));
        prev_cased = std::isalpha(c) != 0;
    }
    return Value::str(std::move(out));
}

Value str_replace(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("replace", kw, {});
    arity("replace", a, 2, 3);
    const std::string& from = as_str(a[0], "replace() argument 1");
    const std::string& to = as_str(a[1], "replace() argument 2");
    int64_t count = a.size() == 3 ? as_index(a[2]) : -1;
    const std::string& s = self.s;
    std::string out;
    int64_t done = 0;
    if (from.empty()) {
        for (size_t k = 0; k <= s.size(); k++) {
            if (count < 0 || done < count) {
                out += to;
                done++;
            }
            if (k < s.size()) out.push_back(s[k]);
            in.checkBytes(out.size());
        }
        return Value::str(std::move(out));
    }
    size_t i = 0;
    while (true) {
        size_t j = (count >= 0 && done >= count) ? std::string::npos : s.find(from, i);
        if (j == std::string::npos) {
            out.append(s, i, std::string::npos);
            break;
        }
        out.append(s, i, j - i);
        out += to;
        in.checkBytes(out.size());
        i = j + from.size();
        done++;
    }
    in.checkBytes(out.size());
    return Value::str(std::move(out));
}

bool affix_match(const std::string& s, const Value& affix, bool prefix) {
    auto one = [&](const Value& v) {
        const std::string& p = as_str(v, prefix ? "startswith arg" : "endswith arg");
        if (p.size() > s.size()) return false;
        return prefix ? s.compare(0, p.size(), p) == 0 : s.compare(s.size() - p.size(), p.size(), p) == 0;
    };
    if (affix.kind == ValueKind::TUPLE) {
        for (const auto& v : affix.items()) {
            if (one(v)) return true;
        }
        return false;
    }
    return one(affix);
}

Value str_startswith(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("startswith", kw, {});
    arity("startswith", a, 1, 1);
    return Value::boolean(affix_match(self.s, a[0], true));
}

Value str_endswith(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("endswith", kw, {});
    arity("endswith", a, 1, 1);
    return Value::boolean(affix_match(self.s, a[0], false));
}

// Resolves optional [start, end] arguments against a length.
void search_bounds(const std::vector<Value>& a, size_t first, size_t n, size_t* lo, size_t* hi) {
    int64_t len = static_cast<int64_t>(n);
    auto clamp = [len](int64_t x) {
        if (x < 0) x += len;
        if (x < 0) x = 0;
        if (x > len) x = len;
        return static_cast<size_t>(x);
    };
    *lo = a.size() > first && !a[first].isNone() ? clamp(as_index(a[first])) : 0;
    *hi = a.size() > first + 1 && !a[first + 1].isNone() ? clamp(as_index(a[first + 1])) : n;
}

int64_t str_find_impl(const Value& self, const std::vector<Value>& a, bool reverse) {
    const std::string& sub = as_str(a[0], "find arg");
    size_t lo = 0;
    size_t hi = 0;
    search_bounds(a, 1, self.s.size(), &lo, &hi);
    if (hi < lo || hi - lo < sub.size()) return -1;
    std::string window = self.s.substr(lo, hi - lo);
    size_t pos = reverse ? window.rfind(sub) : window.find(sub);
    return pos == std::string::npos ? -1 : static_cast<int64_t>(lo + pos);
}

Value str_find(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("find", kw, {});
    arity("find", a, 1, 3);
    return Value::integer(str_find_impl(self, a, false));
}

Value str_rfind(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("rfind", kw, {});
    arity("rfind", a, 1, 3);
    return Value::integer(str_find_impl(self, a, true));
}

Value str_index(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("index", kw, {});
    arity("index", a, 1, 3);
    int64_t pos = str_find_impl(self, a, false);
    if (pos < 0) throw ScriptError("ValueError", "substring not found");
    return Value::integer(pos);
}

Value str_count(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("count", kw, {});
    arity("count", a, 1, 3);
    const std::string& sub = as_str(a[0], "count arg");
    size_t lo = 0;
    size_t hi = 0;
    search_bounds(a, 1, self.s.size(), &lo, &hi);
    if (hi < lo) return Value::integer(0);
    if (sub.empty()) return Value::integer(static_cast<int64_t>(hi - lo + 1));
    int64_t n = 0;
    size_t i = lo;
    while (true) {
        size_t j = self.s.find(sub, i);
        if (j == std::string::npos || j + sub.size() > hi) break;
        n++;
        i = j + sub.size();
    }
    return Value::integer(n);
}

bool char_digit(unsigned char c) { return std::isdigit(c) != 0; }
bool char_alpha(unsigned char c) { return std::isalpha(c) != 0; }
bool char_alnum(unsigned char c) { return std::isalnum(c) != 0; }
bool char_space(unsigned char c) { return std::isspace(c) != 0; }

Value str_is_all(const char* fname, const Value& self, std::vector<Value>& a, const KwArgs& kw,
                 bool (*pred)(unsigned char)) {
    check_kwargs(fname, kw, {});
    arity(fname, a, 0, 0);
    if (self.s.empty()) return Value::boolean(false);
    for (char c : self.s) {
        if (!pred(static_cast<unsigned char>(c))) return Value::boolean(false);
    }
    return Value::boolean(true);
}

Value str_isdigit(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    return str_is_all("isdigit", self, a, kw, char_digit);
}

Value str_isalpha(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    return str_is_all("isalpha", self, a, kw, char_alpha);
}

Value str_isalnum(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    return str_is_all("isalnum", self, a, kw, char_alnum);
}

Value str_isspace(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    return str_is_all("isspace", self, a, kw, char_space);
}

Value str_case_check(const char* fname, const Value& self, std::vector<Value>& a, const KwArgs& kw, bool upper) {
    check_kwargs(fname, kw, {});
    arity(fname, a, 0, 0);
    bool any_cased = false;
    for (char ch : self.s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) {
            any_cased = true;
            if (upper ? std::islower(c) : std::isupper(c)) return Value::boolean(false);
        }
    }
    return Value::boolean(any_cased);
}

Value str_islower(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    return str_case_check("islower", self, a, kw, false);
}

Value str_isupper(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    return str_case_check("isupper", self, a, kw, true);
}

// ---------------------------------------------------------------------------
// list / tuple methods

Value seq_index(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("index", kw, {});
    arity("index", a, 1, 3);
    const auto& items = self.items();
    size_t lo = 0;
    size_t hi = 0;
    search_bounds(a, 1, items.size(), &lo, &hi);
    for (size_t k = lo; k < hi; k++) {
        if (values_equal(items[k], a[0])) return Value::integer(static_cast<int64_t>(k));
    }
    throw ScriptError("ValueError", repr(a[0]) + " is not in " + type_name(self));
}

Value seq_count(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("count", kw, {});
    arity("count", a, 1, 1);
    int64_t n = 0;
    for (const auto& x : self.items()) {
        if (values_equal(x, a[0])) n++;
    }
    return Value::integer(n);
}

Value list_append(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("append", kw, {});
    arity("append", a, 1, 1);
    self.items().push_back(a[0]);
    in.noteMutated(self);
    in.checkItems(self.items().size());
    return Value::none();
}

Value list_extend(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("extend", kw, {});
    arity("extend", a, 1, 1);
    std::vector<Value> extra = in.iterate(a[0]);
    auto& items = self.items();
    in.checkItems(items.size() + extra.size());
    items.insert(items.end(), extra.begin(), extra.end());
    in.noteMutated(self);
    return Value::none();
}

Value list_pop(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("pop", kw, {});
    arity("pop", a, 0, 1);
    auto& items = self.items();
    if (items.empty()) throw ScriptError("IndexError", "pop from empty list");
    int64_t n = static_cast<int64_t>(items.size());
    int64_t k = a.empty() ? n - 1 : as_index(a[0]);
    if (k < 0) k += n;
    if (k < 0 || k >= n) throw ScriptError("IndexError", "pop index out of range");
    Value out = items[static_cast<size_t>(k)];
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(k));
    return out;
}

Value list_insert(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("insert", kw, {});
    arity("insert", a, 2, 2);
    auto& items = self.items();
    int64_t n = static_cast<int64_t>(items.size());
    int64_t k = as_index(a[0]);
    if (k < 0) k += n;
    if (k < 0) k = 0;
    if (k > n) k = n;
    items.insert(items.begin() + static_cast<std::ptrdiff_t>(k), a[1]);
    in.noteMutated(self);
    in.checkItems(items.size());
    return Value::none();
}

Value list_remove(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("remove", kw, {});
    arity("remove", a, 1, 1);
    auto& items = self.items();
    for (size_t k = 0; k < items.size(); k++) {
        if (values_equal(items[k], a[0])) {
            items.erase(items.begin() + static_cast<std::ptrdiff_t>(k));
            return Value::none();
        }
    }
    throw ScriptError("ValueError", "list.remove(x): x not in list");
}

Value list_sort(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("sort", kw, {"key", "reverse"});
    if (!a.empty()) throw ScriptError("TypeError", "sort() takes no positional arguments");
    const Value* rev = find_kw(kw, "reverse");
    std::vector<Value> items = self.items();
    sort_values(in, items, find_kw(kw, "key"), rev && truthy(*rev));
    self.items() = std::move(items);
    return Value::none();
}

Value list_reverse(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("reverse", kw, {});
    arity("reverse", a, 0, 0);
    std::reverse(self.items().begin(), self.items().end());
    return Value::none();
}

Value list_copy(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("copy", kw, {});
    arity("copy", a, 0, 0);
    return Value::list(self.items());
}

Value list_clear(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("clear", kw, {});
    arity("clear", a, 0, 0);
    self.items().clear();
    return Value::none();
}

// ---------------------------------------------------------------------------
// dict methods

Value dict_get(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("get", kw, {});
    arity("get", a, 1, 2);
    const Value* v = dict_of(self).find(a[0]);
    if (v) return *v;
    return a.size() == 2 ? a[1] : Value::none();
}

Value dict_keys(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("keys", kw, {});
    arity("keys", a, 0, 0);
    std::vector<Value> out;
    for (const auto& e : dict_of(self).entries) out.push_back(e.first);
    return Value::list(std::move(out));
}

Value dict_values(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("values", kw, {});
    arity("values", a, 0, 0);
    std::vector<Value> out;
    for (const auto& e : dict_of(self).entries) out.push_back(e.second);
    return Value::list(std::move(out));
}

Value dict_items(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("items", kw, {});
    arity("items", a, 0, 0);
    std::vector<Value> out;
    for (const auto& e : dict_of(self).entries) out.push_back(make_tuple2(e.first, e.second));
    return Value::list(std::move(out));
}

Value dict_pop(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("pop", kw, {});
    arity("pop", a, 1, 2);
    Value removed;
    if (dict_of(self).erase(a[0], &removed)) return removed;
    if (a.size() == 2) return a[1];
    throw ScriptError("KeyError", repr(a[0]));
}

Value dict_setdefault(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("setdefault", kw, {});
    arity("setdefault", a, 1, 2);
    const Value* v = dict_of(self).find(a[0]);
    if (v) return *v;
    Value d = a.size() == 2 ? a[1] : Value::none();
    dict_of(self).put(a[0], d);
    in.noteMutated(self);
    in.checkItems(dict_of(self).entries.size());
    return d;
}

Value dict_update(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    arity("update", a, 0, 1);
    if (!a.empty()) update_dict(in, self, a[0]);
    for (const auto& k : kw) dict_of(self).put(Value::str(k.name), k.value);
    in.noteMutated(self);
    return Value::none();
}

Value dict_copy(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("copy", kw, {});
    arity("copy", a, 0, 0);
    Value out = Value::dict();
    for (const auto& e : dict_of(self).entries) dict_of(out).put(e.first, e.second);
    return out;
}

Value dict_clear(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("clear", kw, {});
    arity("clear", a, 0, 0);
    dict_of(self).clear();
    return Value::none();
}

// ---------------------------------------------------------------------------
// set methods

Value set_add(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("add", kw, {});
    arity("add", a, 1, 1);
    set_of(self).add(a[0]);
    in.noteMutated(self);
    in.checkItems(set_of(self).members.size());
    return Value::none();
}

Value set_update(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("update", kw, {});
    for (const auto& src : a) {
        in.forEach(src, [&](const Value& x) {
            set_of(self).add(x);
            return true;
        });
    }
    in.noteMutated(self);
    in.checkItems(set_of(self).members.size());
    return Value::none();
}

Value set_remove(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("remove", kw, {});
    arity("remove", a, 1, 1);
    if (!set_of(self).erase(a[0])) throw ScriptError("KeyError", repr(a[0]));
    return Value::none();
}

Value set_discard(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("discard", kw, {});
    arity("discard", a, 1, 1);
    set_of(self).erase(a[0]);
    return Value::none();
}

Value set_pop(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("pop", kw, {});
    arity("pop", a, 0, 0);
    SetObj& s = set_of(self);
    if (s.members.empty()) throw ScriptError("KeyError", "'pop from an empty set'");
    Value out = s.members.front();
    s.erase(out);
    return out;
}

Value set_from_iterable(Interpreter& in, const Value& v) {
    if (v.kind == ValueKind::SET) return v;
    Value out = Value::set();
    in.forEach(v, [&](const Value& x) {
        set_of(out).add(x);
        return true;
    });
    return out;
}

Value set_union(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("union", kw, {});
    Value out = Value::set();
    for (const auto& m : set_of(self).members) set_of(out).add(m);
    for (const auto& src : a) {
        in.forEach(src, [&](const Value& x) {
            set_of(out).add(x);
            return true;
        });
    }
    in.checkItems(set_of(out).members.size());
    return out;
}

Value set_intersection(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("intersection", kw, {});
    Value acc = self;
    for (const auto& src : a) acc = binary_op(in, BinaryOp::BITAND, acc, set_from_iterable(in, src));
    if (a.empty()) acc = binary_op(in, BinaryOp::BITOR, self, Value::set());
    return acc;
}

Value set_difference(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("difference", kw, {});
    Value acc = binary_op(in, BinaryOp::BITOR, self, Value::set());
    for (const auto& src : a) acc = binary_op(in, BinaryOp::SUB, acc, set_from_iterable(in, src));
    return acc;
}

Value set_issubset(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("issubset", kw, {});
    arity("issubset", a, 1, 1);
    Value other = set_from_iterable(in, a[0]);
    for (const auto& m : set_of(self).members) {
        if (!set_of(other).contains(m)) return Value::boolean(false);
    }
    return Value::boolean(true);
}

Value set_issuperset(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("issuperset", kw, {});
    arity("issuperset", a, 1, 1);
    Value other = set_from_iterable(in, a[0]);
    for (const auto& m : set_of(other).members) {
        if (!set_of(self).contains(m)) return Value::boolean(false);
    }
    return Value::boolean(true);
}

Value set_copy(Interpreter& in, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("copy", kw, {});
    arity("copy", a, 0, 0);
    return binary_op(in, BinaryOp::BITOR, self, Value::set());
}

Value set_clear(Interpreter&, const Value& self, std::vector<Value>& a, const KwArgs& kw) {
    check_kwargs("clear", kw, {});
    arity("clear", a, 0, 0);
    set_of(self).members.clear();
    set_of(self).index.clear();
    return Value::none();
}

using MethodTable = std::unordered_map<std::string, MethodImpl>;

const MethodTable& methods_for(ValueKind kind) {
    static const MethodTable str_methods = {
        {"split", str_split}, {"join", str_join}, {"strip", str_strip}, {"lstrip", str_lstrip},
        {"rstrip", str_rstrip}, {"lower", str_lower}, {"upper", str_upper},
        {"capitalize", str_capitalize}, {"title", str_title}, {"replace", str_replace},
        {"startswith", str_startswith}, {"endswith", str_endswith}, {"find", str_find},
        {"rfind", str_rfind}, {"index", str_index}, {"count", str_count},
        {"isdigit", str_isdigit}, {"isalpha", str_isalpha}, {"isalnum", str_isalnum},
        {"isspace", str_isspace}, {"islower", str_islower}, {"isupper", str_isupper},
    };
    static const MethodTable list_methods = {
        {"append", list_append}, {"extend", list_extend}, {"pop", list_pop},
        {"insert", list_insert}, {"remove", list_remove}, {"index", seq_index},
        {"count", seq_count}, {"sort", list_sort}, {"reverse", list_reverse},
        {"copy", list_copy}, {"clear", list_clear},
    };
    static const MethodTable tuple_methods = {
        {"index", seq_index}, {"count", seq_count},
    };
    static const MethodTable dict_methods = {
        {"get", dict_get}, {"keys", dict_keys}, {"values", dict_values}, {"items", dict_items},
        {"pop", dict_pop}, {"setdefault", dict_setdefault}, {"update", dict_update},
        {"copy", dict_copy}, {"clear", dict_clear},
    };
    static const MethodTable set_methods = {
        {"add", set_add}, {"update", set_update}, {"remove", set_remove},
        {"discard", set_discard}, {"pop", set_pop}, {"union", set_union},
        {"intersection", set_intersection}, {"difference", set_difference},
        {"issubset", set_issubset}, {"issuperset", set_issuperset},
        {"copy", set_copy}, {"clear", set_clear},
    };
    static const MethodTable none;
    switch (kind) {
        case ValueKind::STR: return str_methods;
        case ValueKind::LIST: return list_methods;
        case ValueKind::TUPLE: return tuple_methods;
        case ValueKind::DICT: return dict_methods;
        case ValueKind::SET: return set_methods;
        default: return none;
    }
}

} // namespace

const Value* find_builtin(const std::string& name) {
    const auto& table = builtin_table();
    auto it = table.find(name);
    return it == table.end() ? nullptr : &it->second;
}

std::vector<std::string> builtin_names() {
    std::vector<std::string> out;
    for (const auto& kv : builtin_table()) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

const Value* find_module(const std::string& name) {
    static const Value math = build_math();
    if (name == "math") return &math;
    return nullptr;
}

Value get_attribute(const Value& obj, const std::string& name) {
    if (name.empty() || name[0] == '_') {
        throw ScriptError("AttributeError", "access to attribute '" + name + "' is not allowed");
    }
    if (obj.kind == ValueKind::MODULE) {
        const auto* m = static_cast<const ModuleObj*>(obj.obj.get());
        if (const Value* a = m->attr(name)) return *a;
        throw ScriptError("AttributeError", "module '" + m->name + "' has no attribute '" + name + "'");
    }
    const MethodTable& table = methods_for(obj.kind);
    auto it = table.find(name);
    if (it == table.end()) {
        throw ScriptError("AttributeError", "'" + type_name(obj) + "' object has no attribute '" + name + "'");
    }
    auto m = std::make_shared<MethodObj>();
    m->name = type_name(obj) + "." + name;
    m->self = obj;
    m->fn = it->second;
    Value v;
    v.kind = ValueKind::METHOD;
    v.obj = std::move(m);
    return v;
}

} // namespace evosynth
