#pragma once

// Runtime values of the candidate script language.
//
// Scalars (None, bool, int, float, str) are stored inline. Containers and
// callables live behind a shared Object so that lists and dicts alias the way
// scripts expect (`a = b; a.append(1)` mutates both).

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace evosynth {

enum class ValueKind {
    NONE,
    BOOL,
    INT,
    FLOAT,
    STR,
    LIST,
    TUPLE,
    DICT,
    SET,
    RANGE,
    FUNCTION,
    BUILTIN,
    METHOD,
    MODULE,
};

const char* value_kind_name(ValueKind k);

// Script-level error ("ZeroDivisionError", "NameError", ...). what() returns
// the "<type>: <message>" form shown to users.
class ScriptError : public std::runtime_error {
public:
    ScriptError(std::string type, const std::string& message)
        : std::runtime_error(type + ": " + message), type_(std::move(type)) {}

    const std::string& type() const { return type_; }

private:
    std::string type_;
};

struct Object {
    virtual ~Object() = default;

    // Move out every object this one references. Teardown walks reference
    // chains with an explicit stack instead of nested destructors.
    virtual void releaseChildren(std::vector<std::shared_ptr<Object>>& out) { (void)out; }
};

// Destroy the objects in `pending` and everything only they keep alive,
// iteratively.
void release_objects(std::vector<std::shared_ptr<Object>>& pending);

// Drop all references held by `obj` (used to break reference cycles).
void clear_object(Object& obj);

// Nesting bound for comparison, hashing and repr (RecursionError beyond it).
constexpr int kMaxNestingDepth = 1000;

struct Value {
    ValueKind kind{ValueKind::NONE};
    bool b{false};
    int64_t i{0};
    double f{0.0};
    std::string s;
    std::shared_ptr<Object> obj;

    static Value none() { return Value{}; }
    static Value boolean(bool v);
    static Value integer(int64_t v);
    static Value real(double v);
    static Value str(std::string v);
    static Value list(std::vector<Value> items = {});
    static Value tuple(std::vector<Value> items = {});
    static Value dict();
    static Value set();
    static Value range(int64_t start, int64_t stop, int64_t step);

    bool isNone() const { return kind == ValueKind::NONE; }
    bool isNumber() const { return kind == ValueKind::BOOL || kind == ValueKind::INT || kind == ValueKind::FLOAT; }
    bool isIntegral() const { return kind == ValueKind::BOOL || kind == ValueKind::INT; }
    bool isSequence() const { return kind == ValueKind::LIST || kind == ValueKind::TUPLE; }
    bool isCallable() const {
        return kind == ValueKind::FUNCTION || kind == ValueKind::BUILTIN || kind == ValueKind::METHOD;
    }

    // Integral view of bool/int. Caller checks isIntegral().
    int64_t asInt() const { return kind == ValueKind::BOOL ? (b ? 1 : 0) : i; }
    // Numeric view of bool/int/float. Caller checks isNumber().
    double asDouble() const { return kind == ValueKind::FLOAT ? f : static_cast<double>(asInt()); }

    // Element storage of a list or tuple.
    std::vector<Value>& items() const;
};

// --- Container objects ---

struct SeqObj : Object {
    std::vector<Value> items;

    ~SeqObj() override;
    void releaseChildren(std::vector<std::shared_ptr<Object>>& out) override;
};

struct ValueHash {
    size_t operator()(const Value& v) const;
};

struct ValueKeyEq {
    bool operator()(const Value& a, const Value& b) const;
};

// Insertion-ordered hash map keyed by hashable values.
struct DictObj : Object {
    std::vector<std::pair<Value, Value>> entries;
    std::unordered_map<Value, size_t, ValueHash, ValueKeyEq> index;

    const Value* find(const Value& key) const;
    void put(const Value& key, const Value& value);
    bool erase(const Value& key, Value* removed = nullptr);
    void clear();

    ~DictObj() override;
    void releaseChildren(std::vector<std::shared_ptr<Object>>& out) override;
};

// Insertion-ordered hash set.
struct SetObj : Object {
    std::vector<Value> members;
    std::unordered_map<Value, size_t, ValueHash, ValueKeyEq> index;

    bool contains(const Value& v) const { return index.count(v) > 0; }
    bool add(const Value& v);
    bool erase(const Value& v);

    ~SetObj() override;
    void releaseChildren(std::vector<std::shared_ptr<Object>>& out) override;
};

struct RangeObj : Object {
    int64_t start{0};
    int64_t stop{0};
    int64_t step{1};

    int64_t length() const;
    int64_t at(int64_t idx) const { return start + idx * step; }
};

// --- Callables ---

class Interpreter;

struct KwArg {
    std::string name;
    Value value;
};
using KwArgs = std::vector<KwArg>;

using NativeFn = std::function<Value(Interpreter& in, std::vector<Value>& args, const KwArgs& kwargs)>;
using NativeMethod = std::function<Value(Interpreter& in, const Value& self,
                                        std::vector<Value>& args, const KwArgs& kwargs)>;

struct BuiltinObj : Object {
    std::string name;
    NativeFn fn;
};

struct MethodObj : Object {
    std::string name;
    Value self;
    NativeMethod fn;

    void releaseChildren(std::vector<std::shared_ptr<Object>>& out) override;
};

struct ModuleObj : Object {
    std::string name;
    std::vector<std::pair<std::string, Value>> attrs;

    const Value* attr(const std::string& n) const;
};

DictObj& dict_of(const Value& v);
SetObj& set_of(const Value& v);
RangeObj& range_of(const Value& v);

// --- Semantics shared by the interpreter and the fitness comparison ---

// Script `==` (numeric cross-type equality, structural containers). A
// container always equals itself.
bool values_equal(const Value& a, const Value& b);

// Script `<`. Throws ScriptError(TypeError) for unordered kinds.
bool values_less(const Value& a, const Value& b);

// Truthiness.
bool truthy(const Value& v);

// Throws ScriptError(TypeError) for unhashable kinds. values_equal,
// values_less and hash_value throw ScriptError(RecursionError) past
// kMaxNestingDepth.
size_t hash_value(const Value& v);

// repr()/str() renderings. A container reached again while it is being
// rendered prints as [...], {...} or (...).
std::string repr(const Value& v);
std::string to_display(const Value& v);
std::string format_float(double d);

// Type name used in error messages ("int", "list", ...).
std::string type_name(const Value& v);

} // namespace evosynth
