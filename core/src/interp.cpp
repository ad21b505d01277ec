#include "evosynth/interp.h"
#include "evosynth/builtins.h"

#include <climits>
#include <cmath>
#include <functional>

namespace evosynth {

ExecBudget ExecBudget::withTimeout(std::chrono::milliseconds timeout) {
    ExecBudget b;
    b.has_deadline = true;
    b.deadline = std::chrono::steady_clock::now() + timeout;
    return b;
}

const Value* Scope::lookup(const std::string& name) const {
    for (const Scope* s = this; s; s = s->parent.get()) {
        auto it = s->vars.find(name);
        if (it != s->vars.end()) return &it->second;
    }
    return nullptr;
}

Scope::~Scope() { clear_object(*this); }

void Scope::releaseChildren(std::vector<std::shared_ptr<Object>>& out) {
    for (auto& kv : vars) {
        if (kv.second.obj) out.push_back(std::move(kv.second.obj));
    }
    vars.clear();
    if (parent) out.push_back(std::move(parent));
}

FunctionObj::~FunctionObj() { clear_object(*this); }

void FunctionObj::releaseChildren(std::vector<std::shared_ptr<Object>>& out) {
    for (auto& d : defaults) {
        if (d.obj) out.push_back(std::move(d.obj));
    }
    defaults.clear();
    if (closure) out.push_back(std::move(closure));
}

// ---------------------------------------------------------------------------
// Numeric helpers

static int64_t checked_add(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_add_overflow(a, b, &r)) throw ScriptError("OverflowError", "integer overflow");
    return r;
}

static int64_t checked_sub(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_sub_overflow(a, b, &r)) throw ScriptError("OverflowError", "integer overflow");
    return r;
}

static int64_t checked_mul(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_mul_overflow(a, b, &r)) throw ScriptError("OverflowError", "integer overflow");
    return r;
}

static int64_t floordiv_int(int64_t a, int64_t b) {
    if (b == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    if (a == INT64_MIN && b == -1) throw ScriptError("OverflowError", "integer overflow");
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

static int64_t mod_int(int64_t a, int64_t b) {
    if (b == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    if (b == -1) return 0;
    int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) r += b;
    return r;
}

static double mod_float(double a, double b) {
    if (b == 0.0) throw ScriptError("ZeroDivisionError", "float modulo");
    double r = std::fmod(a, b);
    if (r != 0.0) {
        if ((r < 0) != (b < 0)) r += b;
    } else {
        r = std::copysign(0.0, b);
    }
    return r;
}

static int64_t pow_int(int64_t base, int64_t exp) {
    int64_t result = 1;
    while (exp > 0) {
        if (exp & 1) result = checked_mul(result, base);
        exp >>= 1;
        if (exp > 0) base = checked_mul(base, base);
    }
    return result;
}

[[noreturn]] static void unsupported(BinaryOp op, const Value& a, const Value& b) {
    throw ScriptError("TypeError", std::string("unsupported operand type(s) for ") + binary_op_symbol(op) +
                                       ": '" + type_name(a) + "' and '" + type_name(b) + "'");
}

static Value numeric_op(BinaryOp op, const Value& a, const Value& b) {
    const bool ints = a.isIntegral() && b.isIntegral();
    switch (op) {
        case BinaryOp::ADD:
            return ints ? Value::integer(checked_add(a.asInt(), b.asInt())) : Value::real(a.asDouble() + b.asDouble());
        case BinaryOp::SUB:
            return ints ? Value::integer(checked_sub(a.asInt(), b.asInt())) : Value::real(a.asDouble() - b.asDouble());
        case BinaryOp::MUL:
            return ints ? Value::integer(checked_mul(a.asInt(), b.asInt())) : Value::real(a.asDouble() * b.asDouble());
        case BinaryOp::DIV:
            if (b.asDouble() == 0.0) throw ScriptError("ZeroDivisionError", "division by zero");
            return Value::real(a.asDouble() / b.asDouble());
        case BinaryOp::FLOORDIV:
            if (ints) return Value::integer(floordiv_int(a.asInt(), b.asInt()));
            if (b.asDouble() == 0.0) throw ScriptError("ZeroDivisionError", "float floor division by zero");
            return Value::real(std::floor(a.asDouble() / b.asDouble()));
        case BinaryOp::MOD:
            if (ints) return Value::integer(mod_int(a.asInt(), b.asInt()));
            return Value::real(mod_float(a.asDouble(), b.asDouble()));
        case BinaryOp::POW: {
            if (ints && b.asInt() >= 0) return Value::integer(pow_int(a.asInt(), b.asInt()));
            double x = a.asDouble();
            double y = b.asDouble();
            if (x == 0.0 && y < 0.0) {
                throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
            }
            if (x < 0.0 && std::isfinite(y) && std::floor(y) != y) {
                throw ScriptError("ValueError", "complex results are not supported");
            }
            double r = std::pow(x, y);
            if (std::isinf(r) && std::isfinite(x) && std::isfinite(y)) {
                throw ScriptError("OverflowError", "numerical result out of range");
            }
            return Value::real(r);
        }
        case BinaryOp::BITOR:
        case BinaryOp::BITXOR:
        case BinaryOp::BITAND: {
            if (!ints) unsupported(op, a, b);
            int64_t x = a.asInt();
            int64_t y = b.asInt();
            int64_t r = op == BinaryOp::BITOR ? (x | y) : (op == BinaryOp::BITXOR ? (x ^ y) : (x & y));
            if (a.kind == ValueKind::BOOL && b.kind == ValueKind::BOOL) return Value::boolean(r != 0);
            return Value::integer(r);
        }
        case BinaryOp::LSHIFT:
        case BinaryOp::RSHIFT: {
            if (!ints) unsupported(op, a, b);
            int64_t x = a.asInt();
            int64_t n = b.asInt();
            if (n < 0) throw ScriptError("ValueError", "negative shift count");
            if (op == BinaryOp::RSHIFT) {
                if (n >= 63) return Value::integer(x < 0 ? -1 : 0);
                return Value::integer(x >> n);
            }
            if (x == 0) return Value::integer(0);
            if (n >= 63) throw ScriptError("OverflowError", "integer overflow");
            int64_t r = static_cast<int64_t>(static_cast<uint64_t>(x) << n);
            if ((r >> n) != x) throw ScriptError("OverflowError", "integer overflow");
            return Value::integer(r);
        }
    }
    unsupported(op, a, b);
}

static Value repeat(Interpreter& in, const Value& seq, int64_t n) {
    if (n <= 0) {
        if (seq.kind == ValueKind::STR) return Value::str("");
        return seq.kind == ValueKind::TUPLE ? Value::tuple() : Value::list();
    }
    if (seq.kind == ValueKind::STR) {
        if (static_cast<double>(seq.s.size()) * static_cast<double>(n) > static_cast<double>(in.budget().max_string_bytes)) {
            in.checkBytes(in.budget().max_string_bytes + 1);
        }
        std::string out;
        out.reserve(seq.s.size() * static_cast<size_t>(n));
        for (int64_t k = 0; k < n; k++) out += seq.s;
        return Value::str(std::move(out));
    }
    const auto& items = seq.items();
    if (static_cast<double>(items.size()) * static_cast<double>(n) > static_cast<double>(in.budget().max_container_items)) {
        in.checkItems(in.budget().max_container_items + 1);
    }
    std::vector<Value> out;
    out.reserve(items.size() * static_cast<size_t>(n));
    for (int64_t k = 0; k < n; k++) out.insert(out.end(), items.begin(), items.end());
    return seq.kind == ValueKind::TUPLE ? Value::tuple(std::move(out)) : Value::list(std::move(out));
}

static bool is_repeatable(const Value& v) {
    return v.kind == ValueKind::STR || v.kind == ValueKind::LIST || v.kind == ValueKind::TUPLE;
}

Value binary_op(Interpreter& in, BinaryOp op, const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) return numeric_op(op, a, b);

    switch (op) {
        case BinaryOp::ADD:
            if (a.kind == ValueKind::STR && b.kind == ValueKind::STR) {
                in.checkBytes(a.s.size() + b.s.size());
                return Value::str(a.s + b.s);
            }
            if (a.kind == b.kind && a.isSequence()) {
                in.checkItems(a.items().size() + b.items().size());
                std::vector<Value> out = a.items();
                out.insert(out.end(), b.items().begin(), b.items().end());
                return a.kind == ValueKind::TUPLE ? Value::tuple(std::move(out)) : Value::list(std::move(out));
            }
            break;
        case BinaryOp::MUL:
            if (is_repeatable(a) && b.isIntegral()) return repeat(in, a, b.asInt());
            if (a.isIntegral() && is_repeatable(b)) return repeat(in, b, a.asInt());
            break;
        case BinaryOp::SUB:
        case BinaryOp::BITAND:
        case BinaryOp::BITXOR:
        case BinaryOp::BITOR:
            if (a.kind == ValueKind::SET && b.kind == ValueKind::SET) {
                const SetObj& sa = set_of(a);
                const SetObj& sb = set_of(b);
                Value out = Value::set();
                SetObj& so = set_of(out);
                if (op == BinaryOp::SUB || op == BinaryOp::BITAND || op == BinaryOp::BITXOR) {
                    for (const auto& m : sa.members) {
                        bool in_b = sb.contains(m);
                        if ((op == BinaryOp::BITAND) == in_b) so.add(m);
                    }
                    if (op == BinaryOp::BITXOR) {
                        for (const auto& m : sb.members) if (!sa.contains(m)) so.add(m);
                    }
                } else {
                    for (const auto& m : sa.members) so.add(m);
                    for (const auto& m : sb.members) so.add(m);
                }
                in.checkItems(so.members.size());
                return out;
            }
            if (op == BinaryOp::BITOR && a.kind == ValueKind::DICT && b.kind == ValueKind::DICT) {
                Value out = Value::dict();
                for (const auto& kv : dict_of(a).entries) dict_of(out).put(kv.first, kv.second);
                for (const auto& kv : dict_of(b).entries) dict_of(out).put(kv.first, kv.second);
                return out;
            }
            break;
        case BinaryOp::MOD:
            if (a.kind == ValueKind::STR) throw ScriptError("TypeError", "string formatting is not supported");
            break;
        default:
            break;
    }
    unsupported(op, a, b);
}

static bool same_object(const Value& a, const Value& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case ValueKind::NONE: return true;
        case ValueKind::BOOL: return a.b == b.b;
        case ValueKind::INT: return a.i == b.i;
        case ValueKind::FLOAT: return a.f == b.f;
        case ValueKind::STR: return a.s == b.s;
        default: return a.obj == b.obj;
    }
}

bool contains(Interpreter& in, const Value& container, const Value& item) {
    in.tick();
    switch (container.kind) {
        case ValueKind::STR:
            if (item.kind != ValueKind::STR) {
                throw ScriptError("TypeError", "'in <string>' requires string as left operand, not " + type_name(item));
            }
            return container.s.find(item.s) != std::string::npos;
        case ValueKind::LIST:
        case ValueKind::TUPLE:
            for (const auto& x : container.items()) {
                if (values_equal(x, item)) return true;
            }
            return false;
        case ValueKind::DICT:
            return dict_of(container).find(item) != nullptr;
        case ValueKind::SET:
            return set_of(container).contains(item);
        case ValueKind::RANGE: {
            if (!item.isNumber()) return false;
            double d = item.asDouble();
            if (std::floor(d) != d) return false;
            const RangeObj& r = range_of(container);
            int64_t x = item.isIntegral() ? item.asInt() : static_cast<int64_t>(d);
            int64_t n = r.length();
            if (n == 0) return false;
            int64_t last = r.at(n - 1);
            if (r.step > 0 ? (x < r.start || x > last) : (x > r.start || x < last)) return false;
            return (x - r.start) % r.step == 0;
        }
        default:
            throw ScriptError("TypeError", "argument of type '" + type_name(container) + "' is not iterable");
    }
}

bool compare_op(Interpreter& in, CompareOp op, const Value& a, const Value& b) {
    switch (op) {
        case CompareOp::EQ: return values_equal(a, b);
        case CompareOp::NE: return !values_equal(a, b);
        case CompareOp::LT: return values_less(a, b);
        case CompareOp::GT: return values_less(b, a);
        case CompareOp::LE: return values_less(a, b) || values_equal(a, b);
        case CompareOp::GE: return values_less(b, a) || values_equal(a, b);
        case CompareOp::IN: return contains(in, b, a);
        case CompareOp::NOT_IN: return !contains(in, b, a);
        case CompareOp::IS: return same_object(a, b);
        case CompareOp::IS_NOT: return !same_object(a, b);
    }
    return false;
}

// ---------------------------------------------------------------------------
// Indexing

static size_t length_for_index(const Value& obj) {
    switch (obj.kind) {
        case ValueKind::LIST:
        case ValueKind::TUPLE: return obj.items().size();
        case ValueKind::STR: return obj.s.size();
        case ValueKind::RANGE: return static_cast<size_t>(range_of(obj).length());
        default: return 0;
    }
}

static size_t normalize_index(const Value& obj, const Value& index, const char* what) {
    if (!index.isIntegral()) {
        throw ScriptError("TypeError", std::string(what) + " indices must be integers or slices, not " + type_name(index));
    }
    int64_t n = static_cast<int64_t>(length_for_index(obj));
    int64_t k = index.asInt();
    if (k < 0) k += n;
    if (k < 0 || k >= n) throw ScriptError("IndexError", std::string(what) + " index out of range");
    return static_cast<size_t>(k);
}

Value get_item(const Value& obj, const Value& index) {
    switch (obj.kind) {
        case ValueKind::LIST: return obj.items()[normalize_index(obj, index, "list")];
        case ValueKind::TUPLE: return obj.items()[normalize_index(obj, index, "tuple")];
        case ValueKind::STR: return Value::str(std::string(1, obj.s[normalize_index(obj, index, "string")]));
        case ValueKind::RANGE: {
            size_t k = normalize_index(obj, index, "range object");
            return Value::integer(range_of(obj).at(static_cast<int64_t>(k)));
        }
        case ValueKind::DICT: {
            const Value* v = dict_of(obj).find(index);
            if (!v) throw ScriptError("KeyError", repr(index));
            return *v;
        }
        default:
            throw ScriptError("TypeError", "'" + type_name(obj) + "' object is not subscriptable");
    }
}

namespace {

struct SliceSpan {
    int64_t start{0};
    int64_t step{1};
    int64_t count{0};
};

int64_t slice_bound(const Value& v) {
    if (!v.isIntegral()) throw ScriptError("TypeError", "slice indices must be integers or None");
    return v.asInt();
}

SliceSpan resolve_slice(int64_t n, const Value& lower, const Value& upper, const Value& step) {
    SliceSpan sp;
    if (!step.isNone()) sp.step = slice_bound(step);
    if (sp.step == 0) throw ScriptError("ValueError", "slice step cannot be zero");

    auto adjust = [&](const Value& v, int64_t dflt) -> int64_t {
        if (v.isNone()) return dflt;
        int64_t x = slice_bound(v);
        if (x < 0) {
            x += n;
            if (x < 0) x = sp.step < 0 ? -1 : 0;
        } else if (x >= n) {
            x = sp.step < 0 ? n - 1 : n;
        }
        return x;
    };
    int64_t start = adjust(lower, sp.step < 0 ? n - 1 : 0);
    int64_t stop = adjust(upper, sp.step < 0 ? -1 : n);
    sp.start = start;
    if (sp.step < 0) {
        sp.count = stop < start ? (start - stop - 1) / (-sp.step) + 1 : 0;
    } else {
        sp.count = start < stop ? (stop - start - 1) / sp.step + 1 : 0;
    }
    return sp;
}

} // namespace

Value get_slice(Interpreter& in, const Value& obj, const Value& lower, const Value& upper, const Value& step) {
    in.tick();
    switch (obj.kind) {
        case ValueKind::LIST:
        case ValueKind::TUPLE: {
            const auto& items = obj.items();
            SliceSpan sp = resolve_slice(static_cast<int64_t>(items.size()), lower, upper, step);
            std::vector<Value> out;
            out.reserve(static_cast<size_t>(sp.count));
            for (int64_t k = 0; k < sp.count; k++) out.push_back(items[static_cast<size_t>(sp.start + k * sp.step)]);
            return obj.kind == ValueKind::TUPLE ? Value::tuple(std::move(out)) : Value::list(std::move(out));
        }
        case ValueKind::STR: {
            SliceSpan sp = resolve_slice(static_cast<int64_t>(obj.s.size()), lower, upper, step);
            std::string out;
            out.reserve(static_cast<size_t>(sp.count));
            for (int64_t k = 0; k < sp.count; k++) out.push_back(obj.s[static_cast<size_t>(sp.start + k * sp.step)]);
            return Value::str(std::move(out));
        }
        case ValueKind::RANGE: {
            const RangeObj& r = range_of(obj);
            SliceSpan sp = resolve_slice(r.length(), lower, upper, step);
            int64_t new_start = r.at(sp.start);
            int64_t new_step = r.step * sp.step;
            return Value::range(new_start, new_start + sp.count * new_step, new_step);
        }
        default:
            throw ScriptError("TypeError", "'" + type_name(obj) + "' object is not subscriptable");
    }
}

static void set_item(Interpreter& in, const Value& obj, const Value& index, const Value& v) {
    switch (obj.kind) {
        case ValueKind::LIST: {
            if (!index.isIntegral()) {
                throw ScriptError("TypeError", "list indices must be integers or slices, not " + type_name(index));
            }
            auto& items = obj.items();
            int64_t n = static_cast<int64_t>(items.size());
            int64_t k = index.asInt();
            if (k < 0) k += n;
            if (k < 0 || k >= n) throw ScriptError("IndexError", "list assignment index out of range");
            items[static_cast<size_t>(k)] = v;
            in.noteMutated(obj);
            return;
        }
        case ValueKind::DICT:
            dict_of(obj).put(index, v);
            in.noteMutated(obj);
            in.checkItems(dict_of(obj).entries.size());
            return;
        default:
            throw ScriptError("TypeError", "'" + type_name(obj) + "' object does not support item assignment");
    }
}

static void set_slice(Interpreter& in, const Value& obj, const Value& lower, const Value& upper,
                      const Value& step, const Value& v) {
    if (obj.kind != ValueKind::LIST) {
        throw ScriptError("TypeError", "'" + type_name(obj) + "' object does not support item assignment");
    }
    std::vector<Value> repl = in.iterate(v);
    in.noteMutated(obj);
    auto& items = obj.items();
    SliceSpan sp = resolve_slice(static_cast<int64_t>(items.size()), lower, upper, step);
    if (sp.step == 1) {
        auto first = items.begin() + static_cast<std::ptrdiff_t>(sp.start);
        items.erase(first, first + static_cast<std::ptrdiff_t>(sp.count));
        items.insert(items.begin() + static_cast<std::ptrdiff_t>(sp.start), repl.begin(), repl.end());
        in.checkItems(items.size());
        return;
    }
    if (static_cast<int64_t>(repl.size()) != sp.count) {
        throw ScriptError("ValueError", "attempt to assign sequence of size " + std::to_string(repl.size()) +
                                            " to extended slice of size " + std::to_string(sp.count));
    }
    for (int64_t k = 0; k < sp.count; k++) items[static_cast<size_t>(sp.start + k * sp.step)] = repl[static_cast<size_t>(k)];
}

// ---------------------------------------------------------------------------
// Interpreter

Interpreter::Interpreter(Capabilities caps, ExecBudget budget)
    : caps_(std::move(caps)), budget_(budget), globals_(std::make_shared<Scope>()) {
    for (const auto& name : caps_.modules()) {
        const Value* mod = find_module(name);
        if (mod) globals_->vars[name] = *mod;
    }
}

Interpreter::~Interpreter() {
    // Functions hold their defining scope, scopes hold functions and
    // containers may hold themselves; break those cycles explicitly.
    for (auto& w : mutated_) {
        if (auto o = w.lock()) clear_object(*o);
    }
    for (auto& w : captured_) {
        if (auto s = w.lock()) clear_object(*s);
    }
    clear_object(*globals_);
}

void Interpreter::checkDeadline() {
    ticks_ = 0;
    if (budget_.has_deadline && std::chrono::steady_clock::now() >= budget_.deadline) {
        throw ScriptError("TimeoutError", "execution deadline exceeded");
    }
}

void Interpreter::checkItems(size_t n) const {
    if (n > budget_.max_container_items) {
        throw ScriptError("MemoryError", "container exceeds " + std::to_string(budget_.max_container_items) + " items");
    }
}

void Interpreter::checkBytes(size_t n) const {
    if (n > budget_.max_string_bytes) {
        throw ScriptError("MemoryError", "string exceeds " + std::to_string(budget_.max_string_bytes) + " bytes");
    }
}

void Interpreter::noteMutated(const Value& container) {
    if (!container.obj) return;
    if (!mutated_.empty() && mutated_.back().lock() == container.obj) return;
    if (mutated_.size() >= 256 && (mutated_.size() & (mutated_.size() - 1)) == 0) {
        std::vector<std::weak_ptr<Object>> live;
        for (auto& w : mutated_) {
            if (!w.expired()) live.push_back(w);
        }
        mutated_.swap(live);
    }
    mutated_.push_back(container.obj);
}

void Interpreter::noteCaptured(const std::shared_ptr<Scope>& scope) {
    if (scope == globals_) return;
    if (!captured_.empty() && captured_.back().lock() == scope) return;
    if (captured_.size() >= 256 && (captured_.size() & (captured_.size() - 1)) == 0) {
        std::vector<std::weak_ptr<Scope>> live;
        for (auto& w : captured_) {
            if (!w.expired()) live.push_back(w);
        }
        captured_.swap(live);
    }
    captured_.push_back(scope);
}

std::vector<Value> Interpreter::iterate(const Value& v) {
    if (v.kind == ValueKind::RANGE) {
        int64_t n = range_of(v).length();
        checkItems(static_cast<size_t>(n < 0 ? 0 : n));
    }
    std::vector<Value> out;
    forEach(v, [&](const Value& x) {
        out.push_back(x);
        return true;
    });
    return out;
}

void Interpreter::load(const std::string& source) {
    load(parse_program(source));
}

void Interpreter::load(std::shared_ptr<const Program> program) {
    programs_.push_back(program);
    Flow f = execBlock(program->body, globals_, program);
    if (f == Flow::RETURN) throw ScriptError("SyntaxError", "'return' outside function");
    if (f == Flow::BREAK) throw ScriptError("SyntaxError", "'break' outside loop");
    if (f == Flow::CONTINUE) throw ScriptError("SyntaxError", "'continue' not properly in loop");
}

const Value* Interpreter::global(const std::string& name) const {
    auto it = globals_->vars.find(name);
    return it == globals_->vars.end() ? nullptr : &it->second;
}

Value Interpreter::call(const Value& fn, std::vector<Value> args, const KwArgs& kwargs) {
    std::shared_ptr<Object> hold = fn.obj;
    switch (fn.kind) {
        case ValueKind::BUILTIN:
            return static_cast<BuiltinObj*>(hold.get())->fn(*this, args, kwargs);
        case ValueKind::METHOD: {
            auto* m = static_cast<MethodObj*>(hold.get());
            return m->fn(*this, m->self, args, kwargs);
        }
        case ValueKind::FUNCTION:
            return callFunction(*static_cast<FunctionObj*>(hold.get()), args, kwargs);
        default:
            throw ScriptError("TypeError", "'" + type_name(fn) + "' object is not callable");
    }
}

static std::string plural(size_t n, const char* word) {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

Value Interpreter::callFunction(const FunctionObj& fn, std::vector<Value>& args, const KwArgs& kwargs) {
    const FunctionDecl& d = *fn.decl;
    const size_t np = d.params.size();
    if (args.size() > np) {
        throw ScriptError("TypeError", d.name + "() takes " + plural(np, "positional argument") + " but " +
                                           std::to_string(args.size()) + (args.size() == 1 ? " was" : " were") +
                                           " given");
    }

    auto scope = std::make_shared<Scope>();
    scope->parent = fn.closure;
    std::vector<bool> bound(np, false);
    for (size_t k = 0; k < args.size(); k++) {
        scope->vars[d.params[k].name] = std::move(args[k]);
        bound[k] = true;
    }
    for (const auto& kw : kwargs) {
        size_t k = 0;
        while (k < np && d.params[k].name != kw.name) k++;
        if (k == np) throw ScriptError("TypeError", d.name + "() got an unexpected keyword argument '" + kw.name + "'");
        if (bound[k]) throw ScriptError("TypeError", d.name + "() got multiple values for argument '" + kw.name + "'");
        scope->vars[kw.name] = kw.value;
        bound[k] = true;
    }
    const size_t first_default = np - fn.defaults.size();
    std::vector<std::string> missing;
    for (size_t k = 0; k < np; k++) {
        if (bound[k]) continue;
        if (k >= first_default) {
            scope->vars[d.params[k].name] = fn.defaults[k - first_default];
        } else {
            missing.push_back(d.params[k].name);
        }
    }
    if (!missing.empty()) {
        std::string names;
        for (size_t k = 0; k < missing.size(); k++) {
            if (k) names += (k + 1 == missing.size()) ? " and " : ", ";
            names += "'" + missing[k] + "'";
        }
        throw ScriptError("TypeError", d.name + "() missing " + plural(missing.size(), "required positional argument") +
                                           ": " + names);
    }

    if (depth_ >= budget_.max_call_depth) {
        throw ScriptError("RecursionError", "maximum recursion depth exceeded");
    }
    struct DepthScope {
        int& depth;
        explicit DepthScope(int& d) : depth(d) { depth++; }
        ~DepthScope() { depth--; }
    } depth_scope(depth_);
    tick();

    if (d.expr_body) return eval(*d.expr_body, scope, fn.program);

    Flow f = execBlock(d.body, scope, fn.program);
    if (f == Flow::RETURN) {
        Value r = std::move(return_value_);
        return_value_ = Value::none();
        return r;
    }
    if (f == Flow::BREAK) throw ScriptError("SyntaxError", "'break' outside loop");
    if (f == Flow::CONTINUE) throw ScriptError("SyntaxError", "'continue' not properly in loop");
    return Value::none();
}

Interpreter::Flow Interpreter::execBlock(const std::vector<StmtPtr>& body, const std::shared_ptr<Scope>& scope,
                                         const std::shared_ptr<const Program>& prog) {
    for (const auto& s : body) {
        Flow f = execStmt(*s, scope, prog);
        if (f != Flow::NORMAL) return f;
    }
    return Flow::NORMAL;
}

Interpreter::Flow Interpreter::execStmt(const Stmt& s, const std::shared_ptr<Scope>& scope,
                                        const std::shared_ptr<const Program>& prog) {
    tick();
    switch (s.kind) {
        case StmtKind::EXPR:
            eval(*s.value, scope, prog);
            return Flow::NORMAL;
        case StmtKind::ASSIGN: {
            Value v = eval(*s.value, scope, prog);
            for (const auto& t : s.targets) assign(*t, v, scope, prog);
            return Flow::NORMAL;
        }
        case StmtKind::AUG_ASSIGN:
            augAssign(s, scope, prog);
            return Flow::NORMAL;
        case StmtKind::IF:
            if (truthy(eval(*s.test, scope, prog))) return execBlock(s.body, scope, prog);
            return execBlock(s.orelse, scope, prog);
        case StmtKind::WHILE:
            while (true) {
                tick();
                if (!truthy(eval(*s.test, scope, prog))) break;
                Flow f = execBlock(s.body, scope, prog);
                if (f == Flow::BREAK) return Flow::NORMAL;
                if (f == Flow::RETURN) return f;
            }
            return execBlock(s.orelse, scope, prog);
        case StmtKind::FOR: {
            Value iterable = eval(*s.value, scope, prog);
            bool broke = false;
            bool returned = false;
            forEach(iterable, [&](const Value& x) {
                assign(*s.targets[0], x, scope, prog);
                Flow f = execBlock(s.body, scope, prog);
                if (f == Flow::BREAK) {
                    broke = true;
                    return false;
                }
                if (f == Flow::RETURN) {
                    returned = true;
                    return false;
                }
                return true;
            });
            if (returned) return Flow::RETURN;
            if (broke) return Flow::NORMAL;
            return execBlock(s.orelse, scope, prog);
        }
        case StmtKind::DEF:
            scope->vars[s.func->name] = makeFunction(*s.func, scope, prog);
            return Flow::NORMAL;
        case StmtKind::RETURN:
            return_value_ = s.value ? eval(*s.value, scope, prog) : Value::none();
            return Flow::RETURN;
        case StmtKind::PASS:
            return Flow::NORMAL;
        case StmtKind::BREAK:
            return Flow::BREAK;
        case StmtKind::CONTINUE:
            return Flow::CONTINUE;
        case StmtKind::IMPORT:
            throw ScriptError("ImportError", "import of '" + s.module + "' is not allowed");
        case StmtKind::IMPORT_FROM:
            execImportFrom(s, *scope);
            return Flow::NORMAL;
    }
    return Flow::NORMAL;
}

void Interpreter::execImportFrom(const Stmt& s, Scope& scope) {
    const Value* mod = caps_.allowsModule(s.module) ? find_module(s.module) : nullptr;
    if (!mod) throw ScriptError("ImportError", "import of '" + s.module + "' is not allowed");
    const auto* m = static_cast<const ModuleObj*>(mod->obj.get());
    for (const auto& name : s.names) {
        const Value* a = name.empty() || name[0] == '_' ? nullptr : m->attr(name);
        if (!a) throw ScriptError("ImportError", "cannot import name '" + name + "' from '" + s.module + "'");
        scope.vars[name] = *a;
    }
}

Value Interpreter::makeFunction(const FunctionDecl& decl, const std::shared_ptr<Scope>& scope,
                                const std::shared_ptr<const Program>& prog) {
    auto fn = std::make_shared<FunctionObj>();
    fn->program = prog;
    fn->decl = &decl;
    for (const auto& p : decl.params) {
        if (p.default_value) fn->defaults.push_back(eval(*p.default_value, scope, prog));
    }
    fn->closure = scope;
    noteCaptured(scope);
    Value v;
    v.kind = ValueKind::FUNCTION;
    v.obj = std::move(fn);
    return v;
}

void Interpreter::assign(const Expr& target, const Value& v, const std::shared_ptr<Scope>& scope,
                         const std::shared_ptr<const Program>& prog) {
    switch (target.kind) {
        case ExprKind::NAME:
            scope->vars[target.name] = v;
            return;
        case ExprKind::TUPLE:
        case ExprKind::LIST: {
            std::vector<Value> items = iterate(v);
            const size_t n = target.args.size();
            if (items.size() > n) {
                throw ScriptError("ValueError", "too many values to unpack (expected " + std::to_string(n) + ")");
            }
            if (items.size() < n) {
                throw ScriptError("ValueError", "not enough values to unpack (expected " + std::to_string(n) +
                                                    ", got " + std::to_string(items.size()) + ")");
            }
            for (size_t k = 0; k < n; k++) assign(*target.args[k], items[k], scope, prog);
            return;
        }
        case ExprKind::SUBSCRIPT: {
            Value obj = eval(*target.args[0], scope, prog);
            const Expr& idx = *target.args[1];
            if (idx.kind == ExprKind::SLICE) {
                Value lo = idx.args[0] ? eval(*idx.args[0], scope, prog) : Value::none();
                Value hi = idx.args[1] ? eval(*idx.args[1], scope, prog) : Value::none();
                Value st = idx.args[2] ? eval(*idx.args[2], scope, prog) : Value::none();
                set_slice(*this, obj, lo, hi, st, v);
                return;
            }
            set_item(*this, obj, eval(idx, scope, prog), v);
            return;
        }
        default:
            throw ScriptError("SyntaxError", "line " + std::to_string(target.line) + ": cannot assign to expression");
    }
}

void Interpreter::augAssign(const Stmt& s, const std::shared_ptr<Scope>& scope,
                            const std::shared_ptr<const Program>& prog) {
    const Expr& t = *s.targets[0];
    if (t.kind == ExprKind::NAME) {
        Value current = evalName(t, *scope);
        Value rhs = eval(*s.value, scope, prog);
        if (current.kind == ValueKind::LIST && s.aug_op == BinaryOp::ADD) {
            std::vector<Value> extra = iterate(rhs);
            auto& items = current.items();
            checkItems(items.size() + extra.size());
            items.insert(items.end(), extra.begin(), extra.end());
            noteMutated(current);
            scope->vars[t.name] = current;
            return;
        }
        scope->vars[t.name] = binary_op(*this, s.aug_op, current, rhs);
        return;
    }
    // SUBSCRIPT
    Value obj = eval(*t.args[0], scope, prog);
    if (t.args[1]->kind == ExprKind::SLICE) {
        throw ScriptError("TypeError", "augmented slice assignment is not supported");
    }
    Value index = eval(*t.args[1], scope, prog);
    Value current = get_item(obj, index);
    Value rhs = eval(*s.value, scope, prog);
    set_item(*this, obj, index, binary_op(*this, s.aug_op, current, rhs));
}

Value Interpreter::evalName(const Expr& e, const Scope& scope) {
    if (const Value* v = scope.lookup(e.name)) return *v;
    if (caps_.allowsBuiltin(e.name)) {
        if (const Value* b = find_builtin(e.name)) return *b;
    }
    throw ScriptError("NameError", "name '" + e.name + "' is not defined");
}

Value Interpreter::evalCall(const Expr& e, const std::shared_ptr<Scope>& scope,
                            const std::shared_ptr<const Program>& prog) {
    tick();
    Value callee = eval(*e.args[0], scope, prog);
    std::vector<Value> args;
    args.reserve(e.args.size() - 1);
    for (size_t k = 1; k < e.args.size(); k++) args.push_back(eval(*e.args[k], scope, prog));
    KwArgs kwargs;
    for (const auto& kw : e.keywords) kwargs.push_back(KwArg{kw.name, eval(*kw.value, scope, prog)});
    return call(callee, std::move(args), kwargs);
}

Value Interpreter::evalComprehension(const Expr& e, const std::shared_ptr<Scope>& scope,
                                     const std::shared_ptr<const Program>& prog) {
    auto inner = std::make_shared<Scope>();
    inner->parent = scope;

    Value out;
    switch (e.kind) {
        case ExprKind::SET_COMP: out = Value::set(); break;
        case ExprKind::DICT_COMP: out = Value::dict(); break;
        default: out = Value::list(); break;
    }

    std::function<void(size_t)> loop = [&](size_t level) {
        if (level == e.generators.size()) {
            switch (e.kind) {
                case ExprKind::SET_COMP:
                    set_of(out).add(eval(*e.args[0], inner, prog));
                    checkItems(set_of(out).members.size());
                    break;
                case ExprKind::DICT_COMP: {
                    Value k = eval(*e.args[0], inner, prog);
                    dict_of(out).put(k, eval(*e.args[1], inner, prog));
                    checkItems(dict_of(out).entries.size());
                    break;
                }
                default:
                    out.items().push_back(eval(*e.args[0], inner, prog));
                    checkItems(out.items().size());
                    break;
            }
            return;
        }
        const Comprehension& c = e.generators[level];
        // The outermost iterable is evaluated in the enclosing scope.
        Value iterable = eval(*c.iter, level == 0 ? scope : inner, prog);
        forEach(iterable, [&](const Value& x) {
            assign(*c.target, x, inner, prog);
            for (const auto& cond : c.conds) {
                if (!truthy(eval(*cond, inner, prog))) return true;
            }
            loop(level + 1);
            return true;
        });
    };
    loop(0);
    return out;
}

Value Interpreter::eval(const Expr& e, const std::shared_ptr<Scope>& scope,
                        const std::shared_ptr<const Program>& prog) {
    switch (e.kind) {
        case ExprKind::LITERAL:
            return e.literal;
        case ExprKind::NAME:
            return evalName(e, *scope);
        case ExprKind::TUPLE:
        case ExprKind::LIST: {
            std::vector<Value> items;
            items.reserve(e.args.size());
            for (const auto& a : e.args) items.push_back(eval(*a, scope, prog));
            return e.kind == ExprKind::TUPLE ? Value::tuple(std::move(items)) : Value::list(std::move(items));
        }
        case ExprKind::DICT: {
            Value d = Value::dict();
            for (size_t k = 0; k + 1 < e.args.size(); k += 2) {
                Value key = eval(*e.args[k], scope, prog);
                dict_of(d).put(key, eval(*e.args[k + 1], scope, prog));
            }
            return d;
        }
        case ExprKind::SET: {
            Value s = Value::set();
            for (const auto& a : e.args) set_of(s).add(eval(*a, scope, prog));
            return s;
        }
        case ExprKind::LIST_COMP:
        case ExprKind::SET_COMP:
        case ExprKind::DICT_COMP:
        case ExprKind::GEN_EXP:
            return evalComprehension(e, scope, prog);
        case ExprKind::BINARY: {
            Value a = eval(*e.args[0], scope, prog);
            Value b = eval(*e.args[1], scope, prog);
            return binary_op(*this, e.bin_op, a, b);
        }
        case ExprKind::UNARY: {
            Value v = eval(*e.args[0], scope, prog);
            switch (e.un_op) {
                case UnaryOp::NOT:
                    return Value::boolean(!truthy(v));
                case UnaryOp::NEG:
                    if (v.isIntegral()) {
                        if (v.asInt() == INT64_MIN) throw ScriptError("OverflowError", "integer overflow");
                        return Value::integer(-v.asInt());
                    }
                    if (v.kind == ValueKind::FLOAT) return Value::real(-v.f);
                    throw ScriptError("TypeError", "bad operand type for unary -: '" + type_name(v) + "'");
                case UnaryOp::POS:
                    if (v.isIntegral()) return Value::integer(v.asInt());
                    if (v.kind == ValueKind::FLOAT) return v;
                    throw ScriptError("TypeError", "bad operand type for unary +: '" + type_name(v) + "'");
                case UnaryOp::INVERT:
                    if (v.isIntegral()) return Value::integer(~v.asInt());
                    throw ScriptError("TypeError", "bad operand type for unary ~: '" + type_name(v) + "'");
            }
            return Value::none();
        }
        case ExprKind::AND: {
            Value v;
            for (const auto& a : e.args) {
                v = eval(*a, scope, prog);
                if (!truthy(v)) return v;
            }
            return v;
        }
        case ExprKind::OR: {
            Value v;
            for (const auto& a : e.args) {
                v = eval(*a, scope, prog);
                if (truthy(v)) return v;
            }
            return v;
        }
        case ExprKind::COMPARE: {
            Value left = eval(*e.args[0], scope, prog);
            for (size_t k = 0; k < e.cmp_ops.size(); k++) {
                Value right = eval(*e.args[k + 1], scope, prog);
                if (!compare_op(*this, e.cmp_ops[k], left, right)) return Value::boolean(false);
                left = std::move(right);
            }
            return Value::boolean(true);
        }
        case ExprKind::IF_EXP:
            return truthy(eval(*e.args[1], scope, prog)) ? eval(*e.args[0], scope, prog)
                                                         : eval(*e.args[2], scope, prog);
        case ExprKind::LAMBDA:
            return makeFunction(*e.lambda, scope, prog);
        case ExprKind::CALL:
            return evalCall(e, scope, prog);
        case ExprKind::ATTRIBUTE:
            return get_attribute(eval(*e.args[0], scope, prog), e.name);
        case ExprKind::SUBSCRIPT: {
            Value obj = eval(*e.args[0], scope, prog);
            const Expr& idx = *e.args[1];
            if (idx.kind == ExprKind::SLICE) {
                Value lo = idx.args[0] ? eval(*idx.args[0], scope, prog) : Value::none();
                Value hi = idx.args[1] ? eval(*idx.args[1], scope, prog) : Value::none();
                Value st = idx.args[2] ? eval(*idx.args[2], scope, prog) : Value::none();
                return get_slice(*this, obj, lo, hi, st);
            }
            return get_item(obj, eval(idx, scope, prog));
        }
        case ExprKind::SLICE:
            throw ScriptError("TypeError", "multi-dimensional slicing is not supported");
    }
    return Value::none();
}

} // namespace evosynth
