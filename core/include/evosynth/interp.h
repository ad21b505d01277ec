#pragma once

// Tree-walking evaluator for candidate scripts.
//
// One Interpreter holds one global namespace. It never touches the host:
// the only names a script can resolve are its own definitions, the
// whitelisted built-ins and whitelisted modules. Every loop iteration and
// call ticks the execution budget.

#include "evosynth/capabilities.h"
#include "evosynth/script.h"
#include "evosynth/value.h"

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace evosynth {

struct ExecBudget {
    // Wall-clock deadline; disabled when has_deadline is false.
    bool has_deadline{false};
    std::chrono::steady_clock::time_point deadline;

    int max_call_depth{200};
    size_t max_container_items{1u << 20};
    size_t max_string_bytes{1u << 22};

    static ExecBudget withTimeout(std::chrono::milliseconds timeout);
};

struct Scope : Object {
    std::unordered_map<std::string, Value> vars;
    std::shared_ptr<Scope> parent;

    const Value* lookup(const std::string& name) const;

    ~Scope() override;
    void releaseChildren(std::vector<std::shared_ptr<Object>>& out) override;
};

struct FunctionObj : Object {
    std::shared_ptr<const Program> program;   // owns decl
    const FunctionDecl* decl{nullptr};
    std::vector<Value> defaults;              // aligned with the trailing defaulted params
    std::shared_ptr<Scope> closure;

    ~FunctionObj() override;
    void releaseChildren(std::vector<std::shared_ptr<Object>>& out) override;
};

class Interpreter {
public:
    Interpreter(Capabilities caps, ExecBudget budget);
    ~Interpreter();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // Parse and run top-level statements. Throws ScriptError.
    void load(const std::string& source);
    void load(std::shared_ptr<const Program> program);

    // Global binding by name, nullptr when undefined.
    const Value* global(const std::string& name) const;

    // Invoke any callable value.
    Value call(const Value& fn, std::vector<Value> args, const KwArgs& kwargs = {});

    // --- services for native built-ins ---

    const Capabilities& capabilities() const { return caps_; }
    const ExecBudget& budget() const { return budget_; }

    // Counts one unit of work and enforces the deadline (TimeoutError).
    void tick() {
        if (++ticks_ >= kTicksPerClockCheck) checkDeadline();
    }

    // Record a list/dict/set that a script stored into. Such containers may
    // close reference cycles; they are cleared when the interpreter goes away.
    void noteMutated(const Value& container);

    // MemoryError when a container or string would exceed the budget.
    void checkItems(size_t n) const;
    void checkBytes(size_t n) const;

    // Materialize any iterable (list/tuple/str/dict keys/set/range).
    std::vector<Value> iterate(const Value& v);

    // Visit elements without materializing ranges. Stops when fn returns false.
    template <typename Fn>
    void forEach(const Value& v, Fn fn);

private:
    static constexpr unsigned kTicksPerClockCheck = 512;

    enum class Flow { NORMAL, BREAK, CONTINUE, RETURN };

    Capabilities caps_;
    ExecBudget budget_;
    unsigned ticks_{0};
    int depth_{0};

    std::shared_ptr<Scope> globals_;
    std::vector<std::shared_ptr<const Program>> programs_;
    std::vector<std::weak_ptr<Scope>> captured_;
    std::vector<std::weak_ptr<Object>> mutated_;
    Value return_value_;

    void checkDeadline();
    void noteCaptured(const std::shared_ptr<Scope>& scope);

    Flow execBlock(const std::vector<StmtPtr>& body, const std::shared_ptr<Scope>& scope,
                   const std::shared_ptr<const Program>& prog);
    Flow execStmt(const Stmt& s, const std::shared_ptr<Scope>& scope,
                  const std::shared_ptr<const Program>& prog);
    void execImportFrom(const Stmt& s, Scope& scope);

    Value eval(const Expr& e, const std::shared_ptr<Scope>& scope,
               const std::shared_ptr<const Program>& prog);
    Value evalName(const Expr& e, const Scope& scope);
    Value evalCall(const Expr& e, const std::shared_ptr<Scope>& scope,
                   const std::shared_ptr<const Program>& prog);
    Value evalComprehension(const Expr& e, const std::shared_ptr<Scope>& scope,
                            const std::shared_ptr<const Program>& prog);
    Value makeFunction(const FunctionDecl& decl, const std::shared_ptr<Scope>& scope,
                       const std::shared_ptr<const Program>& prog);

    void assign(const Expr& target, const Value& v, const std::shared_ptr<Scope>& scope,
                const std::shared_ptr<const Program>& prog);
    void augAssign(const Stmt& s, const std::shared_ptr<Scope>& scope,
                   const std::shared_ptr<const Program>& prog);

    Value callFunction(const FunctionObj& fn, std::vector<Value>& args, const KwArgs& kwargs);
};

// Operators shared with the built-ins.
Value binary_op(Interpreter& in, BinaryOp op, const Value& a, const Value& b);
bool compare_op(Interpreter& in, CompareOp op, const Value& a, const Value& b);
bool contains(Interpreter& in, const Value& container, const Value& item);
Value get_item(const Value& obj, const Value& index);
Value get_slice(Interpreter& in, const Value& obj, const Value& lower, const Value& upper, const Value& step);

template <typename Fn>
void Interpreter::forEach(const Value& v, Fn fn) {
    switch (v.kind) {
        case ValueKind::RANGE: {
            const RangeObj r = range_of(v);
            int64_t n = r.length();
            for (int64_t k = 0; k < n; k++) {
                tick();
                if (!fn(Value::integer(r.at(k)))) return;
            }
            return;
        }
        case ValueKind::LIST:
        case ValueKind::TUPLE: {
            // Snapshot: the body may mutate the list.
            std::vector<Value> items = v.items();
            for (const auto& x : items) {
                tick();
                if (!fn(x)) return;
            }
            return;
        }
        case ValueKind::STR: {
            for (char c : v.s) {
                tick();
                if (!fn(Value::str(std::string(1, c)))) return;
            }
            return;
        }
        case ValueKind::DICT: {
            std::vector<Value> keys;
            keys.reserve(dict_of(v).entries.size());
            for (const auto& kv : dict_of(v).entries) keys.push_back(kv.first);
            for (const auto& k : keys) {
                tick();
                if (!fn(k)) return;
            }
            return;
        }
        case ValueKind::SET: {
            std::vector<Value> members = set_of(v).members;
            for (const auto& m : members) {
                tick();
                if (!fn(m)) return;
            }
            return;
        }
        default:
            throw ScriptError("TypeError", "'" + type_name(v) + "' object is not iterable");
    }
}

} // namespace evosynth
