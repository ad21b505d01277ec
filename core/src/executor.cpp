#include "evosynth/executor.h"
#include "evosynth/serialization.h"

#include <new>
#include <stdexcept>

namespace evosynth {

const char* exec_status_name(ExecStatus s) {
    switch (s) {
        case ExecStatus::OK: return "OK";
        case ExecStatus::TIMEOUT: return "TIMEOUT";
        case ExecStatus::NO_ENTRY_POINT: return "NO_ENTRY_POINT";
        case ExecStatus::RUNTIME_FAULT: return "RUNTIME_FAULT";
        default: return "NO_RESULT";
    }
}

bool exec_status_from_name(const std::string& name, ExecStatus* out) {
    if (!out) return false;
    if (name == "OK") *out = ExecStatus::OK;
    else if (name == "TIMEOUT") *out = ExecStatus::TIMEOUT;
    else if (name == "NO_ENTRY_POINT") *out = ExecStatus::NO_ENTRY_POINT;
    else if (name == "RUNTIME_FAULT") *out = ExecStatus::RUNTIME_FAULT;
    else if (name == "NO_RESULT") *out = ExecStatus::NO_RESULT;
    else return false;
    return true;
}

ExecutionResult ExecutionResult::success(std::vector<Value> outputs, double duration_s) {
    ExecutionResult r;
    r.status = ExecStatus::OK;
    r.outputs = std::move(outputs);
    r.duration_s = duration_s;
    return r;
}

ExecutionResult ExecutionResult::failure(ExecStatus status, std::string message) {
    ExecutionResult r;
    r.status = status;
    r.message = std::move(message);
    return r;
}

// Detached copy made of plain data only. Arguments are copied per call since
// candidates may mutate them (nums.sort()); outputs are copied out before the
// interpreter tears down its containers.
static Value plain_copy(const Value& v, int depth) {
    if (v.obj && depth > kMaxTransferDepth) {
        throw ScriptError("RecursionError", "value nested deeper than " + std::to_string(kMaxTransferDepth) + " levels");
    }
    switch (v.kind) {
        case ValueKind::NONE:
        case ValueKind::BOOL:
        case ValueKind::INT:
        case ValueKind::FLOAT:
        case ValueKind::STR:
        case ValueKind::RANGE:
            return v;
        case ValueKind::LIST:
        case ValueKind::TUPLE: {
            std::vector<Value> items;
            items.reserve(v.items().size());
            for (const auto& it : v.items()) items.push_back(plain_copy(it, depth + 1));
            return v.kind == ValueKind::LIST ? Value::list(std::move(items)) : Value::tuple(std::move(items));
        }
        case ValueKind::DICT: {
            Value d = Value::dict();
            for (const auto& kv : dict_of(v).entries) {
                dict_of(d).put(plain_copy(kv.first, depth + 1), plain_copy(kv.second, depth + 1));
            }
            return d;
        }
        case ValueKind::SET: {
            Value s = Value::set();
            for (const auto& m : set_of(v).members) set_of(s).add(plain_copy(m, depth + 1));
            return s;
        }
        default:
            break;
    }
    throw ScriptError("TypeError", "cannot transfer value of type '" + type_name(v) + "'");
}

static ExecutionResult from_script_error(const ScriptError& e) {
    if (e.type() == "TimeoutError") return ExecutionResult::failure(ExecStatus::TIMEOUT, "Timeout");
    return ExecutionResult::failure(ExecStatus::RUNTIME_FAULT, e.what());
}

ExecutionResult run_batch(const std::string& code,
                          const std::vector<ArgTuple>& inputs,
                          const Capabilities& caps,
                          const ExecBudget& budget) {
    try {
        Interpreter in(caps, budget);
        in.load(code);

        const Value* fn = in.global(kEntryPoint);
        if (!fn || !fn->isCallable()) {
            return ExecutionResult::failure(ExecStatus::NO_ENTRY_POINT,
                                            std::string("No function `") + kEntryPoint + "` defined.");
        }
        const Value entry = *fn;

        std::vector<Value> outputs;
        outputs.reserve(inputs.size());
        auto start = std::chrono::steady_clock::now();
        for (const auto& args : inputs) {
            std::vector<Value> call_args;
            call_args.reserve(args.size());
            for (const auto& a : args) call_args.push_back(plain_copy(a, 1));
            outputs.push_back(plain_copy(in.call(entry, std::move(call_args)), 1));
        }
        auto end = std::chrono::steady_clock::now();
        double dur = std::chrono::duration<double>(end - start).count();
        return ExecutionResult::success(std::move(outputs), dur);
    } catch (const ScriptError& e) {
        return from_script_error(e);
    } catch (const std::bad_alloc&) {
        return ExecutionResult::failure(ExecStatus::RUNTIME_FAULT, "MemoryError: out of memory");
    }
}

// --- InProcessExecutor ---

ExecutionResult InProcessExecutor::execute(const std::string& code,
                                           const std::vector<ArgTuple>& inputs,
                                           std::chrono::milliseconds timeout) {
    return run_batch(code, inputs, caps_, ExecBudget::withTimeout(timeout));
}

// --- ForkExecutor ---

ExecutionResult ForkExecutor::execute(const std::string& code,
                                      const std::vector<ArgTuple>& inputs,
                                      std::chrono::milliseconds timeout) {
    ProcLimits lim = limits_;
    if (timeout.count() > 0) lim.timeout_ms = (int)timeout.count();
    if (lim.enable_seccomp) prime_json_hash_seed();

    const Capabilities& caps = caps_;
    auto body = [&](int out_fd) {
        ExecutionResult r = run_batch(code, inputs, caps, ExecBudget::withTimeout(timeout));
        std::string payload;
        try {
            payload = execution_result_to_json(r);
        } catch (const ScriptError& e) {
            // outputs the parent cannot receive (functions, modules)
            payload = execution_result_to_json(ExecutionResult::failure(ExecStatus::RUNTIME_FAULT, e.what()));
        }
        if (!write_all(out_fd, payload)) throw std::runtime_error("result pipe write failed");
    };

    ProcResult pr;
    if (!proc_run_forked(body, lim, &pr)) {
        return ExecutionResult::failure(ExecStatus::NO_RESULT, "No result: " + pr.error);
    }
    if (pr.timed_out) {
        return ExecutionResult::failure(ExecStatus::TIMEOUT, "Timeout");
    }
    if (pr.output.empty() || pr.output_truncated) {
        return ExecutionResult::failure(ExecStatus::NO_RESULT, "No result");
    }

    ExecutionResult r;
    std::string err;
    if (!execution_result_from_json(pr.output, &r, &err)) {
        return ExecutionResult::failure(ExecStatus::NO_RESULT, "No result");
    }
    return r;
}

std::unique_ptr<Executor> make_executor(const std::string& kind, Capabilities caps, const ProcLimits& limits) {
    if (kind == "fork") return std::unique_ptr<Executor>(new ForkExecutor(std::move(caps), limits));
    if (kind == "inprocess") return std::unique_ptr<Executor>(new InProcessExecutor(std::move(caps)));
    throw std::invalid_argument("unknown executor kind: " + kind + " (expected fork or inprocess)");
}

} // namespace evosynth
