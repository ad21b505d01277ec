#pragma once

// Sandboxed execution of candidate programs.
//
// An executor loads a program, resolves its `solve` entry point and applies
// it to every input tuple of a batch under one timeout. Candidate misbehavior
// never escapes as an exception: it comes back as an ExecutionResult error.

#include "evosynth/capabilities.h"
#include "evosynth/interp.h"
#include "evosynth/proc.h"
#include "evosynth/value.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace evosynth {

constexpr const char* kEntryPoint = "solve";

enum class ExecStatus { OK, TIMEOUT, NO_ENTRY_POINT, RUNTIME_FAULT, NO_RESULT };

const char* exec_status_name(ExecStatus s);
bool exec_status_from_name(const std::string& name, ExecStatus* out);

using ArgTuple = std::vector<Value>;

// Deepest container nesting an output may have. Outputs are plain data
// (no functions or modules), whichever executor produced them.
constexpr int kMaxTransferDepth = 200;

struct ExecutionResult {
    ExecStatus status{ExecStatus::NO_RESULT};
    std::vector<Value> outputs;   // one per input, in order (OK only)
    double duration_s{0.0};       // wall-clock time of the solve calls (OK only)
    std::string message;          // summarized error ("Timeout", "ZeroDivisionError: ...")

    bool ok() const { return status == ExecStatus::OK; }

    static ExecutionResult success(std::vector<Value> outputs, double duration_s);
    static ExecutionResult failure(ExecStatus status, std::string message);
};

class Executor {
public:
    virtual ~Executor() = default;

    virtual ExecutionResult execute(const std::string& code,
                                    const std::vector<ArgTuple>& inputs,
                                    std::chrono::milliseconds timeout) = 0;

    virtual const char* name() const = 0;
};

// Interpret `code` and run the batch in the calling process.
ExecutionResult run_batch(const std::string& code,
                          const std::vector<ArgTuple>& inputs,
                          const Capabilities& caps,
                          const ExecBudget& budget);

// Runs the interpreter in-process under the interpreter budget. Outputs are
// detached plain data, as with ForkExecutor.
class InProcessExecutor : public Executor {
public:
    explicit InProcessExecutor(Capabilities caps) : caps_(std::move(caps)) {}

    ExecutionResult execute(const std::string& code,
                            const std::vector<ArgTuple>& inputs,
                            std::chrono::milliseconds timeout) override;

    const char* name() const override { return "inprocess"; }

private:
    Capabilities caps_;
};

// Forks one child per batch; the child applies ProcLimits, runs the batch
// and reports the result as JSON over a pipe. The parent kills the child's
// process group when the timeout expires.
class ForkExecutor : public Executor {
public:
    ForkExecutor(Capabilities caps, ProcLimits limits) : caps_(std::move(caps)), limits_(limits) {}

    ExecutionResult execute(const std::string& code,
                            const std::vector<ArgTuple>& inputs,
                            std::chrono::milliseconds timeout) override;

    const char* name() const override { return "fork"; }

    const ProcLimits& limits() const { return limits_; }

private:
    Capabilities caps_;
    ProcLimits limits_;
};

// "fork" or "inprocess". Throws std::invalid_argument for anything else.
std::unique_ptr<Executor> make_executor(const std::string& kind, Capabilities caps, const ProcLimits& limits);

} // namespace evosynth
