#include "test_common.h"
#include "evosynth/executor.h"
#include "evosynth/sandbox.h"
#include "evosynth/script.h"
#include "evosynth/serialization.h"

#include <chrono>
#include <string>
#include <vector>

using namespace evosynth;

static std::vector<ArgTuple> batch(const std::vector<std::string>& literals) {
    std::vector<ArgTuple> out;
    for (const auto& l : literals) out.push_back(parse_literal(l).items());
    return out;
}

static void check_common(Executor& ex) {
    const std::string who = std::string(ex.name()) + ": ";
    const auto ms = std::chrono::milliseconds(250);

    // Ordered outputs and a measured duration
    {
        auto r = ex.execute("def solve(a, b):\n    return a + b\n", batch({"(1, 2)", "(3, 4)", "('x', 'y')"}), ms);
        expect_true(r.ok(), who + "add batch should succeed: " + r.message);
        expect_eq_ll((long long)r.outputs.size(), 3, who + "one output per input");
        expect_eq_str(repr(r.outputs[0]), "3", who + "first output");
        expect_eq_str(repr(r.outputs[2]), "'xy'", who + "third output");
        expect_true(r.duration_s >= 0.0 && r.duration_s < 0.25, who + "duration within timeout");
    }

    // Tuples, floats, dicts and sets survive the result transport
    {
        auto r = ex.execute("def solve():\n    return ((0, 1), 0.1, {'a': [1]}, {2}, None, True)\n", batch({"()"}), ms);
        expect_true(r.ok(), who + "structured output: " + r.message);
        expect_eq_str(repr(r.outputs[0]), "((0, 1), 0.1, {'a': [1]}, {2}, None, True)", who + "structured repr");
    }

    // Missing entry point
    {
        auto r = ex.execute("def other(x):\n    return x\n", batch({"(1,)"}), ms);
        expect_true(r.status == ExecStatus::NO_ENTRY_POINT, who + "missing solve");
        expect_eq_str(r.message, "No function `solve` defined.", who + "missing solve message");
    }

    // Runtime fault from the candidate, and a syntax error
    {
        auto r = ex.execute("def solve(x):\n    return x // 0\n", batch({"(1,)"}), ms);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT, who + "division by zero is a fault");
        expect_eq_str(r.message, "ZeroDivisionError: integer division or modulo by zero", who + "fault message");
        expect_true(r.outputs.empty(), who + "no partial outputs on fault");

        auto s = ex.execute("def solve(x)\n    return x\n", batch({"(1,)"}), ms);
        expect_true(s.status == ExecStatus::RUNTIME_FAULT, who + "syntax error is a fault");
        expect_true(s.message.rfind("SyntaxError: ", 0) == 0, who + "syntax error message: " + s.message);
    }

    // Infinite loop: Timeout, bounded wall time
    {
        auto start = std::chrono::steady_clock::now();
        auto r = ex.execute("def solve(x):\n    while True:\n        x += 1\n", batch({"(1,)"}), ms);
        auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        expect_true(r.status == ExecStatus::TIMEOUT, who + "infinite loop is a timeout");
        expect_eq_str(r.message, "Timeout", who + "timeout message");
        expect_true(took.count() < 2000, who + "timeout returns promptly (" + std::to_string(took.count()) + " ms)");
    }

    // Capability attempts fail at the call boundary
    {
        auto r = ex.execute("import os\ndef solve(x):\n    return os.getcwd()\n", batch({"(1,)"}), ms);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT && r.message.rfind("ImportError", 0) == 0,
                    who + "import os is blocked: " + r.message);

        r = ex.execute("def solve(x):\n    return x.__class__\n", batch({"(1,)"}), ms);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT && r.message.rfind("AttributeError", 0) == 0,
                    who + "dunder access is blocked: " + r.message);

        r = ex.execute("def solve(x):\n    return open('/etc/passwd').read()\n", batch({"(1,)"}), ms);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT && r.message.rfind("NameError", 0) == 0,
                    who + "open is not defined: " + r.message);
    }

    // Self-referential and deeply nested containers end as values or faults
    {
        const auto slow = std::chrono::milliseconds(5000);
        auto r = ex.execute("def solve(x):\n    a = []\n    a.append(a)\n    return a == a, str(a)\n",
                            batch({"(1,)"}), slow);
        expect_true(r.ok(), who + "self-referential list compares and prints: " + r.message);
        expect_eq_str(repr(r.outputs[0]), "(True, '[[...]]')", who + "recursive repr");

        r = ex.execute("def solve(x):\n    a = []\n    a.append(a)\n    b = []\n    b.append(b)\n    return a == b\n",
                       batch({"(1,)"}), slow);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT && r.message.rfind("RecursionError", 0) == 0,
                    who + "comparing two cycles: " + r.message);

        r = ex.execute("def solve(x):\n    d = {}\n    d['self'] = d\n    return d\n", batch({"(1,)"}), slow);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT && r.message.rfind("RecursionError", 0) == 0,
                    who + "returning a cycle: " + r.message);

        const std::string chain = "def solve(x):\n    a = []\n    for i in range(300000):\n        a = [a]\n";
        r = ex.execute(chain + "    return 0\n", batch({"(1,)"}), slow);
        expect_true(r.ok(), who + "long chain is released: " + r.message);
        expect_eq_str(repr(r.outputs[0]), "0", who + "long chain result");

        r = ex.execute(chain + "    return len(str(a))\n", batch({"(1,)"}), slow);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT && r.message.rfind("RecursionError", 0) == 0,
                    who + "repr of a long chain: " + r.message);

        r = ex.execute("def solve(x):\n    t = ()\n    for i in range(300000):\n        t = (t,)\n    return len({t})\n",
                       batch({"(1,)"}), slow);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT && r.message.rfind("RecursionError", 0) == 0,
                    who + "hash of a long chain: " + r.message);

        // 151 levels fit the transfer limit, 251 do not
        const std::string nest = "def solve(n):\n    a = []\n    for i in range(n):\n        a = [a]\n    return a\n";
        r = ex.execute(nest, batch({"(150,)"}), slow);
        expect_true(r.ok(), who + "150 nested lists transfer: " + r.message);
        expect_eq_ll((long long)repr(r.outputs[0]).size(), 302, who + "nested output intact");

        r = ex.execute(nest, batch({"(250,)"}), slow);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT && r.message.rfind("RecursionError", 0) == 0,
                    who + "250 nested lists exceed the limit: " + r.message);
    }

    // Candidates mutating their arguments do not corrupt the caller's inputs
    {
        auto inputs = batch({"([3, 1, 2],)"});
        auto r = ex.execute("def solve(xs):\n    xs.sort()\n    return xs\n", inputs, ms);
        expect_true(r.ok(), who + "sort in place");
        expect_eq_str(repr(r.outputs[0]), "[1, 2, 3]", who + "sorted output");
        expect_eq_str(repr(Value::list(inputs[0][0].items())), "[3, 1, 2]", who + "inputs untouched");
    }
}

int main() {
    // Status names round-trip
    for (ExecStatus s : {ExecStatus::OK, ExecStatus::TIMEOUT, ExecStatus::NO_ENTRY_POINT,
                         ExecStatus::RUNTIME_FAULT, ExecStatus::NO_RESULT}) {
        ExecStatus back = ExecStatus::OK;
        expect_true(exec_status_from_name(exec_status_name(s), &back) && back == s, "status name round-trip");
    }

    // Result JSON keeps int/float/bool/tuple distinctions
    {
        ExecutionResult r = ExecutionResult::success({Value::integer(1), Value::real(1.0), Value::boolean(true),
                                                      Value::tuple({Value::integer(0), Value::integer(1)})},
                                                     0.5);
        ExecutionResult back;
        std::string err;
        expect_true(execution_result_from_json(execution_result_to_json(r), &back, &err), "decode: " + err);
        expect_eq_ll((long long)back.outputs.size(), 4, "decoded outputs");
        expect_true(back.outputs[0].kind == ValueKind::INT, "int stays int");
        expect_true(back.outputs[1].kind == ValueKind::FLOAT, "float stays float");
        expect_true(back.outputs[2].kind == ValueKind::BOOL, "bool stays bool");
        expect_true(back.outputs[3].kind == ValueKind::TUPLE, "tuple stays tuple");
        expect_near(back.duration_s, 0.5, 1e-12, "duration");

        expect_true(!execution_result_from_json("{\"status\":\"BOGUS\"}", &back, &err), "unknown status rejected");
        expect_true(!execution_result_from_json("not json", &back, &err), "garbage rejected");
    }

    InProcessExecutor inproc(Capabilities::defaults());
    check_common(inproc);

#ifdef __linux__
    ProcLimits lim;
    ForkExecutor forked(Capabilities::defaults(), lim);
    check_common(forked);

    // Functions cannot leave the child
    {
        auto r = forked.execute("def solve():\n    return len\n", batch({"()"}), std::chrono::milliseconds(250));
        expect_true(r.status == ExecStatus::RUNTIME_FAULT, "function output is a fault in the forked executor");
    }

    // Under the seccomp filter: the interpreter, the result encoding and
    // exception unwinding stay inside the allowlist
    if (seccomp_available()) {
        ProcLimits sealed_lim = lim;
        sealed_lim.enable_seccomp = true;
        ForkExecutor sealed(Capabilities::defaults(), sealed_lim);
        const auto ms = std::chrono::milliseconds(1000);

        auto r = sealed.execute("def solve(n):\n    return sum(int(d) for d in str(n))\n",
                                batch({"(42,)", "(999,)", "(0,)"}), ms);
        expect_true(r.ok(), std::string("seed under seccomp: ") + exec_status_name(r.status) + " " + r.message);
        expect_eq_str(repr(Value::list(r.outputs)), "[6, 27, 0]", "seed outputs under seccomp");

        r = sealed.execute("def solve(n):\n    return n // 0\n", batch({"(1,)"}), ms);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT, std::string("fault under seccomp: ") +
                                                               exec_status_name(r.status) + " " + r.message);
        expect_eq_str(r.message, "ZeroDivisionError: integer division or modulo by zero", "fault message under seccomp");

        r = sealed.execute("def solve(n)\n    return n\n", batch({"(1,)"}), ms);
        expect_true(r.status == ExecStatus::RUNTIME_FAULT && r.message.rfind("SyntaxError: ", 0) == 0,
                    std::string("syntax error under seccomp: ") + exec_status_name(r.status) + " " + r.message);

        r = sealed.execute("def solve():\n    return ((0, 1), 0.5, {'a': [1]}, {2}, None)\n", batch({"()"}), ms);
        expect_true(r.ok(), "structured output under seccomp: " + r.message);
        expect_eq_str(repr(r.outputs[0]), "((0, 1), 0.5, {'a': [1]}, {2}, None)", "structured repr under seccomp");
    }

    // A child that dies without reporting is NoResult
    {
        ProcLimits tiny = lim;
        tiny.rlimit_as_mb = 1;
        ForkExecutor starved(Capabilities::defaults(), tiny);
        auto r = starved.execute("def solve():\n    return 1\n", batch({"()"}), std::chrono::milliseconds(250));
        expect_true(r.status == ExecStatus::NO_RESULT || r.status == ExecStatus::RUNTIME_FAULT,
                    std::string("starved child: ") + exec_status_name(r.status) + " " + r.message);
    }
#endif

    // Factory
    {
        auto e = make_executor("inprocess", Capabilities::defaults(), ProcLimits{});
        expect_eq_str(e->name(), "inprocess", "factory inprocess");
        bool threw = false;
        try {
            make_executor("thread", Capabilities::defaults(), ProcLimits{});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect_true(threw, "unknown executor kind rejected");
    }

    std::cerr << "test_executor: ALL PASSED" << std::endl;
    return 0;
}
