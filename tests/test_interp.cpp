#include "test_common.h"
#include "evosynth/builtins.h"
#include "evosynth/capabilities.h"
#include "evosynth/interp.h"
#include "evosynth/script.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace evosynth;

// repr of solve(*args), or the "<Type>: <message>" text of the error.
static std::string run(const std::string& src, const std::string& args_literal = "()",
                       const Capabilities& caps = Capabilities::defaults()) {
    try {
        Interpreter in(caps, ExecBudget::withTimeout(std::chrono::milliseconds(2000)));
        in.load(src);
        const Value* fn = in.global("solve");
        if (!fn) return "<no solve>";
        Value args = parse_literal(args_literal);
        return repr(in.call(*fn, args.items()));
    } catch (const ScriptError& e) {
        return e.what();
    }
}

static void expect_run(const std::string& src, const std::string& args, const std::string& want) {
    expect_eq_str(run(src, args), want, "program:\n" + src);
}

int main() {
    // Arithmetic follows the script semantics
    expect_run("def solve(a,b):\n    return (a//b, a%b, a/b)", "(-7, 2)", "(-4, 1, -3.5)");
    expect_run("def solve():\n    return 2**10, 2**-1, 7.5//2", "()", "(1024, 0.5, 3.0)");
    expect_run("def solve():\n    return 1 < 2 < 3, 3 > 2 > 2, 1 == 1.0", "()", "(True, False, True)");
    expect_run("def solve(x):\n    return -x if x < 0 else x", "(-5,)", "5");
    expect_run("def solve():\n    return 5 & 3, 5 | 3, 5 ^ 3, ~5, 1 << 4, 256 >> 2", "()", "(1, 7, 6, -6, 16, 64)");

    // Errors carry Python-style names and messages
    expect_run("def solve(a):\n    return a // 0", "(1,)", "ZeroDivisionError: integer division or modulo by zero");
    expect_run("def solve(a):\n    return a / 0", "(1,)", "ZeroDivisionError: division by zero");
    expect_run("def solve(a):\n    return undefined_name", "(1,)", "NameError: name 'undefined_name' is not defined");
    expect_run("def solve(a):\n    return [1,2][a]", "(5,)", "IndexError: list index out of range");
    expect_run("def solve():\n    return 9223372036854775807 + 1", "()", "OverflowError: integer overflow");
    expect_run("def solve(a, b):\n    return a", "(1,)", "TypeError: solve() missing 1 required positional argument: 'b'");

    // Strings, containers and methods
    expect_run("def solve(s):\n    return ' '.join(reversed([w for w in s.split() if w]))", "('a b  c',)", "'c b a'");
    expect_run("def solve(s):\n    return s[::-1], s[1:3], s.upper(), s.find('l')", "('hello',)",
               "('olleh', 'el', 'HELLO', 2)");
    expect_run("def solve():\n    d={}\n    d['a']=1\n    d.setdefault('b', [])\n    d['b'].append(2)\n    return d, sorted(d.keys())",
               "()", "({'a': 1, 'b': [2]}, ['a', 'b'])");
    expect_run("def solve():\n    s={3,1}\n    s.add(2)\n    return sorted(s), 2 in s, len(s)", "()", "([1, 2, 3], True, 3)");
    expect_run("def solve(xs):\n    xs.sort(key=lambda v: -v)\n    return xs", "([1, 3, 2],)", "[3, 2, 1]");
    expect_run("def solve():\n    return {k: k*k for k in range(3)}, [x for x in range(10) if x%3==0]",
               "()", "({0: 0, 1: 1, 2: 4}, [0, 3, 6, 9])");
    expect_run("def solve():\n    a, (b, c) = 1, (2, 3)\n    return a + b + c", "()", "6");

    // Control flow
    expect_run("def solve(n):\n    s=0\n    n=abs(n)\n    while n:\n        s+=n%10\n        n//=10\n    return s",
               "(123456,)", "21");
    expect_run("def solve():\n    for i in range(10):\n        if i == 3: break\n    else:\n        return -1\n    return i",
               "()", "3");
    expect_run("def solve(n):\n    if n < 2: return n\n    return solve(n-1) + solve(n-2)", "(15,)", "610");
    expect_run("def solve(x):\n    def inner(y=2):\n        return x * y\n    return inner(), inner(y=5)", "(3,)", "(6, 15)");

    // Built-ins from the whitelist
    expect_run("def solve():\n    return round(2.5), round(3.5), round(2.675, 2), pow(3, 4, 5)", "()", "(2, 4, 2.67, 1)");
    expect_run("def solve():\n    return max([3, 9, 2]), min(4, 1, key=lambda v: -v), sum(range(5))", "()", "(9, 4, 10)");
    expect_run("def solve():\n    return list(enumerate('ab')), list(map(str, [1, 2])), list(filter(None, [0, 1, 2]))",
               "()", "([(0, 'a'), (1, 'b')], ['1', '2'], [1, 2])");
    expect_run("def solve():\n    return int('42'), float('1.5'), str(3.0), bool([]), tuple([1])", "()",
               "(42, 1.5, '3.0', False, (1,))");

    // math is pre-bound and importable; other modules are not
    expect_run("from math import sqrt\ndef solve(n):\n    return sqrt(n), math.isqrt(n), math.gcd(12, 18)", "(16,)",
               "(4.0, 4, 6)");
    expect_run("import os\ndef solve():\n    return 1", "()", "ImportError: import of 'os' is not allowed");
    expect_run("from os import path\ndef solve():\n    return 1", "()", "ImportError: import of 'os' is not allowed");
    expect_run("from math import _private\ndef solve():\n    return 1", "()",
               "ImportError: cannot import name '_private' from 'math'");

    // No path to host capabilities
    expect_run("def solve():\n    return open('/etc/passwd')", "()", "NameError: name 'open' is not defined");
    expect_run("def solve():\n    return eval('1')", "()", "NameError: name 'eval' is not defined");
    expect_run("def solve():\n    return ().__class__", "()", "AttributeError: access to attribute '__class__' is not allowed");
    expect_run("def solve():\n    return 'x'._secret", "()", "AttributeError: access to attribute '_secret' is not allowed");

    // zip is implemented but only reachable when whitelisted
    {
        const std::string src = "def solve():\n    return list(zip([1, 2], 'ab'))";
        expect_eq_str(run(src), "NameError: name 'zip' is not defined", "zip off by default");
        expect_eq_str(run(src, "()", Capabilities::defaults().withBuiltin("zip")), "[(1, 'a'), (2, 'b')]",
                      "zip when whitelisted");
    }

    // Budgets
    expect_run("def solve(n):\n    return solve(n + 1)", "(0,)", "RecursionError: maximum recursion depth exceeded");
    {
        Interpreter in(Capabilities::defaults(), ExecBudget::withTimeout(std::chrono::milliseconds(50)));
        in.load("def solve():\n    while True:\n        pass\n");
        auto start = std::chrono::steady_clock::now();
        std::string err;
        try {
            in.call(*in.global("solve"), {});
        } catch (const ScriptError& e) {
            err = e.type();
        }
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
        expect_eq_str(err, "TimeoutError", "infinite loop hits the deadline");
        expect_true(ms < 1000, "deadline enforced promptly (" + std::to_string(ms) + " ms)");
    }
    {
        const std::string out = run("def solve():\n    return [0] * (1 << 30)");
        expect_true(out.rfind("MemoryError", 0) == 0, "huge list is a MemoryError: " + out);
    }

    // Reference cycles built by a script are broken when the interpreter goes away
    {
        std::weak_ptr<Object> list_cycle;
        std::weak_ptr<Object> dict_cycle;
        {
            Interpreter in(Capabilities::defaults(), ExecBudget::withTimeout(std::chrono::milliseconds(2000)));
            in.load("a = []\na.append(a)\nd = {}\nd['self'] = d\n");
            list_cycle = in.global("a")->obj;
            dict_cycle = in.global("d")->obj;
            expect_true(!list_cycle.expired() && !dict_cycle.expired(), "cycles alive while loaded");
        }
        expect_true(list_cycle.expired(), "list cycle released");
        expect_true(dict_cycle.expired(), "dict cycle released");
    }

    // Top-level statements run at load; loose control flow is rejected
    expect_eq_str(run("return 1\n"), "SyntaxError: 'return' outside function", "return at top level");

    // Every whitelisted builtin exists
    for (const auto& name : Capabilities::defaults().builtins()) {
        expect_true(find_builtin(name) != nullptr, "missing builtin " + name);
    }

    std::cerr << "test_interp: ALL PASSED" << std::endl;
    return 0;
}
