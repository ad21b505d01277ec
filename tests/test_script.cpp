#include "test_common.h"
#include "evosynth/script.h"
#include "evosynth/value.h"

#include <string>

using namespace evosynth;

static std::string syntax_error_of(const std::string& src) {
    try {
        parse_program(src);
    } catch (const ScriptError& e) {
        if (e.type() != "SyntaxError") die("expected SyntaxError, got " + std::string(e.what()));
        return e.what();
    }
    die("expected SyntaxError for: " + src);
    return "";
}

int main() {
    // Literals used by task definitions
    {
        Value v = parse_literal("((2,7,11,15), 9)");
        expect_true(v.kind == ValueKind::TUPLE, "two_sum args should be a tuple");
        expect_eq_ll((long long)v.items().size(), 2, "two_sum args arity");
        expect_eq_str(repr(v), "((2, 7, 11, 15), 9)", "tuple repr");

        expect_eq_str(repr(parse_literal("(42,)")), "(42,)", "1-tuple repr");
        expect_eq_str(repr(parse_literal("-3")), "-3", "negative literal");
        expect_eq_str(repr(parse_literal("[1.5, None, True, 'a\\nb']")), "[1.5, None, True, 'a\\nb']", "mixed list");
        expect_eq_str(repr(parse_literal("{'a': 1, 'b': (2,)}")), "{'a': 1, 'b': (2,)}", "dict literal");
        expect_eq_str(repr(parse_literal("'ab' 'cd'")), "'abcd'", "adjacent string concatenation");
        expect_eq_str(repr(parse_literal("0x1f")), "31", "hex literal");
        expect_eq_str(repr(parse_literal("1e3")), "1000.0", "exponent literal");
    }

    // Non-constant expressions are not literals
    {
        bool threw = false;
        try {
            parse_literal("len([1])");
        } catch (const ScriptError& e) {
            threw = e.type() == "ValueError";
        }
        expect_true(threw, "call expression should be a malformed literal");
    }

    // The original seeds parse, including single-line suites and annotations
    {
        auto p = parse_program(
            "def solve(n:int)->bool:\n    if n<2: return False\n    if n%2==0: return n==2\n    i=3\n"
            "    r=int(n**0.5)\n    while i<=r:\n        if n%i==0: return False\n        i+=2\n    return True");
        expect_eq_ll((long long)p->body.size(), 1, "one top-level def");

        auto q = parse_program("# Evolved by CodeTrainer\nfrom math import sqrt\n\ndef solve(a,b):\n"
                               "    la,lb=len(a),len(b)\n    dp=[[0]*(lb+1) for _ in range(la+1)]\n    return dp[la][lb]\n");
        expect_eq_ll((long long)q->body.size(), 2, "import plus def");
    }

    // Bracketed continuation and comments
    {
        auto p = parse_program("x = [1,\n     2,  # two\n     3]\ny = x[1:] ; z = 1\n");
        expect_eq_ll((long long)p->body.size(), 3, "semicolon-separated statements");
    }

    // Malformed programs are SyntaxErrors that carry the line number
    {
        std::string e1 = syntax_error_of("def solve(x)\n    return x\n");
        expect_true(e1.find("line 1") != std::string::npos, "missing colon reports line 1: " + e1);

        std::string e2 = syntax_error_of("def solve(x):\n    return x\n  y = 1\n");
        expect_true(e2.find("line 3") != std::string::npos, "bad dedent reports line 3: " + e2);

        syntax_error_of("def solve(x):\nreturn x\n");
        syntax_error_of("x = (1, 2\n");
        syntax_error_of("x = 'unterminated\n");
        syntax_error_of("x = f'{y}'\n");
        syntax_error_of("x = 012\n");
        syntax_error_of("class A:\n    pass\n");
        syntax_error_of("x = 99999999999999999999\n");
    }

    // Deep nesting is rejected instead of exhausting the native stack
    {
        std::string deep(500, '(');
        deep += "1";
        deep += std::string(500, ')');
        syntax_error_of("x = " + deep + "\n");
    }

    std::cerr << "test_script: ALL PASSED" << std::endl;
    return 0;
}
