#include "test_common.h"
#include "evosynth/serialization.h"
#include "evosynth/value.h"

#include <memory>
#include <string>

using namespace evosynth;

int main() {
    // Float rendering matches the script's repr
    expect_eq_str(format_float(0.1), "0.1", "0.1");
    expect_eq_str(format_float(1.0), "1.0", "1.0");
    expect_eq_str(format_float(1e16), "1e+16", "large exponent");
    expect_eq_str(format_float(0.0001), "0.0001", "small positional");
    expect_eq_str(format_float(-2.5), "-2.5", "negative");

    // Cross-type numeric equality and hashing agree
    expect_true(values_equal(Value::integer(1), Value::real(1.0)), "1 == 1.0");
    expect_true(values_equal(Value::boolean(true), Value::integer(1)), "True == 1");
    expect_true(hash_value(Value::integer(1)) == hash_value(Value::real(1.0)), "hash(1) == hash(1.0)");
    expect_true(!values_equal(Value::list({Value::integer(1)}), Value::tuple({Value::integer(1)})), "[1] != (1,)");
    expect_true(values_less(Value::str("abc"), Value::str("abd")), "string ordering");
    expect_true(values_less(Value::tuple({Value::integer(1), Value::integer(2)}),
                            Value::tuple({Value::integer(1), Value::integer(3)})), "tuple ordering");

    // Unordered and unhashable kinds raise TypeError
    {
        bool threw = false;
        try { values_less(Value::none(), Value::integer(1)); } catch (const ScriptError& e) { threw = e.type() == "TypeError"; }
        expect_true(threw, "None < 1 is a TypeError");
        threw = false;
        try { hash_value(Value::list()); } catch (const ScriptError& e) { threw = e.type() == "TypeError"; }
        expect_true(threw, "list is unhashable");
    }

    // Dicts keep insertion order; 1 and 1.0 are the same key
    {
        Value d = Value::dict();
        dict_of(d).put(Value::str("b"), Value::integer(1));
        dict_of(d).put(Value::str("a"), Value::integer(2));
        dict_of(d).put(Value::integer(1), Value::str("int"));
        dict_of(d).put(Value::real(1.0), Value::str("float"));
        expect_eq_str(repr(d), "{'b': 1, 'a': 2, 1: 'float'}", "dict order and key merge");
        expect_true(dict_of(d).erase(Value::str("b")), "erase");
        expect_eq_str(repr(d), "{'a': 2, 1: 'float'}", "after erase");
    }

    // Truthiness
    expect_true(!truthy(Value::str("")), "empty str falsy");
    expect_true(truthy(Value::list({Value::none()})), "non-empty list truthy");
    expect_true(!truthy(Value::range(0, 0, 1)), "empty range falsy");

    // Tagged json keeps every distinction
    {
        Value s = Value::set();
        set_of(s).add(Value::integer(3));
        Value v = Value::tuple({Value::none(), Value::real(2.0), Value::list({Value::boolean(false)}), s,
                                Value::range(0, 10, 2), Value::str("x\"y")});
        json_object* j = value_to_json(v);
        JsonGuard guard(j);
        Value back;
        std::string err;
        expect_true(value_from_json(j, &back, &err), "decode: " + err);
        expect_eq_str(repr(back), repr(v), "tagged round-trip");
        expect_true(back.items()[1].kind == ValueKind::FLOAT, "2.0 stays a float");

        bool threw = false;
        try {
            json_object* f = value_to_json(Value::range(0, 1, 1));
            json_object_put(f);
            Value m;
            m.kind = ValueKind::MODULE;
            value_to_json(m);
        } catch (const ScriptError& e) {
            threw = e.type() == "TypeError";
        }
        expect_true(threw, "modules are not transferable");
    }

    // Recursive containers: identity equality, [...] rendering, RecursionError
    {
        Value a = Value::list();
        a.items().push_back(a);
        expect_true(values_equal(a, a), "a cycle equals itself");
        expect_eq_str(repr(a), "[[...]]", "recursive list repr");

        Value d = Value::dict();
        dict_of(d).put(Value::str("k"), d);
        expect_eq_str(repr(d), "{'k': {...}}", "recursive dict repr");

        Value b = Value::list();
        b.items().push_back(b);
        bool threw = false;
        try { values_equal(a, b); } catch (const ScriptError& e) { threw = e.type() == "RecursionError"; }
        expect_true(threw, "two distinct cycles compare with RecursionError");

        std::weak_ptr<Object> wa = a.obj;
        clear_object(*a.obj);
        clear_object(*b.obj);
        clear_object(*d.obj);
        expect_true(a.items().empty(), "clear_object empties the list");
        a = Value::none();
        expect_true(wa.expired(), "cleared cycle is freed");
    }

    // Nesting beyond the limit is a RecursionError, not a stack overflow
    {
        Value deep = Value::tuple();
        for (int k = 0; k < 2 * kMaxNestingDepth; k++) deep = Value::tuple({deep});
        for (int which = 0; which < 3; which++) {
            bool threw = false;
            try {
                if (which == 0) repr(deep);
                else if (which == 1) hash_value(deep);
                else values_less(deep, Value::tuple({deep}));
            } catch (const ScriptError& e) {
                threw = e.type() == "RecursionError";
            }
            expect_true(threw, "deep nesting raises RecursionError (" + std::to_string(which) + ")");
        }
        expect_eq_str(repr(Value::tuple({Value::integer(1)})), "(1,)", "guard state restored after unwinding");
    }

    // A long reference chain is released without deep recursion
    {
        std::weak_ptr<Object> innermost;
        {
            Value chain = Value::list();
            innermost = chain.obj;
            for (int k = 0; k < 300000; k++) chain = Value::list({chain});
        }
        expect_true(innermost.expired(), "chain released");
    }

    std::cerr << "test_value: ALL PASSED" << std::endl;
    return 0;
}
