#pragma once

// Candidate script language: tokens, syntax tree and parser.
//
// The language is an indentation-structured subset of Python syntax, large
// enough for the seed programs of the built-in tasks. Parse failures throw
// ScriptError("SyntaxError", "line N: ...").

#include "evosynth/value.h"

#include <memory>
#include <string>
#include <vector>

namespace evosynth {

// ---------------- Tokens ----------------

enum class TokKind {
    NAME,
    INT,
    FLOAT,
    STRING,
    OP,
    NEWLINE,
    INDENT,
    DEDENT,
    END,
};

struct Token {
    TokKind kind{TokKind::END};
    std::string text;   // identifier, operator, or decoded string literal
    int64_t ival{0};
    double fval{0.0};
    int line{0};
};

std::vector<Token> tokenize(const std::string& source);

// ---------------- Syntax tree ----------------

enum class BinaryOp { ADD, SUB, MUL, DIV, FLOORDIV, MOD, POW, BITOR, BITXOR, BITAND, LSHIFT, RSHIFT };
enum class UnaryOp { NEG, POS, INVERT, NOT };
enum class CompareOp { LT, GT, LE, GE, EQ, NE, IN, NOT_IN, IS, IS_NOT };

const char* binary_op_symbol(BinaryOp op);

enum class ExprKind {
    LITERAL,
    NAME,
    TUPLE,
    LIST,
    DICT,
    SET,
    LIST_COMP,
    SET_COMP,
    DICT_COMP,
    GEN_EXP,
    BINARY,
    UNARY,
    AND,
    OR,
    COMPARE,
    IF_EXP,
    LAMBDA,
    CALL,
    ATTRIBUTE,
    SUBSCRIPT,
    SLICE,
};

struct Expr;
struct Stmt;
struct FunctionDecl;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

struct Comprehension {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> conds;
};

struct KeywordArg {
    std::string name;
    ExprPtr value;
};

struct Expr {
    ExprKind kind{ExprKind::LITERAL};
    int line{0};

    Value literal;                 // LITERAL
    std::string name;              // NAME, ATTRIBUTE (attribute name)
    BinaryOp bin_op{BinaryOp::ADD};
    UnaryOp un_op{UnaryOp::NEG};
    std::vector<CompareOp> cmp_ops;

    // Operands. Meaning by kind:
    //   TUPLE/LIST/SET: elements; DICT: key,value,key,value...
    //   *_COMP/GEN_EXP: [element] or [key, value] for DICT_COMP
    //   BINARY/AND/OR/COMPARE: operands left to right; UNARY: [operand]
    //   IF_EXP: [body, test, orelse]; CALL: [callee, positional...]
    //   ATTRIBUTE: [object]; SUBSCRIPT: [object, index]
    //   SLICE: [lower, upper, step] with null for omitted parts
    std::vector<ExprPtr> args;
    std::vector<KeywordArg> keywords;        // CALL
    std::vector<Comprehension> generators;   // *_COMP, GEN_EXP
    std::shared_ptr<FunctionDecl> lambda;    // LAMBDA
};

struct Param {
    std::string name;
    ExprPtr default_value;
};

struct FunctionDecl {
    std::string name;
    int line{0};
    std::vector<Param> params;
    std::vector<StmtPtr> body;
    ExprPtr expr_body;   // lambdas
};

enum class StmtKind {
    EXPR,
    ASSIGN,
    AUG_ASSIGN,
    IF,
    WHILE,
    FOR,
    DEF,
    RETURN,
    PASS,
    BREAK,
    CONTINUE,
    IMPORT,
    IMPORT_FROM,
};

struct Stmt {
    StmtKind kind{StmtKind::PASS};
    int line{0};

    std::vector<ExprPtr> targets;   // ASSIGN (a = b = v), AUG_ASSIGN, FOR
    ExprPtr value;                  // EXPR, ASSIGN, AUG_ASSIGN, RETURN (nullable), FOR iterable
    BinaryOp aug_op{BinaryOp::ADD};
    ExprPtr test;                   // IF, WHILE
    std::vector<StmtPtr> body;
    std::vector<StmtPtr> orelse;
    std::shared_ptr<FunctionDecl> func;   // DEF
    std::string module;                   // IMPORT, IMPORT_FROM
    std::vector<std::string> names;       // IMPORT_FROM
};

struct Program {
    std::vector<StmtPtr> body;
};

// Parse a whole program.
std::shared_ptr<const Program> parse_program(const std::string& source);

// Parse a single expression (used for literal task data).
ExprPtr parse_expression(const std::string& source);

// Evaluate a constant expression built only from literals and displays
// (numbers, strings, True/False/None, tuples, lists, dicts, sets, unary minus).
// Throws ScriptError("ValueError") for anything else.
Value parse_literal(const std::string& source);

} // namespace evosynth
