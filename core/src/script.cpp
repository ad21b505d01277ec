#include "evosynth/script.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unordered_set>

namespace evosynth {

[[noreturn]] static void syntax_error(int line, const std::string& msg) {
    throw ScriptError("SyntaxError", "line " + std::to_string(line) + ": " + msg);
}

// ---------------------------------------------------------------------------
// Tokenizer

static const char* const kOps3[] = {"**=", "//=", ">>=", "<<="};
static const char* const kOps2[] = {"**", "//", "==", "!=", "<=", ">=", "->", "+=", "-=", "*=",
                                    "/=", "%=", "&=", "|=", "^=", "<<", ">>"};
static const char kOps1[] = "+-*/%<>=()[]{},:.;~&|^";

static bool is_ident_start(char c) { return c == '_' || std::isalpha(static_cast<unsigned char>(c)); }
static bool is_ident_part(char c) { return c == '_' || std::isalnum(static_cast<unsigned char>(c)); }
static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

namespace {

class Lexer {
public:
    explicit Lexer(const std::string& src) : src_(src) {}

    std::vector<Token> run() {
        const size_t n = src_.size();
        bool at_line_start = true;

        while (i_ < n) {
            if (at_line_start && depth_ == 0) {
                if (!indentLine()) continue;
                at_line_start = false;
                if (i_ >= n) break;
            }

            char c = src_[i_];
            if (c == '\n') {
                if (depth_ == 0) {
                    emit(TokKind::NEWLINE, "");
                    at_line_start = true;
                }
                line_++;
                i_++;
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\r' || c == '\f') { i_++; continue; }
            if (c == '#') {
                while (i_ < n && src_[i_] != '\n') i_++;
                continue;
            }
            if (c == '\\' && i_ + 1 < n && src_[i_ + 1] == '\n') {
                i_ += 2;
                line_++;
                continue;
            }
            if (is_ident_start(c)) { lexName(); continue; }
            if (is_digit(c) || (c == '.' && i_ + 1 < n && is_digit(src_[i_ + 1]))) { lexNumber(); continue; }
            if (c == '\'' || c == '"') { lexString(false); continue; }
            lexOp();
        }

        if (depth_ > 0) syntax_error(line_, "unexpected EOF: bracket was never closed");
        if (!out_.empty() && out_.back().kind != TokKind::NEWLINE) emit(TokKind::NEWLINE, "");
        while (indents_.size() > 1) {
            indents_.pop_back();
            emit(TokKind::DEDENT, "");
        }
        emit(TokKind::END, "");
        return std::move(out_);
    }

private:
    const std::string& src_;
    size_t i_{0};
    int line_{1};
    int depth_{0};
    std::vector<int> indents_{0};
    std::vector<Token> out_;

    void emit(TokKind k, std::string text) {
        Token t;
        t.kind = k;
        t.text = std::move(text);
        t.line = line_;
        out_.push_back(std::move(t));
    }

    // Measures leading whitespace of a logical line and emits INDENT/DEDENT.
    // Returns false when the line was blank or comment-only and got skipped.
    bool indentLine() {
        const size_t n = src_.size();
        int col = 0;
        size_t j = i_;
        while (j < n && (src_[j] == ' ' || src_[j] == '\t' || src_[j] == '\f')) {
            if (src_[j] == '\t') col = (col / 8 + 1) * 8;
            else if (src_[j] == ' ') col++;
            j++;
        }
        if (j >= n) {
            i_ = j;
            return true;
        }
        if (src_[j] == '\n' || src_[j] == '\r' || src_[j] == '#') {
            while (j < n && src_[j] != '\n') j++;
            if (j < n) {
                j++;
                line_++;
            }
            i_ = j;
            return false;
        }
        i_ = j;
        if (col > indents_.back()) {
            indents_.push_back(col);
            emit(TokKind::INDENT, "");
        } else {
            while (col < indents_.back()) {
                indents_.pop_back();
                emit(TokKind::DEDENT, "");
            }
            if (col != indents_.back()) syntax_error(line_, "unindent does not match any outer indentation level");
        }
        return true;
    }

    void lexName() {
        size_t start = i_;
        while (i_ < src_.size() && is_ident_part(src_[i_])) i_++;
        std::string word = src_.substr(start, i_ - start);
        if (i_ < src_.size() && (src_[i_] == '\'' || src_[i_] == '"')) {
            std::string lower;
            for (char c : word) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            if (lower == "r" || lower == "b" || lower == "u" || lower == "rb" || lower == "br") {
                lexString(lower.find('r') != std::string::npos);
                return;
            }
            if (lower.find('f') != std::string::npos && lower.size() <= 2) {
                syntax_error(line_, "f-strings are not supported");
            }
        }
        emit(TokKind::NAME, std::move(word));
    }

    void lexNumber() {
        const size_t n = src_.size();
        size_t start = i_;
        bool is_float = false;

        if (src_[i_] == '0' && i_ + 1 < n && (src_[i_ + 1] == 'x' || src_[i_ + 1] == 'X')) {
            i_ += 2;
            size_t hstart = i_;
            while (i_ < n && (std::isxdigit(static_cast<unsigned char>(src_[i_])) || src_[i_] == '_')) i_++;
            std::string digits;
            for (size_t k = hstart; k < i_; k++) if (src_[k] != '_') digits.push_back(src_[k]);
            if (digits.empty()) syntax_error(line_, "invalid hexadecimal literal");
            errno = 0;
            unsigned long long v = std::strtoull(digits.c_str(), nullptr, 16);
            if (errno == ERANGE || v > static_cast<unsigned long long>(INT64_MAX)) {
                syntax_error(line_, "integer literal too large");
            }
            Token t;
            t.kind = TokKind::INT;
            t.ival = static_cast<int64_t>(v);
            t.text = src_.substr(start, i_ - start);
            t.line = line_;
            out_.push_back(std::move(t));
            return;
        }

        while (i_ < n && (is_digit(src_[i_]) || src_[i_] == '_')) i_++;
        if (i_ < n && src_[i_] == '.') {
            is_float = true;
            i_++;
            while (i_ < n && (is_digit(src_[i_]) || src_[i_] == '_')) i_++;
        }
        if (i_ < n && (src_[i_] == 'e' || src_[i_] == 'E')) {
            size_t k = i_ + 1;
            if (k < n && (src_[k] == '+' || src_[k] == '-')) k++;
            if (k < n && is_digit(src_[k])) {
                is_float = true;
                i_ = k;
                while (i_ < n && is_digit(src_[i_])) i_++;
            }
        }

        std::string text;
        for (size_t k = start; k < i_; k++) if (src_[k] != '_') text.push_back(src_[k]);

        Token t;
        t.text = text;
        t.line = line_;
        if (is_float) {
            t.kind = TokKind::FLOAT;
            t.fval = std::strtod(text.c_str(), nullptr);
        } else {
            t.kind = TokKind::INT;
            if (text.size() > 1 && text[0] == '0' && text.find_first_not_of('0') != std::string::npos) {
                syntax_error(line_, "leading zeros in decimal integer literals are not permitted");
            }
            errno = 0;
            long long v = std::strtoll(text.c_str(), nullptr, 10);
            if (errno == ERANGE) syntax_error(line_, "integer literal too large");
            t.ival = static_cast<int64_t>(v);
        }
        out_.push_back(std::move(t));
    }

    void lexString(bool raw) {
        const size_t n = src_.size();
        char q = src_[i_];
        bool triple = (i_ + 2 < n && src_[i_ + 1] == q && src_[i_ + 2] == q);
        i_ += triple ? 3 : 1;
        int start_line = line_;
        std::string value;

        while (true) {
            if (i_ >= n) syntax_error(start_line, "unterminated string literal");
            char c = src_[i_];
            if (triple) {
                if (c == q && i_ + 2 < n && src_[i_ + 1] == q && src_[i_ + 2] == q) {
                    i_ += 3;
                    break;
                }
            } else if (c == q) {
                i_++;
                break;
            }
            if (c == '\n') {
                if (!triple) syntax_error(start_line, "unterminated string literal");
                line_++;
            }
            if (c == '\\' && i_ + 1 < n) {
                char e = src_[i_ + 1];
                if (raw) {
                    value.push_back(c);
                    value.push_back(e);
                    if (e == '\n') line_++;
                    i_ += 2;
                    continue;
                }
                i_ += 2;
                switch (e) {
                    case 'n': value.push_back('\n'); break;
                    case 't': value.push_back('\t'); break;
                    case 'r': value.push_back('\r'); break;
                    case '0': value.push_back('\0'); break;
                    case '\\': value.push_back('\\'); break;
                    case '\'': value.push_back('\''); break;
                    case '"': value.push_back('"'); break;
                    case '\n': line_++; break;
                    case 'x': {
                        if (i_ + 1 < n && std::isxdigit(static_cast<unsigned char>(src_[i_])) &&
                            std::isxdigit(static_cast<unsigned char>(src_[i_ + 1]))) {
                            value.push_back(static_cast<char>(std::strtol(src_.substr(i_, 2).c_str(), nullptr, 16)));
                            i_ += 2;
                        } else {
                            syntax_error(line_, "truncated \\xXX escape");
                        }
                        break;
                    }
                    default:
                        value.push_back('\\');
                        value.push_back(e);
                }
                continue;
            }
            value.push_back(c);
            i_++;
        }
        Token t;
        t.kind = TokKind::STRING;
        t.text = std::move(value);
        t.line = start_line;
        out_.push_back(std::move(t));
    }

    void lexOp() {
        for (const char* op : kOps3) {
            if (src_.compare(i_, 3, op) == 0) {
                emit(TokKind::OP, op);
                i_ += 3;
                return;
            }
        }
        for (const char* op : kOps2) {
            if (src_.compare(i_, 2, op) == 0) {
                emit(TokKind::OP, op);
                i_ += 2;
                return;
            }
        }
        char c = src_[i_];
        if (c != '\0' && std::strchr(kOps1, c)) {
            if (c == '(' || c == '[' || c == '{') depth_++;
            if (c == ')' || c == ']' || c == '}') {
                if (depth_ == 0) syntax_error(line_, std::string("unmatched '") + c + "'");
                depth_--;
            }
            emit(TokKind::OP, std::string(1, c));
            i_++;
            return;
        }
        syntax_error(line_, std::string("invalid character '") + c + "'");
    }
};

} // namespace

std::vector<Token> tokenize(const std::string& source) {
    Lexer lx(source);
    return lx.run();
}

const char* binary_op_symbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::ADD: return "+";
        case BinaryOp::SUB: return "-";
        case BinaryOp::MUL: return "*";
        case BinaryOp::DIV: return "/";
        case BinaryOp::FLOORDIV: return "//";
        case BinaryOp::MOD: return "%";
        case BinaryOp::POW: return "**";
        case BinaryOp::BITOR: return "|";
        case BinaryOp::BITXOR: return "^";
        case BinaryOp::BITAND: return "&";
        case BinaryOp::LSHIFT: return "<<";
        case BinaryOp::RSHIFT: return ">>";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// Parser

namespace {

const std::unordered_set<std::string>& keywords() {
    static const std::unordered_set<std::string> kw = {
        "False", "None", "True", "and", "as", "assert", "async", "await", "break", "class",
        "continue", "def", "del", "elif", "else", "except", "finally", "for", "from", "global",
        "if", "import", "in", "is", "lambda", "nonlocal", "not", "or", "pass", "raise",
        "return", "try", "while", "with", "yield"};
    return kw;
}

constexpr int kMaxNesting = 96;

class Parser {
public:
    explicit Parser(std::vector<Token> toks) : toks_(std::move(toks)) {}

    std::shared_ptr<Program> parseProgram() {
        auto prog = std::make_shared<Program>();
        while (peek().kind != TokKind::END) {
            if (peek().kind == TokKind::NEWLINE) {
                next();
                continue;
            }
            if (peek().kind == TokKind::INDENT) fail("unexpected indent");
            parseStatementInto(prog->body);
        }
        return prog;
    }

    ExprPtr parseSingleExpression() {
        ExprPtr e = parseTestList();
        while (peek().kind == TokKind::NEWLINE) next();
        if (peek().kind != TokKind::END) fail("unexpected trailing input");
        return e;
    }

private:
    std::vector<Token> toks_;
    size_t pos_{0};
    int nesting_{0};

    struct DepthGuard {
        Parser& p;
        explicit DepthGuard(Parser& parser) : p(parser) {
            if (++p.nesting_ > kMaxNesting) p.fail("expression nested too deeply");
        }
        ~DepthGuard() { p.nesting_--; }
    };

    const Token& peek(size_t k = 0) const {
        size_t idx = pos_ + k;
        if (idx >= toks_.size()) return toks_.back();
        return toks_[idx];
    }
    const Token& next() {
        const Token& t = peek();
        if (pos_ < toks_.size()) pos_++;
        return t;
    }

    [[noreturn]] void fail(const std::string& msg) const { syntax_error(peek().line, msg); }

    bool isOp(const char* op, size_t k = 0) const {
        const Token& t = peek(k);
        return t.kind == TokKind::OP && t.text == op;
    }
    bool isKw(const char* kw, size_t k = 0) const {
        const Token& t = peek(k);
        return t.kind == TokKind::NAME && t.text == kw;
    }
    void expectOp(const char* op) {
        if (!isOp(op)) fail(std::string("expected '") + op + "'");
        next();
    }
    void expectKw(const char* kw) {
        if (!isKw(kw)) fail(std::string("expected '") + kw + "'");
        next();
    }
    std::string expectName() {
        const Token& t = peek();
        if (t.kind != TokKind::NAME || keywords().count(t.text)) fail("expected identifier");
        return next().text;
    }

    ExprPtr makeExpr(ExprKind k, int line) {
        auto e = std::make_unique<Expr>();
        e->kind = k;
        e->line = line;
        return e;
    }
    StmtPtr makeStmt(StmtKind k, int line) {
        auto s = std::make_unique<Stmt>();
        s->kind = k;
        s->line = line;
        return s;
    }

    // ---- statements ----

    void parseStatementInto(std::vector<StmtPtr>& out) {
        const Token& t = peek();
        if (t.kind == TokKind::NAME) {
            if (t.text == "def") { out.push_back(parseDef()); return; }
            if (t.text == "if") { out.push_back(parseIf()); return; }
            if (t.text == "while") { out.push_back(parseWhile()); return; }
            if (t.text == "for") { out.push_back(parseFor()); return; }
            if (t.text == "class" || t.text == "try" || t.text == "with" || t.text == "async") {
                fail("unsupported statement '" + t.text + "'");
            }
            if (t.text == "elif" || t.text == "else") fail("invalid syntax");
        }
        parseSimpleStatements(out);
    }

    void parseSimpleStatements(std::vector<StmtPtr>& out) {
        while (true) {
            out.push_back(parseSmallStatement());
            if (isOp(";")) {
                next();
                if (peek().kind == TokKind::NEWLINE) break;
                continue;
            }
            break;
        }
        if (peek().kind != TokKind::NEWLINE) fail("invalid syntax");
        next();
    }

    std::vector<StmtPtr> parseSuite() {
        std::vector<StmtPtr> body;
        if (peek().kind == TokKind::NEWLINE) {
            next();
            if (peek().kind != TokKind::INDENT) fail("expected an indented block");
            next();
            while (peek().kind != TokKind::DEDENT && peek().kind != TokKind::END) {
                if (peek().kind == TokKind::NEWLINE) {
                    next();
                    continue;
                }
                if (peek().kind == TokKind::INDENT) fail("unexpected indent");
                parseStatementInto(body);
            }
            if (peek().kind == TokKind::DEDENT) next();
        } else {
            parseSimpleStatements(body);
        }
        return body;
    }

    std::vector<Param> parseParams(const char* terminator) {
        std::vector<Param> params;
        bool seen_default = false;
        while (!isOp(terminator)) {
            if (isOp("*") || isOp("**")) fail("variadic parameters are not supported");
            Param p;
            p.name = expectName();
            for (const auto& other : params) {
                if (other.name == p.name) fail("duplicate argument '" + p.name + "' in function definition");
            }
            if (std::string(terminator) == ")" && isOp(":")) {
                next();
                (void)parseTest();   // annotation, ignored
            }
            if (isOp("=")) {
                next();
                p.default_value = parseTest();
                seen_default = true;
            } else if (seen_default) {
                fail("non-default argument follows default argument");
            }
            params.push_back(std::move(p));
            if (!isOp(",")) break;
            next();
        }
        return params;
    }

    StmtPtr parseDef() {
        int line = next().line;  // 'def'
        auto decl = std::make_shared<FunctionDecl>();
        decl->line = line;
        decl->name = expectName();
        expectOp("(");
        decl->params = parseParams(")");
        expectOp(")");
        if (isOp("->")) {
            next();
            (void)parseTest();
        }
        expectOp(":");
        decl->body = parseSuite();
        auto s = makeStmt(StmtKind::DEF, line);
        s->func = std::move(decl);
        return s;
    }

    StmtPtr parseIf() {
        int line = next().line;  // 'if' / 'elif'
        auto s = makeStmt(StmtKind::IF, line);
        s->test = parseTest();
        expectOp(":");
        s->body = parseSuite();
        if (isKw("elif")) {
            s->orelse.push_back(parseIf());
        } else if (isKw("else")) {
            next();
            expectOp(":");
            s->orelse = parseSuite();
        }
        return s;
    }

    StmtPtr parseWhile() {
        int line = next().line;
        auto s = makeStmt(StmtKind::WHILE, line);
        s->test = parseTest();
        expectOp(":");
        s->body = parseSuite();
        if (isKw("else")) {
            next();
            expectOp(":");
            s->orelse = parseSuite();
        }
        return s;
    }

    StmtPtr parseFor() {
        int line = next().line;
        auto s = makeStmt(StmtKind::FOR, line);
        s->targets.push_back(parseTargetList());
        expectKw("in");
        s->value = parseTestList();
        expectOp(":");
        s->body = parseSuite();
        if (isKw("else")) {
            next();
            expectOp(":");
            s->orelse = parseSuite();
        }
        return s;
    }

    static bool augOp(const std::string& t, BinaryOp* op) {
        static const struct { const char* text; BinaryOp op; } table[] = {
            {"+=", BinaryOp::ADD}, {"-=", BinaryOp::SUB}, {"*=", BinaryOp::MUL},
            {"/=", BinaryOp::DIV}, {"//=", BinaryOp::FLOORDIV}, {"%=", BinaryOp::MOD},
            {"**=", BinaryOp::POW}, {"&=", BinaryOp::BITAND}, {"|=", BinaryOp::BITOR},
            {"^=", BinaryOp::BITXOR}, {"<<=", BinaryOp::LSHIFT}, {">>=", BinaryOp::RSHIFT},
        };
        for (const auto& e : table) {
            if (t == e.text) {
                *op = e.op;
                return true;
            }
        }
        return false;
    }

    void checkAssignable(const Expr& e) {
        switch (e.kind) {
            case ExprKind::NAME:
            case ExprKind::SUBSCRIPT:
                return;
            case ExprKind::TUPLE:
            case ExprKind::LIST:
                for (const auto& sub : e.args) checkAssignable(*sub);
                return;
            case ExprKind::ATTRIBUTE:
                syntax_error(e.line, "attribute assignment is not supported");
            default:
                syntax_error(e.line, "cannot assign to expression");
        }
    }

    StmtPtr parseSmallStatement() {
        const Token& t = peek();
        int line = t.line;
        if (t.kind == TokKind::NAME) {
            if (t.text == "pass") { next(); return makeStmt(StmtKind::PASS, line); }
            if (t.text == "break") { next(); return makeStmt(StmtKind::BREAK, line); }
            if (t.text == "continue") { next(); return makeStmt(StmtKind::CONTINUE, line); }
            if (t.text == "return") {
                next();
                auto s = makeStmt(StmtKind::RETURN, line);
                if (peek().kind != TokKind::NEWLINE && !isOp(";")) s->value = parseTestList();
                return s;
            }
            if (t.text == "import") {
                next();
                auto s = makeStmt(StmtKind::IMPORT, line);
                s->module = parseDottedName();
                s->names.push_back(s->module);
                while (isOp(",")) {
                    next();
                    s->names.push_back(parseDottedName());
                }
                if (isKw("as")) {
                    next();
                    (void)expectName();
                }
                return s;
            }
            if (t.text == "from") {
                next();
                auto s = makeStmt(StmtKind::IMPORT_FROM, line);
                s->module = parseDottedName();
                expectKw("import");
                bool paren = false;
                if (isOp("(")) {
                    next();
                    paren = true;
                }
                if (isOp("*")) fail("wildcard import is not supported");
                while (true) {
                    s->names.push_back(expectName());
                    if (isKw("as")) fail("import aliases are not supported");
                    if (!isOp(",")) break;
                    next();
                    if (paren && isOp(")")) break;
                }
                if (paren) expectOp(")");
                return s;
            }
            if (t.text == "global" || t.text == "nonlocal" || t.text == "del" || t.text == "assert" ||
                t.text == "raise" || t.text == "yield") {
                fail("unsupported statement '" + t.text + "'");
            }
        }

        ExprPtr first = parseTestList();

        if (isOp("=")) {
            std::vector<ExprPtr> chain;
            chain.push_back(std::move(first));
            while (isOp("=")) {
                next();
                chain.push_back(parseTestList());
            }
            auto s = makeStmt(StmtKind::ASSIGN, line);
            s->value = std::move(chain.back());
            chain.pop_back();
            for (auto& target : chain) {
                checkAssignable(*target);
                s->targets.push_back(std::move(target));
            }
            return s;
        }

        BinaryOp op;
        if (peek().kind == TokKind::OP && augOp(peek().text, &op)) {
            next();
            if (first->kind != ExprKind::NAME && first->kind != ExprKind::SUBSCRIPT) {
                fail("illegal expression for augmented assignment");
            }
            auto s = makeStmt(StmtKind::AUG_ASSIGN, line);
            s->aug_op = op;
            s->targets.push_back(std::move(first));
            s->value = parseTestList();
            return s;
        }

        if (isOp(":") && first->kind == ExprKind::NAME) {
            // annotated assignment: `x: int = 0`
            next();
            (void)parseTest();
            if (!isOp("=")) return makeStmt(StmtKind::PASS, line);
            next();
            auto s = makeStmt(StmtKind::ASSIGN, line);
            s->targets.push_back(std::move(first));
            s->value = parseTest();
            return s;
        }

        auto s = makeStmt(StmtKind::EXPR, line);
        s->value = std::move(first);
        return s;
    }

    std::string parseDottedName() {
        std::string name = expectName();
        while (isOp(".")) {
            next();
            name += "." + expectName();
        }
        return name;
    }

    // ---- expressions ----

    bool atExprListEnd() const {
        const Token& t = peek();
        if (t.kind == TokKind::NEWLINE || t.kind == TokKind::END || t.kind == TokKind::DEDENT) return true;
        if (t.kind == TokKind::NAME && (t.text == "in" || t.text == "for")) return true;
        if (t.kind != TokKind::OP) return false;
        BinaryOp dummy;
        return t.text == ")" || t.text == "]" || t.text == "}" || t.text == "=" || t.text == ";" ||
               t.text == ":" || augOp(t.text, &dummy);
    }

    ExprPtr parseTestList() {
        int line = peek().line;
        ExprPtr first = parseTest();
        if (!isOp(",")) return first;
        auto tup = makeExpr(ExprKind::TUPLE, line);
        tup->args.push_back(std::move(first));
        while (isOp(",")) {
            next();
            if (atExprListEnd()) break;
            tup->args.push_back(parseTest());
        }
        return tup;
    }

    ExprPtr parseTargetList() {
        int line = peek().line;
        ExprPtr first = parseBitOr();
        if (!isOp(",")) {
            checkAssignable(*first);
            return first;
        }
        auto tup = makeExpr(ExprKind::TUPLE, line);
        tup->args.push_back(std::move(first));
        while (isOp(",")) {
            next();
            if (atExprListEnd()) break;
            tup->args.push_back(parseBitOr());
        }
        checkAssignable(*tup);
        return tup;
    }

    ExprPtr parseTest() {
        DepthGuard guard(*this);
        if (isKw("lambda")) return parseLambda();
        int line = peek().line;
        ExprPtr body = parseOr();
        if (!isKw("if")) return body;
        next();
        ExprPtr cond = parseOr();
        expectKw("else");
        ExprPtr orelse = parseTest();
        auto e = makeExpr(ExprKind::IF_EXP, line);
        e->args.push_back(std::move(body));
        e->args.push_back(std::move(cond));
        e->args.push_back(std::move(orelse));
        return e;
    }

    ExprPtr parseLambda() {
        int line = next().line;
        auto decl = std::make_shared<FunctionDecl>();
        decl->name = "<lambda>";
        decl->line = line;
        decl->params = parseParams(":");
        expectOp(":");
        decl->expr_body = parseTest();
        auto e = makeExpr(ExprKind::LAMBDA, line);
        e->lambda = std::move(decl);
        return e;
    }

    ExprPtr parseOr() {
        int line = peek().line;
        ExprPtr first = parseAnd();
        if (!isKw("or")) return first;
        auto e = makeExpr(ExprKind::OR, line);
        e->args.push_back(std::move(first));
        while (isKw("or")) {
            next();
            e->args.push_back(parseAnd());
        }
        return e;
    }

    ExprPtr parseAnd() {
        int line = peek().line;
        ExprPtr first = parseNot();
        if (!isKw("and")) return first;
        auto e = makeExpr(ExprKind::AND, line);
        e->args.push_back(std::move(first));
        while (isKw("and")) {
            next();
            e->args.push_back(parseNot());
        }
        return e;
    }

    ExprPtr parseNot() {
        if (isKw("not")) {
            DepthGuard guard(*this);
            int line = next().line;
            auto e = makeExpr(ExprKind::UNARY, line);
            e->un_op = UnaryOp::NOT;
            e->args.push_back(parseNot());
            return e;
        }
        return parseComparison();
    }

    bool compareOp(CompareOp* op) {
        const Token& t = peek();
        if (t.kind == TokKind::OP) {
            if (t.text == "<") { *op = CompareOp::LT; next(); return true; }
            if (t.text == ">") { *op = CompareOp::GT; next(); return true; }
            if (t.text == "<=") { *op = CompareOp::LE; next(); return true; }
            if (t.text == ">=") { *op = CompareOp::GE; next(); return true; }
            if (t.text == "==") { *op = CompareOp::EQ; next(); return true; }
            if (t.text == "!=") { *op = CompareOp::NE; next(); return true; }
            return false;
        }
        if (t.kind != TokKind::NAME) return false;
        if (t.text == "in") { *op = CompareOp::IN; next(); return true; }
        if (t.text == "not" && isKw("in", 1)) { *op = CompareOp::NOT_IN; next(); next(); return true; }
        if (t.text == "is") {
            next();
            if (isKw("not")) {
                next();
                *op = CompareOp::IS_NOT;
            } else {
                *op = CompareOp::IS;
            }
            return true;
        }
        return false;
    }

    ExprPtr parseComparison() {
        int line = peek().line;
        ExprPtr first = parseBitOr();
        CompareOp op;
        if (!compareOp(&op)) return first;
        auto e = makeExpr(ExprKind::COMPARE, line);
        e->args.push_back(std::move(first));
        e->cmp_ops.push_back(op);
        e->args.push_back(parseBitOr());
        while (compareOp(&op)) {
            e->cmp_ops.push_back(op);
            e->args.push_back(parseBitOr());
        }
        return e;
    }

    ExprPtr binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs, int line) {
        auto e = makeExpr(ExprKind::BINARY, line);
        e->bin_op = op;
        e->args.push_back(std::move(lhs));
        e->args.push_back(std::move(rhs));
        return e;
    }

    ExprPtr parseBitOr() {
        ExprPtr e = parseBitXor();
        while (isOp("|")) {
            int line = next().line;
            e = binary(BinaryOp::BITOR, std::move(e), parseBitXor(), line);
        }
        return e;
    }

    ExprPtr parseBitXor() {
        ExprPtr e = parseBitAnd();
        while (isOp("^")) {
            int line = next().line;
            e = binary(BinaryOp::BITXOR, std::move(e), parseBitAnd(), line);
        }
        return e;
    }

    ExprPtr parseBitAnd() {
        ExprPtr e = parseShift();
        while (isOp("&")) {
            int line = next().line;
            e = binary(BinaryOp::BITAND, std::move(e), parseShift(), line);
        }
        return e;
    }

    ExprPtr parseShift() {
        ExprPtr e = parseArith();
        while (isOp("<<") || isOp(">>")) {
            BinaryOp op = isOp("<<") ? BinaryOp::LSHIFT : BinaryOp::RSHIFT;
            int line = next().line;
            e = binary(op, std::move(e), parseArith(), line);
        }
        return e;
    }

    ExprPtr parseArith() {
        ExprPtr e = parseTerm();
        while (isOp("+") || isOp("-")) {
            BinaryOp op = isOp("+") ? BinaryOp::ADD : BinaryOp::SUB;
            int line = next().line;
            e = binary(op, std::move(e), parseTerm(), line);
        }
        return e;
    }

    ExprPtr parseTerm() {
        ExprPtr e = parseFactor();
        while (true) {
            BinaryOp op;
            if (isOp("*")) op = BinaryOp::MUL;
            else if (isOp("/")) op = BinaryOp::DIV;
            else if (isOp("//")) op = BinaryOp::FLOORDIV;
            else if (isOp("%")) op = BinaryOp::MOD;
            else break;
            int line = next().line;
            e = binary(op, std::move(e), parseFactor(), line);
        }
        return e;
    }

    ExprPtr parseFactor() {
        if (isOp("-") || isOp("+") || isOp("~")) {
            DepthGuard guard(*this);
            UnaryOp op = isOp("-") ? UnaryOp::NEG : (isOp("+") ? UnaryOp::POS : UnaryOp::INVERT);
            int line = next().line;
            auto e = makeExpr(ExprKind::UNARY, line);
            e->un_op = op;
            e->args.push_back(parseFactor());
            return e;
        }
        return parsePower();
    }

    ExprPtr parsePower() {
        ExprPtr base = parseAtomExpr();
        if (!isOp("**")) return base;
        int line = next().line;
        return binary(BinaryOp::POW, std::move(base), parseFactor(), line);
    }

    ExprPtr parseAtomExpr() {
        ExprPtr e = parseAtom();
        while (true) {
            if (isOp("(")) {
                int line = next().line;
                auto call = makeExpr(ExprKind::CALL, line);
                call->args.push_back(std::move(e));
                parseCallArgs(*call);
                e = std::move(call);
            } else if (isOp("[")) {
                int line = next().line;
                auto sub = makeExpr(ExprKind::SUBSCRIPT, line);
                sub->args.push_back(std::move(e));
                sub->args.push_back(parseSubscript());
                expectOp("]");
                e = std::move(sub);
            } else if (isOp(".")) {
                int line = next().line;
                auto attr = makeExpr(ExprKind::ATTRIBUTE, line);
                attr->name = expectName();
                attr->args.push_back(std::move(e));
                e = std::move(attr);
            } else {
                break;
            }
        }
        return e;
    }

    void parseCallArgs(Expr& call) {
        bool seen_keyword = false;
        while (!isOp(")")) {
            if (isOp("*") || isOp("**")) fail("argument unpacking is not supported");
            if (peek().kind == TokKind::NAME && isOp("=", 1) && !keywords().count(peek().text)) {
                KeywordArg kw;
                kw.name = next().text;
                next();  // '='
                kw.value = parseTest();
                call.keywords.push_back(std::move(kw));
                seen_keyword = true;
            } else {
                if (seen_keyword) fail("positional argument follows keyword argument");
                int line = peek().line;
                ExprPtr arg = parseTest();
                if (isKw("for")) {
                    if (call.args.size() != 1) fail("generator expression must be parenthesized");
                    auto gen = makeExpr(ExprKind::GEN_EXP, line);
                    gen->args.push_back(std::move(arg));
                    parseComprehensions(*gen);
                    arg = std::move(gen);
                    call.args.push_back(std::move(arg));
                    if (!isOp(")")) fail("generator expression must be parenthesized");
                    break;
                }
                call.args.push_back(std::move(arg));
            }
            if (!isOp(",")) break;
            next();
        }
        expectOp(")");
    }

    bool atSliceEnd() const { return isOp("]") || isOp(":") || isOp(","); }

    ExprPtr parseSliceOrTest() {
        int line = peek().line;
        ExprPtr lower;
        if (!isOp(":")) {
            lower = parseTest();
            if (!isOp(":")) return lower;
        }
        next();  // ':'
        auto sl = makeExpr(ExprKind::SLICE, line);
        sl->args.push_back(std::move(lower));
        sl->args.push_back(atSliceEnd() ? nullptr : parseTest());
        if (isOp(":")) {
            next();
            sl->args.push_back(atSliceEnd() ? nullptr : parseTest());
        } else {
            sl->args.push_back(nullptr);
        }
        return sl;
    }

    ExprPtr parseSubscript() {
        int line = peek().line;
        ExprPtr first = parseSliceOrTest();
        if (!isOp(",")) return first;
        auto tup = makeExpr(ExprKind::TUPLE, line);
        tup->args.push_back(std::move(first));
        while (isOp(",")) {
            next();
            if (isOp("]")) break;
            tup->args.push_back(parseSliceOrTest());
        }
        return tup;
    }

    void parseComprehensions(Expr& e) {
        while (isKw("for")) {
            next();
            Comprehension c;
            c.target = parseTargetList();
            expectKw("in");
            c.iter = parseOr();
            while (isKw("if")) {
                next();
                c.conds.push_back(parseOr());
            }
            e.generators.push_back(std::move(c));
        }
    }

    ExprPtr parseAtom() {
        DepthGuard guard(*this);
        const Token& t = peek();
        int line = t.line;

        switch (t.kind) {
            case TokKind::NAME: {
                if (t.text == "True" || t.text == "False") {
                    auto e = makeExpr(ExprKind::LITERAL, line);
                    e->literal = Value::boolean(t.text == "True");
                    next();
                    return e;
                }
                if (t.text == "None") {
                    next();
                    return makeExpr(ExprKind::LITERAL, line);
                }
                if (keywords().count(t.text)) fail("invalid syntax near '" + t.text + "'");
                auto e = makeExpr(ExprKind::NAME, line);
                e->name = next().text;
                return e;
            }
            case TokKind::INT: {
                auto e = makeExpr(ExprKind::LITERAL, line);
                e->literal = Value::integer(next().ival);
                return e;
            }
            case TokKind::FLOAT: {
                auto e = makeExpr(ExprKind::LITERAL, line);
                e->literal = Value::real(next().fval);
                return e;
            }
            case TokKind::STRING: {
                std::string s;
                while (peek().kind == TokKind::STRING) s += next().text;
                auto e = makeExpr(ExprKind::LITERAL, line);
                e->literal = Value::str(std::move(s));
                return e;
            }
            case TokKind::OP:
                break;
            default:
                fail("invalid syntax");
        }

        if (isOp("(")) {
            next();
            if (isOp(")")) {
                next();
                return makeExpr(ExprKind::TUPLE, line);
            }
            ExprPtr first = parseTest();
            if (isKw("for")) {
                auto gen = makeExpr(ExprKind::GEN_EXP, line);
                gen->args.push_back(std::move(first));
                parseComprehensions(*gen);
                expectOp(")");
                return gen;
            }
            if (!isOp(",")) {
                expectOp(")");
                return first;
            }
            auto tup = makeExpr(ExprKind::TUPLE, line);
            tup->args.push_back(std::move(first));
            while (isOp(",")) {
                next();
                if (isOp(")")) break;
                tup->args.push_back(parseTest());
            }
            expectOp(")");
            return tup;
        }

        if (isOp("[")) {
            next();
            auto lst = makeExpr(ExprKind::LIST, line);
            if (isOp("]")) {
                next();
                return lst;
            }
            ExprPtr first = parseTest();
            if (isKw("for")) {
                auto comp = makeExpr(ExprKind::LIST_COMP, line);
                comp->args.push_back(std::move(first));
                parseComprehensions(*comp);
                expectOp("]");
                return comp;
            }
            lst->args.push_back(std::move(first));
            while (isOp(",")) {
                next();
                if (isOp("]")) break;
                lst->args.push_back(parseTest());
            }
            expectOp("]");
            return lst;
        }

        if (isOp("{")) {
            next();
            if (isOp("}")) {
                next();
                return makeExpr(ExprKind::DICT, line);
            }
            ExprPtr first = parseTest();
            if (isOp(":")) {
                next();
                ExprPtr value = parseTest();
                if (isKw("for")) {
                    auto comp = makeExpr(ExprKind::DICT_COMP, line);
                    comp->args.push_back(std::move(first));
                    comp->args.push_back(std::move(value));
                    parseComprehensions(*comp);
                    expectOp("}");
                    return comp;
                }
                auto d = makeExpr(ExprKind::DICT, line);
                d->args.push_back(std::move(first));
                d->args.push_back(std::move(value));
                while (isOp(",")) {
                    next();
                    if (isOp("}")) break;
                    d->args.push_back(parseTest());
                    expectOp(":");
                    d->args.push_back(parseTest());
                }
                expectOp("}");
                return d;
            }
            if (isKw("for")) {
                auto comp = makeExpr(ExprKind::SET_COMP, line);
                comp->args.push_back(std::move(first));
                parseComprehensions(*comp);
                expectOp("}");
                return comp;
            }
            auto st = makeExpr(ExprKind::SET, line);
            st->args.push_back(std::move(first));
            while (isOp(",")) {
                next();
                if (isOp("}")) break;
                st->args.push_back(parseTest());
            }
            expectOp("}");
            return st;
        }

        fail("invalid syntax near '" + t.text + "'");
    }
};

} // namespace

std::shared_ptr<const Program> parse_program(const std::string& source) {
    Parser p(tokenize(source));
    return p.parseProgram();
}

ExprPtr parse_expression(const std::string& source) {
    Parser p(tokenize(source));
    return p.parseSingleExpression();
}

static Value literal_value(const Expr& e) {
    switch (e.kind) {
        case ExprKind::LITERAL:
            return e.literal;
        case ExprKind::TUPLE:
        case ExprKind::LIST: {
            std::vector<Value> items;
            items.reserve(e.args.size());
            for (const auto& a : e.args) items.push_back(literal_value(*a));
            return e.kind == ExprKind::TUPLE ? Value::tuple(std::move(items)) : Value::list(std::move(items));
        }
        case ExprKind::SET: {
            Value out = Value::set();
            for (const auto& a : e.args) set_of(out).add(literal_value(*a));
            return out;
        }
        case ExprKind::DICT: {
            Value out = Value::dict();
            for (size_t k = 0; k + 1 < e.args.size(); k += 2) {
                dict_of(out).put(literal_value(*e.args[k]), literal_value(*e.args[k + 1]));
            }
            return out;
        }
        case ExprKind::UNARY: {
            if (e.un_op != UnaryOp::NEG && e.un_op != UnaryOp::POS) break;
            Value v = literal_value(*e.args[0]);
            if (v.kind == ValueKind::INT) return Value::integer(e.un_op == UnaryOp::NEG ? -v.i : v.i);
            if (v.kind == ValueKind::FLOAT) return Value::real(e.un_op == UnaryOp::NEG ? -v.f : v.f);
            break;
        }
        default:
            break;
    }
    throw ScriptError("ValueError", "malformed literal at line " + std::to_string(e.line));
}

Value parse_literal(const std::string& source) {
    ExprPtr e = parse_expression(source);
    return literal_value(*e);
}

} // namespace evosynth
