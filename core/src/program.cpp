#include "evosynth/program.h"

#include <algorithm>

namespace evosynth {

const std::vector<std::string>& token_pool() {
    static const std::vector<std::string> pool = {
        " ", "  ", "\n", ":", "(", ")", "[", "]", "{", "}", ",", "+", "-", "*", "//", "%",
        "==", "!=", "<", ">", "<=", ">=", "=",
        "return", "if", "else", "for", "while", "in", "not", "and", "or",
        "True", "False", "None",
        "range", "len", "sum", "abs", "min", "max", "sorted", "reversed", "list", "set", "dict",
    };
    return pool;
}

const std::vector<std::string>& constant_pool() {
    static const std::vector<std::string> pool = {"0", "1", "2", "3", "4", "5", "6", "7", "8", "9", "10"};
    return pool;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            out.push_back(text.substr(start));
            break;
        }
        out.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

static std::string lstrip(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r' || s[i] == '\f' || s[i] == '\v')) i++;
    return s.substr(i);
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string sanitize(const std::string& code) {
    std::vector<std::string> kept;
    for (const auto& ln : split_lines(code)) {
        std::string t = lstrip(ln);
        if (starts_with(t, "import ") || starts_with(t, "from ")) {
            if (ln != kDefaultImports) continue;
        }
        if (ln.find("__") != std::string::npos) continue;
        kept.push_back(ln);
    }
    return join_lines(kept);
}

std::string assemble(const std::string& body) {
    return std::string(kStubHeader) + "\n" + kDefaultImports + "\n" + body + "\n";
}

std::string extract_body(const std::string& code) {
    const std::string header = std::string(kStubHeader) + "\n";
    const std::string imports = std::string(kDefaultImports) + "\n";
    size_t pos = 0;
    if (code.compare(pos, header.size(), header) == 0) pos += header.size();
    if (code.compare(pos, imports.size(), imports) == 0) pos += imports.size();
    std::string body = code.substr(pos);
    if (!body.empty() && body.back() == '\n') body.pop_back();
    return body;
}

static std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
    std::string out;
    size_t start = 0;
    while (true) {
        size_t hit = s.find(from, start);
        if (hit == std::string::npos) break;
        out.append(s, start, hit - start);
        out += to;
        start = hit + from.size();
    }
    out.append(s, start, std::string::npos);
    return out;
}

std::string mutate(const std::string& body, double intensity, Rng& rng) {
    std::string s = body.empty() ? std::string("pass") : body;

    const size_t edits = std::max<size_t>(1, (size_t)((double)s.size() * intensity * 0.05));
    for (size_t e = 0; e < edits; e++) {
        const int op = (int)rng.index(4);
        const size_t idx = s.empty() ? 0 : rng.index(s.size());
        switch (op) {
            case 0: {  // insert token
                const auto& pool = rng.index(2) == 0 ? token_pool() : constant_pool();
                s.insert(idx, rng.choice(pool));
                break;
            }
            case 1:  // delete, keeping at least one character
                if (s.size() > 1) s.erase(idx, 1);
                break;
            case 2: {  // replace with the first char of a token
                const auto& pool = rng.index(2) == 0 ? token_pool() : constant_pool();
                const std::string& tok = rng.choice(pool);
                if (!s.empty()) s[idx] = tok.empty() ? ' ' : tok[0];
                break;
            }
            default:  // sprinkle a small int literal
                s.insert(idx, rng.choice(constant_pool()));
                break;
        }
    }
    return s;
}

std::string crossover(const std::string& a, const std::string& b, Rng& rng) {
    std::vector<std::string> alines = split_lines(a);
    std::vector<std::string> blines = split_lines(b);
    if (alines.empty() || blines.empty()) return a;

    const size_t i = rng.index(alines.size());
    const size_t j = rng.index(blines.size());
    std::vector<std::string> child(alines.begin(), alines.begin() + (long)i);
    child.insert(child.end(), blines.begin() + (long)j, blines.end());
    return join_lines(child);
}

std::string make_seed(const Task& task, Rng& rng) {
    const std::string seed = task.seeds.empty() ? std::string(kFallbackSeed) : rng.choice(task.seeds);
    std::string body;
    switch (rng.index(3)) {
        case 0:
            body = seed;
            break;
        case 1:
            body = replace_all(seed, "  ", " ") + "\n";
            break;
        default:
            body = "\n" + seed + "\n";
            break;
    }
    return assemble(body);
}

} // namespace evosynth
