#include "js_parser.hpp"

#include <array>
#include <cctype>
#include <string>

namespace quickpack::js {

namespace {

constexpr size_t npos = std::string_view::npos;

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool is_ident_part(char c) {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// Keywords after which a `/` starts a regular expression
bool is_regex_keyword(std::string_view word) {
    static constexpr std::array<std::string_view, 14> keywords = {
        "return", "typeof", "instanceof", "in", "of", "new", "delete",
        "void", "throw", "case", "do", "else", "yield", "await"};
    for (auto keyword : keywords) {
        if (word == keyword) return true;
    }
    return false;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::optional<uint32_t> parse_hex(std::string_view digits) {
    if (digits.empty()) return std::nullopt;
    uint32_t value = 0;
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 16 + static_cast<uint32_t>(std::isdigit(static_cast<unsigned char>(c))
                                                      ? c - '0'
                                                      : (std::tolower(c) - 'a' + 10));
    }
    return value;
}

std::string_view trim(std::string_view text) {
    size_t begin = 0;
    while (begin < text.size() && is_space(text[begin])) ++begin;
    size_t end = text.size();
    while (end > begin && is_space(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

// ============================================================================
// Lexical helpers shared by the module scanner and the expression parser
// ============================================================================

class Lexer {
public:
    explicit Lexer(std::string_view src) : src_(src) {}

    [[nodiscard]] std::string_view src() const noexcept { return src_; }

    // Position after whitespace and comments starting at pos
    [[nodiscard]] size_t skip_trivia(size_t pos, size_t end) const {
        while (pos < end) {
            char c = src_[pos];
            if (is_space(c)) {
                ++pos;
            } else if (c == '/' && pos + 1 < end && src_[pos + 1] == '/') {
                size_t eol = src_.find('\n', pos);
                pos = eol == npos || eol > end ? end : eol;
            } else if (c == '/' && pos + 1 < end && src_[pos + 1] == '*') {
                size_t close = src_.find("*/", pos + 2);
                pos = close == npos || close + 2 > end ? end : close + 2;
            } else {
                break;
            }
        }
        return pos;
    }

    // pos is at a quote; returns the position after the closing quote or npos
    [[nodiscard]] size_t skip_string(size_t pos) const {
        const char quote = src_[pos];
        for (size_t i = pos + 1; i < src_.size(); ++i) {
            if (src_[i] == '\\') {
                ++i;
            } else if (src_[i] == quote) {
                return i + 1;
            } else if (src_[i] == '\n') {
                return npos;
            }
        }
        return npos;
    }

    // pos is at a backtick; returns the position after the closing backtick or npos
    [[nodiscard]] size_t skip_template(size_t pos) const {
        for (size_t i = pos + 1; i < src_.size(); ++i) {
            if (src_[i] == '\\') {
                ++i;
            } else if (src_[i] == '`') {
                return i + 1;
            } else if (src_[i] == '$' && i + 1 < src_.size() && src_[i + 1] == '{') {
                size_t close = find_closing(i + 1);
                if (close == npos) return npos;
                i = close;
            }
        }
        return npos;
    }

    // pos is at the opening '/'; returns the position after the flags or npos
    [[nodiscard]] size_t skip_regex(size_t pos) const {
        bool in_class = false;
        for (size_t i = pos + 1; i < src_.size(); ++i) {
            char c = src_[i];
            if (c == '\\') {
                ++i;
            } else if (c == '\n') {
                return npos;
            } else if (c == '[') {
                in_class = true;
            } else if (c == ']') {
                in_class = false;
            } else if (c == '/' && !in_class) {
                size_t end = i + 1;
                while (end < src_.size() && is_ident_part(src_[end])) ++end;
                return end;
            }
        }
        return npos;
    }

    [[nodiscard]] size_t skip_word(size_t pos) const {
        while (pos < src_.size() && is_ident_part(src_[pos])) ++pos;
        return pos;
    }

    // pos is at '(', '[' or '{'; returns the index of the matching closer or npos
    [[nodiscard]] size_t find_closing(size_t pos) const {
        std::string stack;
        char prev = '(';
        std::string_view prev_word;

        size_t i = pos;
        while (i < src_.size()) {
            char c = src_[i];
            if (is_space(c)) {
                ++i;
                continue;
            }
            if (c == '/' && i + 1 < src_.size() && (src_[i + 1] == '/' || src_[i + 1] == '*')) {
                i = skip_trivia(i, src_.size());
                continue;
            }

            size_t next = i + 1;
            if (c == '"' || c == '\'') {
                next = skip_string(i);
                c = 'a';
            } else if (c == '`') {
                next = skip_template(i);
                c = 'a';
            } else if (c == '/' && regex_allowed(prev, prev_word)) {
                next = skip_regex(i);
                c = 'a';
            } else if (is_ident_start(c)) {
                next = skip_word(i);
                prev_word = src_.substr(i, next - i);
                prev = 'w';
                i = next;
                continue;
            } else if (c == '(' || c == '[' || c == '{') {
                stack.push_back(c == '(' ? ')' : c == '[' ? ']' : '}');
            } else if (c == ')' || c == ']' || c == '}') {
                if (stack.empty() || stack.back() != c) return npos;
                stack.pop_back();
                if (stack.empty()) return i;
            }

            if (next == npos) return npos;
            prev = c;
            prev_word = {};
            i = next;
        }
        return npos;
    }

    [[nodiscard]] static bool regex_allowed(char prev, std::string_view prev_word) {
        if (prev == 'w') return is_regex_keyword(prev_word);
        if (prev == 0) return true;
        static constexpr std::string_view operators = "(,=:[!&|?{};+-*%<>~^";
        return operators.find(prev) != npos;
    }

    // Reads a string literal at pos into out; returns the position after it or npos
    [[nodiscard]] size_t read_string(size_t pos, Str& out) const {
        if (pos >= src_.size()) return npos;
        char quote = src_[pos];
        size_t end = npos;
        if (quote == '"' || quote == '\'') {
            end = skip_string(pos);
        } else if (quote == '`') {
            end = skip_template(pos);
            if (end != npos && src_.substr(pos, end - pos).find("${") != npos) {
                return npos;  // Not a constant
            }
        }
        if (end == npos) return npos;
        out.quote = quote;
        out.value = decode_string(src_.substr(pos + 1, end - pos - 2));
        return end;
    }

private:
    std::string_view src_;
};

// ============================================================================
// Expression parser for call arguments
// ============================================================================

class ExprParser {
public:
    ExprParser(const Lexer& lexer, size_t lo, size_t hi) : lex_(lexer), pos_(lo), hi_(hi) {}

    // Parses [lo, hi) completely, or nullopt
    std::optional<Expr> parse_complete() {
        auto expr = parse_additive();
        if (!expr) return std::nullopt;
        if (lex_.skip_trivia(pos_, hi_) != hi_) return std::nullopt;
        return expr;
    }

    // Splits [lo, hi) at top-level commas into arguments
    static std::vector<ExprOrSpread> parse_args(const Lexer& lex, size_t lo, size_t hi) {
        std::vector<ExprOrSpread> args;
        const auto src = lex.src();

        size_t start = lo;
        size_t i = lo;
        while (i <= hi) {
            if (i == hi || src[i] == ',') {
                push_arg(lex, args, start, i);
                start = i + 1;
                ++i;
                continue;
            }
            char c = src[i];
            size_t next = i + 1;
            if (c == '"' || c == '\'') {
                next = lex.skip_string(i);
            } else if (c == '`') {
                next = lex.skip_template(i);
            } else if (c == '/' && i + 1 < hi && (src[i + 1] == '/' || src[i + 1] == '*')) {
                next = lex.skip_trivia(i, hi);
            } else if (c == '(' || c == '[' || c == '{') {
                size_t close = lex.find_closing(i);
                next = close == npos ? npos : close + 1;
            }
            if (next == npos || next > hi) {
                // Unbalanced; keep the rest as one opaque argument
                push_arg(lex, args, start, hi);
                return args;
            }
            i = next;
        }
        return args;
    }

private:
    static void push_arg(const Lexer& lex, std::vector<ExprOrSpread>& args, size_t lo, size_t hi) {
        size_t begin = lex.skip_trivia(lo, hi);
        size_t end = hi;
        while (end > begin && is_space(lex.src()[end - 1])) --end;
        if (begin == end) {
            return;  // Trailing comma or no arguments
        }

        bool spread = lex.src().substr(begin, 3) == "...";
        size_t expr_begin = spread ? lex.skip_trivia(begin + 3, end) : begin;

        ExprParser parser(lex, expr_begin, end);
        auto expr = parser.parse_complete();
        if (!expr) {
            expr = Expr{Raw{std::string(lex.src().substr(expr_begin, end - expr_begin))},
                        Span{static_cast<uint32_t>(expr_begin), static_cast<uint32_t>(end)}};
        }
        args.push_back(ExprOrSpread{spread, std::move(*expr)});
    }

    Span span_from(size_t lo) const {
        return Span{static_cast<uint32_t>(lo), static_cast<uint32_t>(pos_)};
    }

    std::optional<Expr> parse_additive() {
        size_t lo = lex_.skip_trivia(pos_, hi_);
        auto left = parse_postfix();
        if (!left) return std::nullopt;

        while (true) {
            size_t p = lex_.skip_trivia(pos_, hi_);
            const auto src = lex_.src();
            if (p >= hi_ || src[p] != '+' || (p + 1 < hi_ && (src[p + 1] == '+' || src[p + 1] == '='))) {
                break;
            }
            pos_ = p + 1;
            auto right = parse_postfix();
            if (!right) return std::nullopt;
            Expr bin{Binary{"+", std::move(*left), std::move(*right)}, {}};
            bin.span = span_from(lo);
            left = std::move(bin);
        }
        return left;
    }

    std::optional<Expr> parse_postfix() {
        size_t lo = lex_.skip_trivia(pos_, hi_);
        auto expr = parse_primary();
        if (!expr) return std::nullopt;
        return parse_suffixes(std::move(*expr), lo, true);
    }

    std::optional<Expr> parse_suffixes(Expr expr, size_t lo, bool allow_calls) {
        const auto src = lex_.src();
        while (true) {
            size_t p = lex_.skip_trivia(pos_, hi_);
            if (p >= hi_) break;

            if (src[p] == '.' && src.substr(p, 3) != "...") {
                size_t name = lex_.skip_trivia(p + 1, hi_);
                if (name >= hi_ || !is_ident_start(src[name])) return std::nullopt;
                size_t end = std::min(lex_.skip_word(name), hi_);
                pos_ = end;
                Expr member{Member{std::move(expr), std::string(src.substr(name, end - name))}, {}};
                member.span = span_from(lo);
                expr = std::move(member);
            } else if (src[p] == '(' && allow_calls) {
                size_t close = lex_.find_closing(p);
                if (close == npos || close >= hi_) return std::nullopt;
                Call call{std::move(expr), parse_args(lex_, p + 1, close)};
                pos_ = close + 1;
                Expr call_expr{std::move(call), {}};
                call_expr.span = span_from(lo);
                expr = std::move(call_expr);
            } else {
                break;
            }
        }
        return expr;
    }

    std::optional<Expr> parse_primary() {
        const auto src = lex_.src();
        size_t p = lex_.skip_trivia(pos_, hi_);
        if (p >= hi_) return std::nullopt;
        char c = src[p];

        if (c == '"' || c == '\'' || c == '`') {
            Str str;
            size_t end = lex_.read_string(p, str);
            if (end == npos || end > hi_) return std::nullopt;
            pos_ = end;
            return Expr{std::move(str), Span{static_cast<uint32_t>(p), static_cast<uint32_t>(end)}};
        }

        if (!is_ident_start(c)) return std::nullopt;

        size_t end = std::min(lex_.skip_word(p), hi_);
        std::string_view word = src.substr(p, end - p);
        pos_ = end;

        if (word == "new") {
            size_t callee_lo = lex_.skip_trivia(pos_, hi_);
            auto callee = parse_primary();
            if (!callee) return std::nullopt;
            callee = parse_suffixes(std::move(*callee), callee_lo, false);
            if (!callee) return std::nullopt;
            size_t open = lex_.skip_trivia(pos_, hi_);
            if (open >= hi_ || src[open] != '(') return std::nullopt;
            size_t close = lex_.find_closing(open);
            if (close == npos || close >= hi_) return std::nullopt;
            New expr{std::move(*callee), parse_args(lex_, open + 1, close)};
            pos_ = close + 1;
            return Expr{std::move(expr), span_from(p)};
        }

        if (word == "import") {
            size_t open = lex_.skip_trivia(pos_, hi_);
            if (open >= hi_ || src[open] != '(') return std::nullopt;
            return Expr{Import{}, Span{static_cast<uint32_t>(p), static_cast<uint32_t>(end)}};
        }

        return Expr{Ident{std::string(word)}, Span{static_cast<uint32_t>(p), static_cast<uint32_t>(end)}};
    }

    const Lexer& lex_;
    size_t pos_;
    size_t hi_;
};

// ============================================================================
// Module scanner
// ============================================================================

class ModuleScanner {
public:
    explicit ModuleScanner(std::string_view src) : lex_(src), src_(src) {}

    Program run() {
        while (pos_ < src_.size()) {
            char c = src_[pos_];

            if (is_space(c)) {
                ++pos_;
                continue;
            }
            if (c == '/' && pos_ + 1 < src_.size() && (src_[pos_ + 1] == '/' || src_[pos_ + 1] == '*')) {
                pos_ = lex_.skip_trivia(pos_, src_.size());
                continue;
            }

            if (c == '"' || c == '\'') {
                advance_literal(lex_.skip_string(pos_));
                continue;
            }
            if (c == '`') {
                advance_literal(lex_.skip_template(pos_));
                continue;
            }
            if (c == '/' && Lexer::regex_allowed(prev_, prev_word_)) {
                advance_literal(lex_.skip_regex(pos_));
                continue;
            }

            if (is_ident_start(c)) {
                size_t start = pos_;
                size_t end = lex_.skip_word(pos_);
                std::string_view word = src_.substr(start, end - start);

                if (!after_member_dot()) {
                    if (word == "import" && scan_import(start, end)) continue;
                    if (word == "export" && scan_export(start, end)) continue;
                    if (word == "require" && scan_require(start, end)) continue;
                }

                prev_ = 'w';
                prev_word_ = word;
                prev_pos_ = end - 1;
                pos_ = end;
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(c))) {
                size_t end = pos_;
                while (end < src_.size() && (is_ident_part(src_[end]) || src_[end] == '.')) ++end;
                set_prev('0', end - 1);
                pos_ = end;
                continue;
            }

            set_prev(c, pos_);
            ++pos_;
        }

        flush_raw(src_.size());
        return std::move(program_);
    }

private:
    void set_prev(char c, size_t at) {
        prev_ = c;
        prev_word_ = {};
        prev_pos_ = at;
    }

    void advance_literal(size_t end) {
        if (end == npos) {
            // Unterminated literal: treat the rest of the line as text
            size_t eol = src_.find('\n', pos_);
            end = eol == npos ? src_.size() : eol;
        }
        set_prev('a', end - 1);
        pos_ = end;
    }

    // `function require(name) {`, `require(x) {` in an object or class body:
    // a declaration named like the call, not a call
    bool declares_function(size_t close) const {
        if (prev_word_ == "function") return true;
        size_t next = lex_.skip_trivia(close + 1, src_.size());
        return next < src_.size() && src_[next] == '{';
    }

    // `obj.import(...)` is a method call, `...import(x)` is a spread
    bool after_member_dot() const {
        if (prev_ != '.') return false;
        return !(prev_pos_ >= 2 && src_[prev_pos_ - 1] == '.' && src_[prev_pos_ - 2] == '.');
    }

    void flush_raw(size_t until) {
        if (until > raw_start_) {
            ModuleItem item{RawText{std::string(src_.substr(raw_start_, until - raw_start_))},
                            Span{static_cast<uint32_t>(raw_start_), static_cast<uint32_t>(until)}};
            program_.body.push_back(std::move(item));
        }
        raw_start_ = until;
    }

    template <typename Node>
    void push_item(size_t start, size_t end, Node node) {
        flush_raw(start);
        program_.body.push_back(
            ModuleItem{std::move(node), Span{static_cast<uint32_t>(start), static_cast<uint32_t>(end)}});
        raw_start_ = end;
        pos_ = end;
        set_prev(';', end - 1);
    }

    // Consumes a `;` directly after a declaration, if present on the same line
    size_t consume_semicolon(size_t pos) const {
        size_t p = pos;
        while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t')) ++p;
        return p < src_.size() && src_[p] == ';' ? p + 1 : pos;
    }

    // Skips `with { type: "json" }` / `assert { ... }` after a module specifier
    size_t skip_import_attributes(size_t pos) const {
        size_t p = lex_.skip_trivia(pos, src_.size());
        size_t word_end = lex_.skip_word(p);
        std::string_view word = src_.substr(p, word_end - p);
        if (word != "with" && word != "assert") return pos;
        size_t open = lex_.skip_trivia(word_end, src_.size());
        if (open >= src_.size() || src_[open] != '{') return pos;
        size_t close = lex_.find_closing(open);
        return close == npos ? pos : close + 1;
    }

    // Parses `from "src"` at pos; returns the position after the string or npos
    size_t read_from_clause(size_t pos, Str& src, Span& src_span) const {
        size_t p = lex_.skip_trivia(pos, src_.size());
        size_t word_end = lex_.skip_word(p);
        if (src_.substr(p, word_end - p) != "from") return npos;
        size_t quote = lex_.skip_trivia(word_end, src_.size());
        if (quote >= src_.size() || (src_[quote] != '"' && src_[quote] != '\'')) return npos;
        size_t end = lex_.read_string(quote, src);
        if (end == npos) return npos;
        src_span = Span{static_cast<uint32_t>(quote), static_cast<uint32_t>(end)};
        return end;
    }

    bool scan_import(size_t start, size_t word_end) {
        size_t p = lex_.skip_trivia(word_end, src_.size());
        if (p >= src_.size()) return false;

        if (src_[p] == '(') {
            size_t close = lex_.find_closing(p);
            if (close == npos || declares_function(close)) return false;
            Call call{Expr{Import{}, Span{static_cast<uint32_t>(start), static_cast<uint32_t>(word_end)}},
                      ExprParser::parse_args(lex_, p + 1, close)};
            Expr expr{std::move(call), Span{static_cast<uint32_t>(start), static_cast<uint32_t>(close + 1)}};
            push_expr(start, close + 1, std::move(expr));
            return true;
        }

        // import.meta, or `import` used as a property name
        if (src_[p] == '.' || src_[p] == ':') return false;

        ImportDecl decl{};
        size_t end = npos;
        if (src_[p] == '"' || src_[p] == '\'') {
            end = lex_.read_string(p, decl.src);
            if (end == npos) return false;
            decl.src_span = Span{static_cast<uint32_t>(p), static_cast<uint32_t>(end)};
        } else {
            size_t from = find_from_keyword(p);
            if (from == npos) return false;
            decl.clause = std::string(trim(src_.substr(p, from - p)));
            if (!parse_import_clause(decl.clause, decl.specifiers)) return false;
            end = read_from_clause(from, decl.src, decl.src_span);
            if (end == npos) return false;
        }

        end = consume_semicolon(skip_import_attributes(end));
        push_item(start, end, std::move(decl));
        return true;
    }

    // Finds the `from` keyword that ends an import/export clause starting at pos
    size_t find_from_keyword(size_t pos) const {
        size_t p = pos;
        while (true) {
            p = lex_.skip_trivia(p, src_.size());
            if (p >= src_.size()) return npos;
            char c = src_[p];
            if (c == '{') {
                size_t close = lex_.find_closing(p);
                if (close == npos) return npos;
                p = close + 1;
            } else if (c == '*' || c == ',') {
                ++p;
            } else if (c == '"' || c == '\'') {
                // String export names: `{ "a-b" as c }` is inside braces; a bare string here is malformed
                return npos;
            } else if (is_ident_start(c)) {
                size_t end = lex_.skip_word(p);
                if (src_.substr(p, end - p) == "from") {
                    size_t next = lex_.skip_trivia(end, src_.size());
                    if (next < src_.size() && (src_[next] == '"' || src_[next] == '\'')) {
                        return p;
                    }
                }
                p = end;
            } else {
                return npos;
            }
        }
    }

    static bool parse_import_clause(std::string_view clause, std::vector<ImportSpecifier>& out) {
        std::string_view rest = trim(clause);
        while (!rest.empty()) {
            if (rest[0] == '{') {
                size_t close = rest.find('}');
                if (close == npos) return false;
                std::vector<ExportSpecifier> named;
                if (!parse_specifier_list(rest.substr(1, close - 1), named)) return false;
                for (auto& spec : named) {
                    out.push_back(ImportSpecifier{std::move(spec.local), std::move(spec.exported)});
                }
                rest = trim(rest.substr(close + 1));
            } else if (rest[0] == '*') {
                rest = trim(rest.substr(1));
                if (rest.substr(0, 2) != "as") return false;
                rest = trim(rest.substr(2));
                size_t end = 0;
                while (end < rest.size() && is_ident_part(rest[end])) ++end;
                if (end == 0) return false;
                out.push_back(ImportSpecifier{"*", std::string(rest.substr(0, end))});
                rest = trim(rest.substr(end));
            } else if (is_ident_start(rest[0])) {
                size_t end = 0;
                while (end < rest.size() && is_ident_part(rest[end])) ++end;
                out.push_back(ImportSpecifier{"default", std::string(rest.substr(0, end))});
                rest = trim(rest.substr(end));
            } else {
                return false;
            }

            if (!rest.empty()) {
                if (rest[0] != ',') return false;
                rest = trim(rest.substr(1));
            }
        }
        return true;
    }

    // "a, b as c, default as d" -> {a,a} {b,c} {default,d}; `local` is the
    // name on the left of `as`.
    static bool parse_specifier_list(std::string_view list, std::vector<ExportSpecifier>& out) {
        size_t start = 0;
        while (start <= list.size()) {
            size_t comma = list.find(',', start);
            std::string_view part = trim(list.substr(start, comma == npos ? npos : comma - start));
            if (!part.empty()) {
                size_t as = npos;
                for (size_t i = 1; i + 2 < part.size(); ++i) {
                    if (is_space(part[i - 1]) && part.substr(i, 2) == "as" && is_space(part[i + 2])) {
                        as = i;
                        break;
                    }
                }
                auto unquote = [](std::string_view name) {
                    if (name.size() >= 2 && (name[0] == '"' || name[0] == '\'')) {
                        return decode_string(name.substr(1, name.size() - 2));
                    }
                    return std::string(name);
                };
                if (as == npos) {
                    std::string name = unquote(part);
                    out.push_back(ExportSpecifier{name, name});
                } else {
                    out.push_back(ExportSpecifier{unquote(trim(part.substr(0, as))),
                                                  unquote(trim(part.substr(as + 2)))});
                }
            }
            if (comma == npos) break;
            start = comma + 1;
        }
        return true;
    }

    bool scan_export(size_t start, size_t word_end) {
        size_t p = lex_.skip_trivia(word_end, src_.size());
        if (p >= src_.size() || src_[p] == ':' || src_[p] == '(') return false;

        if (src_[p] == '*') {
            ExportFromDecl decl{};
            decl.star = true;
            size_t q = lex_.skip_trivia(p + 1, src_.size());
            size_t as_end = lex_.skip_word(q);
            if (src_.substr(q, as_end - q) == "as") {
                size_t name = lex_.skip_trivia(as_end, src_.size());
                size_t name_end = lex_.skip_word(name);
                if (name_end == name) return false;
                decl.star_alias = std::string(src_.substr(name, name_end - name));
                q = name_end;
            }
            decl.clause = std::string(trim(src_.substr(p, q - p)));
            size_t end = read_from_clause(q, decl.src, decl.src_span);
            if (end == npos) return false;
            push_item(start, consume_semicolon(skip_import_attributes(end)), std::move(decl));
            return true;
        }

        if (src_[p] == '{') {
            size_t close = lex_.find_closing(p);
            if (close == npos) return false;
            std::vector<ExportSpecifier> specifiers;
            if (!parse_specifier_list(src_.substr(p + 1, close - p - 1), specifiers)) return false;

            ExportFromDecl from{};
            size_t end = read_from_clause(close + 1, from.src, from.src_span);
            if (end != npos) {
                from.clause = std::string(src_.substr(p, close + 1 - p));
                from.specifiers = std::move(specifiers);
                push_item(start, consume_semicolon(skip_import_attributes(end)), std::move(from));
            } else {
                push_item(start, consume_semicolon(close + 1), ExportNamedDecl{std::move(specifiers)});
            }
            return true;
        }

        size_t kw_end = lex_.skip_word(p);
        std::string_view keyword = src_.substr(p, kw_end - p);

        if (keyword == "default") {
            ExportDefaultDecl decl;
            size_t q = lex_.skip_trivia(kw_end, src_.size());
            size_t q_end = lex_.skip_word(q);
            std::string_view next = src_.substr(q, q_end - q);
            if (next == "async") {
                q = lex_.skip_trivia(q_end, src_.size());
                q_end = lex_.skip_word(q);
                next = src_.substr(q, q_end - q);
            }
            if (next == "function" || next == "class") {
                size_t name = lex_.skip_trivia(q_end, src_.size());
                if (name < src_.size() && src_[name] == '*') name = lex_.skip_trivia(name + 1, src_.size());
                size_t name_end = lex_.skip_word(name);
                std::string_view ident = src_.substr(name, name_end - name);
                if (!ident.empty() && ident != "extends") {
                    decl.name = std::string(ident);
                }
            }
            push_item(start, kw_end, std::move(decl));
            return true;
        }

        ExportDecl decl;
        size_t name_pos = kw_end;
        if (keyword == "async") {
            size_t q = lex_.skip_trivia(kw_end, src_.size());
            size_t q_end = lex_.skip_word(q);
            if (src_.substr(q, q_end - q) != "function") return false;
            decl.keyword = "function";
            name_pos = q_end;
        } else if (keyword == "function" || keyword == "class" || keyword == "const" ||
                   keyword == "let" || keyword == "var") {
            decl.keyword = std::string(keyword);
        } else {
            return false;
        }

        if (decl.keyword == "function" || decl.keyword == "class") {
            size_t name = lex_.skip_trivia(name_pos, src_.size());
            if (name < src_.size() && src_[name] == '*') name = lex_.skip_trivia(name + 1, src_.size());
            size_t name_end = lex_.skip_word(name);
            if (name_end == name) return false;
            decl.names.emplace_back(src_.substr(name, name_end - name));
        } else {
            collect_declarator_names(name_pos, decl.names);
            if (decl.names.empty()) return false;
        }

        // Only the `export` keyword is replaced; the declaration stays text
        push_item(start, word_end, std::move(decl));
        return true;
    }

    // Names bound by `const a = 1, { b, c: d } = x, [e] = y` up to the end of the statement
    void collect_declarator_names(size_t pos, std::vector<std::string>& names) const {
        size_t p = pos;
        while (true) {
            p = lex_.skip_trivia(p, src_.size());
            if (p >= src_.size()) return;

            if (src_[p] == '{' || src_[p] == '[') {
                size_t close = lex_.find_closing(p);
                if (close == npos) return;
                collect_pattern_names(p + 1, close, names);
                p = close + 1;
            } else if (is_ident_start(src_[p])) {
                size_t end = lex_.skip_word(p);
                names.emplace_back(src_.substr(p, end - p));
                p = end;
            } else {
                return;
            }

            // Skip the initializer to the next top-level comma or the statement end
            while (p < src_.size()) {
                char c = src_[p];
                if (c == ',') {
                    ++p;
                    break;
                }
                if (c == ';') return;
                if (c == '\n' && !continues_statement(p)) return;
                if (c == '"' || c == '\'') {
                    p = lex_.skip_string(p);
                } else if (c == '`') {
                    p = lex_.skip_template(p);
                } else if (c == '(' || c == '[' || c == '{') {
                    size_t close = lex_.find_closing(p);
                    p = close == npos ? npos : close + 1;
                } else if (c == '/' && p + 1 < src_.size() && (src_[p + 1] == '/' || src_[p + 1] == '*')) {
                    p = lex_.skip_trivia(p, src_.size());
                } else {
                    ++p;
                }
                if (p == npos) return;
            }
        }
    }

    // Whether the statement goes on past the line break at pos
    bool continues_statement(size_t pos) const {
        static constexpr std::string_view operators = "=,+-*/%&|^!?:<>.(";
        size_t last = pos;
        while (last > 0 && is_space(src_[last - 1])) --last;
        size_t next = lex_.skip_trivia(pos, src_.size());
        if (next >= src_.size()) return false;
        return (last > 0 && operators.find(src_[last - 1]) != npos) ||
               operators.find(src_[next]) != npos;
    }

    void collect_pattern_names(size_t lo, size_t hi, std::vector<std::string>& names) const {
        size_t p = lo;
        while (p < hi) {
            p = lex_.skip_trivia(p, hi);
            if (p >= hi) return;
            char c = src_[p];
            if (c == '{' || c == '[') {
                size_t close = lex_.find_closing(p);
                if (close == npos || close > hi) return;
                collect_pattern_names(p + 1, close, names);
                p = close + 1;
            } else if (c == '=') {
                // Default value: skip to the next comma at this level
                ++p;
                while (p < hi && src_[p] != ',') {
                    if (src_[p] == '(' || src_[p] == '[' || src_[p] == '{') {
                        size_t close = lex_.find_closing(p);
                        if (close == npos) return;
                        p = close + 1;
                    } else if (src_[p] == '"' || src_[p] == '\'') {
                        p = lex_.skip_string(p);
                        if (p == npos) return;
                    } else {
                        ++p;
                    }
                }
            } else if (c == '.' && src_.substr(p, 3) == "...") {
                p += 3;
            } else if (is_ident_start(c)) {
                size_t end = lex_.skip_word(p);
                size_t next = lex_.skip_trivia(end, hi);
                if (next >= hi || src_[next] != ':') {
                    names.emplace_back(src_.substr(p, end - p));
                }
                p = end;
            } else {
                ++p;
            }
        }
    }

    bool scan_require(size_t start, size_t word_end) {
        size_t p = lex_.skip_trivia(word_end, src_.size());
        if (p >= src_.size() || src_[p] != '(') return false;
        size_t close = lex_.find_closing(p);
        if (close == npos || declares_function(close)) return false;

        Call call{Expr{Ident{"require"}, Span{static_cast<uint32_t>(start), static_cast<uint32_t>(word_end)}},
                  ExprParser::parse_args(lex_, p + 1, close)};
        Expr expr{std::move(call), Span{static_cast<uint32_t>(start), static_cast<uint32_t>(close + 1)}};
        push_expr(start, close + 1, std::move(expr));
        return true;
    }

    void push_expr(size_t start, size_t end, Expr expr) {
        push_item(start, end, std::move(expr));
        // A call is an operand: `/` after it is division
        set_prev(')', end - 1);
    }

    Lexer lex_;
    std::string_view src_;
    Program program_;
    size_t pos_ = 0;
    size_t raw_start_ = 0;
    char prev_ = 0;
    std::string_view prev_word_;
    size_t prev_pos_ = 0;
};

}  // namespace

Program parse_module(std::string_view source) {
    return ModuleScanner(source).run();
}

std::optional<Expr> parse_expression(std::string_view source) {
    Lexer lexer(source);
    ExprParser parser(lexer, 0, source.size());
    return parser.parse_complete();
}

std::string decode_string(std::string_view body) {
    std::string out;
    out.reserve(body.size());

    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out += c;
            continue;
        }

        char e = body[++i];
        switch (e) {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'v': out += '\v'; break;
            case '0': out += '\0'; break;
            case '\n': break;  // Line continuation
            case '\r':
                if (i + 1 < body.size() && body[i + 1] == '\n') ++i;
                break;
            case 'x': {
                auto value = parse_hex(body.substr(i + 1, 2));
                if (value) {
                    append_utf8(out, *value);
                    i += 2;
                } else {
                    out += e;
                }
                break;
            }
            case 'u': {
                std::optional<uint32_t> value;
                if (i + 1 < body.size() && body[i + 1] == '{') {
                    size_t close = body.find('}', i + 2);
                    if (close != npos) {
                        value = parse_hex(body.substr(i + 2, close - i - 2));
                        if (value) i = close;
                    }
                } else {
                    value = parse_hex(body.substr(i + 1, 4));
                    if (value) i += 4;
                }
                if (value) {
                    append_utf8(out, *value);
                } else {
                    out += e;
                }
                break;
            }
            default:
                out += e;
                break;
        }
    }
    return out;
}

}  // namespace quickpack::js
