#include "js_printer.hpp"
#include "source_pos.hpp"

#include <algorithm>
#include <cstdio>
#include <vector>

namespace quickpack::js {

namespace {

template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

// Byte offset -> 0-based line/column in the original source
class LineIndex {
public:
    explicit LineIndex(std::string_view source) {
        line_starts_.push_back(0);
        for (size_t i = 0; i < source.size(); ++i) {
            if (source[i] == '\n') {
                line_starts_.push_back(i + 1);
            }
        }
    }

    [[nodiscard]] SourcePos position(size_t offset) const {
        auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
        size_t line = static_cast<size_t>(it - line_starts_.begin()) - 1;
        return SourcePos{static_cast<uint32_t>(line),
                         static_cast<uint32_t>(offset - line_starts_[line])};
    }

private:
    std::vector<size_t> line_starts_;
};

bool needs_parens(const Expr& expr) {
    return std::holds_alternative<Raw>(expr.node) || std::holds_alternative<Binary>(expr.node);
}

class Printer {
public:
    // Without a line index the printer only produces text
    Printer(const LineIndex* index, SourceMapBuilder* builder, const std::string* source_name)
        : index_(index), builder_(builder), source_name_(source_name) {}

    [[nodiscard]] std::string take() { return std::move(out_); }

    void item(const ModuleItem& item) {
        std::visit(overloaded{
            [&](const RawText& raw) { original_text(raw.text, item.span.lo); },
            [&](const Synthetic& synthetic) {
                mark(item.span);
                append(synthetic.text);
            },
            [&](const ImportDecl& decl) {
                mark(item.span);
                append("import ");
                if (!decl.clause.empty()) {
                    append(decl.clause);
                    append(" from ");
                }
                str(decl.src, decl.src_span);
                append(";");
            },
            [&](const ExportFromDecl& decl) {
                mark(item.span);
                append("export ");
                append(decl.clause);
                append(" from ");
                str(decl.src, decl.src_span);
                append(";");
            },
            [&](const ExportNamedDecl& decl) {
                mark(item.span);
                append("export { ");
                for (size_t i = 0; i < decl.specifiers.size(); ++i) {
                    if (i > 0) append(", ");
                    const auto& spec = decl.specifiers[i];
                    append(spec.local);
                    if (spec.exported != spec.local) {
                        append(" as ");
                        append(spec.exported);
                    }
                }
                append(" };");
            },
            [&](const ExportDecl&) {
                mark(item.span);
                append("export");
            },
            [&](const ExportDefaultDecl&) {
                mark(item.span);
                append("export default");
            },
            [&](const Expr& expr) { this->expr(expr); },
        }, item.node);
    }

    void expr(const Expr& expr) {
        mark(expr.span);
        std::visit(overloaded{
            [&](const Ident& ident) { append(ident.sym); },
            [&](const Str& s) { str(s, {}); },
            [&](const Raw& raw) { append(raw.text); },
            [&](const Import&) { append("import"); },
            [&](const Member& member) {
                operand(*member.obj);
                append(".");
                append(member.prop);
            },
            [&](const Binary& binary) {
                // Operators are left associative: only the right side needs grouping
                if (std::holds_alternative<Raw>(binary.left->node)) {
                    operand(*binary.left);
                } else {
                    this->expr(*binary.left);
                }
                append(" ");
                append(binary.op);
                append(" ");
                operand(*binary.right);
            },
            [&](const Call& call) {
                operand(*call.callee);
                args(call.args);
            },
            [&](const New& construct) {
                append("new ");
                if (std::holds_alternative<Ident>(construct.callee->node) ||
                    std::holds_alternative<Member>(construct.callee->node)) {
                    this->expr(*construct.callee);
                } else {
                    append("(");
                    this->expr(*construct.callee);
                    append(")");
                }
                args(construct.args);
            },
        }, expr.node);
    }

private:
    void operand(const Expr& expr) {
        if (needs_parens(expr)) {
            append("(");
            this->expr(expr);
            append(")");
        } else {
            this->expr(expr);
        }
    }

    void args(const std::vector<ExprOrSpread>& args) {
        append("(");
        for (size_t i = 0; i < args.size(); ++i) {
            if (i > 0) append(", ");
            if (args[i].spread) append("...");
            expr(*args[i].expr);
        }
        append(")");
    }

    void str(const Str& s, Span span) {
        mark(span);
        std::string text;
        text += s.quote;
        text += escape_string(s.value, s.quote);
        text += s.quote;
        append(text);
    }

    void append(std::string_view text) {
        out_.append(text);
        pos_.update(text);
    }

    void mark(Span span) {
        if (!builder_ || span.is_dummy()) {
            return;
        }
        mark_offset(span.lo);
    }

    void mark_offset(size_t offset) {
        SourcePos original = index_->position(offset);
        builder_->add(pos_.line, pos_.column, original.line, original.column, *source_name_,
                      std::nullopt);
    }

    // Copies original text, mapping its first byte and every line start
    void original_text(std::string_view text, size_t offset) {
        if (text.empty()) {
            return;
        }
        if (builder_) {
            mark_offset(offset);
        }
        size_t start = 0;
        while (start < text.size()) {
            size_t eol = text.find('\n', start);
            if (eol == std::string_view::npos) {
                append(text.substr(start));
                break;
            }
            append(text.substr(start, eol + 1 - start));
            start = eol + 1;
            if (builder_ && start < text.size()) {
                mark_offset(offset + start);
            }
        }
    }

    const LineIndex* index_;
    SourceMapBuilder* builder_;
    const std::string* source_name_;
    std::string out_;
    SourcePos pos_;
};

}  // namespace

ModuleCode emit_module(const Program& program, std::string_view source,
                       const std::string& source_name) {
    LineIndex index(source);
    SourceMapBuilder builder;
    uint32_t src_id = builder.add_source(source_name);
    builder.set_source_contents(src_id, std::string(source));

    Printer printer(&index, &builder, &source_name);
    for (const auto& item : program.body) {
        printer.item(item);
    }

    ModuleCode code;
    code.code = printer.take();
    code.map = SourceMap::new_regular(builder.build());
    return code;
}

std::string print_expr(const Expr& expr) {
    Printer printer(nullptr, nullptr, nullptr);
    printer.expr(expr);
    return printer.take();
}

std::string escape_string(std::string_view value, char quote) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\v': out += "\\v"; break;
            case '\0': out += "\\x00"; break;
            default:
                if (c == quote) {
                    out += '\\';
                    out += c;
                } else if (quote == '`' && c == '$' && i + 1 < value.size() && value[i + 1] == '{') {
                    out += "\\$";
                } else if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

}  // namespace quickpack::js
