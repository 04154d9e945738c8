#include "js_ast.hpp"

#include <sstream>
#include <stdexcept>

namespace quickpack::js {

namespace {

template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

Expr& expr_at(Program& program, const AstPath& path) {
    if (path.empty() || path[0] >= program.body.size()) {
        throw std::logic_error("AST path " + ast_path_to_string(path) + " is outside the module");
    }
    auto* expr = std::get_if<Expr>(&program.body[path[0]].node);
    if (!expr) {
        throw std::logic_error("AST path " + ast_path_to_string(path) + " does not start at an expression");
    }
    for (size_t i = 1; i < path.size(); ++i) {
        auto kids = children(*expr);
        if (path[i] >= kids.size()) {
            throw std::logic_error("AST path " + ast_path_to_string(path) + " has no such child");
        }
        expr = kids[path[i]];
    }
    return *expr;
}

void walk_expr(const Expr& expr, AstPath& path,
               const std::function<void(const Expr&, const AstPath&)>& fn) {
    fn(expr, path);
    auto kids = children(expr);
    for (uint32_t i = 0; i < kids.size(); ++i) {
        path.push_back(i);
        walk_expr(*kids[i], path, fn);
        path.pop_back();
    }
}

}  // namespace

std::string ast_path_to_string(const AstPath& path) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << path[i];
    }
    oss << "]";
    return oss.str();
}

Visitor visit_program(Visitor::ProgramFn fn) {
    return Visitor{{}, std::move(fn)};
}

Visitor visit_item(AstPath path, Visitor::ItemFn fn) {
    return Visitor{std::move(path), std::move(fn)};
}

Visitor visit_call(AstPath path, Visitor::CallFn fn) {
    return Visitor{std::move(path), std::move(fn)};
}

void apply_visitors(Program& program, const std::vector<Visitor>& visitors) {
    std::vector<const Visitor::ProgramFn*> program_visitors;

    for (const auto& visitor : visitors) {
        std::visit(overloaded{
            [&](const Visitor::ProgramFn& fn) {
                if (!visitor.path.empty()) {
                    throw std::logic_error("program visitor with non-root path " +
                                           ast_path_to_string(visitor.path));
                }
                program_visitors.push_back(&fn);
            },
            [&](const Visitor::ItemFn& fn) {
                if (visitor.path.size() != 1 || visitor.path[0] >= program.body.size()) {
                    throw std::logic_error("AST path " + ast_path_to_string(visitor.path) +
                                           " is not a module item");
                }
                fn(program.body[visitor.path[0]]);
            },
            [&](const Visitor::CallFn& fn) {
                Expr& expr = expr_at(program, visitor.path);
                auto* call = std::get_if<Call>(&expr.node);
                if (!call) {
                    throw std::logic_error("AST path " + ast_path_to_string(visitor.path) +
                                           " is not a call expression");
                }
                fn(*call, expr.span);
            },
        }, visitor.mutate);
    }

    for (const auto* fn : program_visitors) {
        (*fn)(program);
    }
}

std::vector<Expr*> children(Expr& expr) {
    return std::visit(overloaded{
        [](Member& m) -> std::vector<Expr*> { return {&*m.obj}; },
        [](Binary& b) -> std::vector<Expr*> { return {&*b.left, &*b.right}; },
        [](Call& c) -> std::vector<Expr*> {
            std::vector<Expr*> kids{&*c.callee};
            for (auto& arg : c.args) kids.push_back(&*arg.expr);
            return kids;
        },
        [](New& n) -> std::vector<Expr*> {
            std::vector<Expr*> kids{&*n.callee};
            for (auto& arg : n.args) kids.push_back(&*arg.expr);
            return kids;
        },
        [](auto&) -> std::vector<Expr*> { return {}; },
    }, expr.node);
}

std::vector<const Expr*> children(const Expr& expr) {
    auto kids = children(const_cast<Expr&>(expr));
    return std::vector<const Expr*>(kids.begin(), kids.end());
}

void walk_exprs(const ModuleItem& item, uint32_t item_index,
                const std::function<void(const Expr&, const AstPath&)>& fn) {
    const auto* expr = std::get_if<Expr>(&item.node);
    if (!expr) {
        return;
    }
    AstPath path{item_index};
    walk_expr(*expr, path, fn);
}

// ============================================================================
// Construction helpers
// ============================================================================

Expr make_ident(std::string sym) {
    return Expr{Ident{std::move(sym)}, {}};
}

Expr make_str(std::string value, char quote) {
    return Expr{Str{std::move(value), quote}, {}};
}

Expr make_member(Expr obj, std::string prop) {
    return Expr{Member{std::move(obj), std::move(prop)}, {}};
}

Expr make_binary(std::string op, Expr left, Expr right) {
    return Expr{Binary{std::move(op), std::move(left), std::move(right)}, {}};
}

ExprOrSpread make_arg(Expr expr) {
    return ExprOrSpread{false, std::move(expr)};
}

Expr make_call(Expr callee, std::vector<Expr> args) {
    Call call{std::move(callee), {}};
    for (auto& arg : args) {
        call.args.push_back(make_arg(std::move(arg)));
    }
    return Expr{std::move(call), {}};
}

Expr make_new(Expr callee, std::vector<Expr> args) {
    New expr{std::move(callee), {}};
    for (auto& arg : args) {
        expr.args.push_back(make_arg(std::move(arg)));
    }
    return Expr{std::move(expr), {}};
}

Expr make_path(const std::string& dotted) {
    size_t dot = dotted.find('.');
    Expr expr = make_ident(dotted.substr(0, dot));
    while (dot != std::string::npos) {
        size_t next = dotted.find('.', dot + 1);
        expr = make_member(std::move(expr), dotted.substr(dot + 1, next == std::string::npos
                                                                         ? std::string::npos
                                                                         : next - dot - 1));
        dot = next;
    }
    return expr;
}

}  // namespace quickpack::js
