#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace quickpack::js {

// Byte range in the original module source. A default (0, 0) span marks a
// node synthesized by code generation, which gets no source mapping.
struct Span {
    uint32_t lo = 0;
    uint32_t hi = 0;

    [[nodiscard]] bool is_dummy() const noexcept { return lo == 0 && hi == 0; }
    bool operator==(const Span&) const = default;
};

// Owning pointer with value semantics, so that an AST snapshot can be copied
// before code generation mutates it.
template <typename T>
class Box {
public:
    Box(T value) : ptr_(std::make_unique<T>(std::move(value))) {}
    Box(const Box& other) : ptr_(std::make_unique<T>(*other.ptr_)) {}
    Box(Box&&) noexcept = default;

    Box& operator=(const Box& other) {
        if (this != &other) {
            ptr_ = std::make_unique<T>(*other.ptr_);
        }
        return *this;
    }
    Box& operator=(Box&&) noexcept = default;

    T& operator*() noexcept { return *ptr_; }
    const T& operator*() const noexcept { return *ptr_; }
    T* operator->() noexcept { return ptr_.get(); }
    const T* operator->() const noexcept { return ptr_.get(); }

private:
    std::unique_ptr<T> ptr_;
};

struct Expr;

struct Ident {
    std::string sym;
};

// String literal; quote is '"', '\'' or '`' (template without substitutions)
struct Str {
    std::string value;  // Decoded
    char quote = '"';
};

// Expression text the scanner did not structure; printed verbatim
struct Raw {
    std::string text;
};

// The `import` keyword in callee position
struct Import {};

struct Member {
    Box<Expr> obj;
    std::string prop;
};

struct Binary {
    std::string op;
    Box<Expr> left;
    Box<Expr> right;
};

struct ExprOrSpread {
    bool spread = false;
    Box<Expr> expr;
};

struct Call {
    Box<Expr> callee;
    std::vector<ExprOrSpread> args;
};

struct New {
    Box<Expr> callee;
    std::vector<ExprOrSpread> args;
};

struct Expr {
    std::variant<Ident, Str, Raw, Import, Member, Binary, Call, New> node;
    Span span;
};

// ----------------------------------------------------------------------------
// Module items
// ----------------------------------------------------------------------------

// Source text kept verbatim
struct RawText {
    std::string text;
};

// Text produced by code generation in place of an item
struct Synthetic {
    std::string text;
};

struct ImportSpecifier {
    std::string imported;  // "default", "*" for a namespace import, or an export name
    std::string local;
};

// import <clause> from "src";  /  import "src";
struct ImportDecl {
    std::string clause;  // Verbatim text between `import` and `from`, empty for side-effect imports
    std::vector<ImportSpecifier> specifiers;
    Str src;
    Span src_span;
};

struct ExportSpecifier {
    std::string local;
    std::string exported;
};

// export * from "src";  /  export * as ns from "src";  /  export { a as b } from "src";
struct ExportFromDecl {
    std::string clause;
    bool star = false;
    std::optional<std::string> star_alias;
    std::vector<ExportSpecifier> specifiers;
    Str src;
    Span src_span;
};

// export { a, b as c };
struct ExportNamedDecl {
    std::vector<ExportSpecifier> specifiers;
};

// The `export ` keyword in front of a declaration; the declaration itself
// follows as ordinary text.
struct ExportDecl {
    std::string keyword;  // "const", "let", "var", "function", "class"
    std::vector<std::string> names;
};

// `export default ` in front of an expression or declaration
struct ExportDefaultDecl {
    std::optional<std::string> name;  // Named function or class declaration
};

struct ModuleItem {
    std::variant<RawText, Synthetic, ImportDecl, ExportFromDecl, ExportNamedDecl, ExportDecl,
                 ExportDefaultDecl, Expr>
        node;
    Span span;
};

struct Program {
    std::vector<ModuleItem> body;
};

// ----------------------------------------------------------------------------
// Paths and visitors
// ----------------------------------------------------------------------------

// Index path from the program root: the item index, then child indexes.
// Children of an expression: Member {obj}; Binary {left, right};
// Call and New {callee, args...}. Valid only for the snapshot it was taken from.
using AstPath = std::vector<uint32_t>;

[[nodiscard]] std::string ast_path_to_string(const AstPath& path);

// A mutation of the node at one AstPath
struct Visitor {
    using ProgramFn = std::function<void(Program&)>;
    using ItemFn = std::function<void(ModuleItem&)>;
    using CallFn = std::function<void(Call&, Span)>;

    AstPath path;
    std::variant<ProgramFn, ItemFn, CallFn> mutate;
};

[[nodiscard]] Visitor visit_program(Visitor::ProgramFn fn);
[[nodiscard]] Visitor visit_item(AstPath path, Visitor::ItemFn fn);
[[nodiscard]] Visitor visit_call(AstPath path, Visitor::CallFn fn);

// Applies every visitor to the node at its path. Item and call visitors run
// first, in order, then program visitors. Throws std::logic_error if a path
// does not lead to a node of the visitor's kind.
void apply_visitors(Program& program, const std::vector<Visitor>& visitors);

// Child expressions in AstPath order
[[nodiscard]] std::vector<Expr*> children(Expr& expr);
[[nodiscard]] std::vector<const Expr*> children(const Expr& expr);

// Walks every expression of an item depth first, with its path
void walk_exprs(const ModuleItem& item, uint32_t item_index,
                const std::function<void(const Expr&, const AstPath&)>& fn);

// ----------------------------------------------------------------------------
// Construction helpers for code generation
// ----------------------------------------------------------------------------

[[nodiscard]] Expr make_ident(std::string sym);
[[nodiscard]] Expr make_str(std::string value, char quote = '"');
[[nodiscard]] Expr make_member(Expr obj, std::string prop);
[[nodiscard]] Expr make_binary(std::string op, Expr left, Expr right);
[[nodiscard]] Expr make_call(Expr callee, std::vector<Expr> args);
[[nodiscard]] Expr make_new(Expr callee, std::vector<Expr> args);
[[nodiscard]] ExprOrSpread make_arg(Expr expr);

// `a.b.c` -> Member(Member(Ident a, b), c)
[[nodiscard]] Expr make_path(const std::string& dotted);

}  // namespace quickpack::js
