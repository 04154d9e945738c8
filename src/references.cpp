#include "references.hpp"
#include "chunk.hpp"
#include "js_printer.hpp"
#include "pattern_mapping.hpp"
#include "resolve.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace quickpack {

namespace {

bool is_identifier(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        bool ok = std::isalpha(c) || c == '_' || c == '$' || c >= 0x80 || (i > 0 && std::isdigit(c));
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::string quoted(std::string_view value) {
    return "\"" + js::escape_string(value, '"') + "\"";
}

std::string property_key(const std::string& name) {
    return is_identifier(name) ? name : quickpack::quoted(name);
}

std::string property_access(const std::string& object, const std::string& name) {
    return is_identifier(name) ? object + "." + name : object + "[" + quickpack::quoted(name) + "]";
}

// `could not resolve "<arg>" into a module`, embedding the argument expression
js::Expr unresolved_message(js::Expr argument) {
    return js::make_binary("+",
                           js::make_binary("+", js::make_str("could not resolve \"", '\''),
                                           std::move(argument)),
                           js::make_str("\" into a module", '\''));
}

js::Expr new_error(js::Expr message) {
    std::vector<js::Expr> args;
    args.push_back(std::move(message));
    return js::make_new(js::make_ident("Error"), std::move(args));
}

std::string throw_unresolved(const std::string& specifier) {
    return "throw " + js::print_expr(new_error(js::make_str(
                          "could not resolve \"" + specifier + "\" into a module", '\''))) + ";";
}

// Expression producing the namespace of the target of a static import
std::string namespace_source(const PatternMapping& mapping) {
    const char* loader = mapping.is_internal_import() ? runtime::kImport : runtime::kExternal;
    return std::string(loader) + "(" + js::print_expr(mapping.create()) + ")";
}

std::string import_bindings(const js::ImportDecl& decl, const std::string& source) {
    if (decl.specifiers.empty()) {
        return source + ";";
    }

    std::string ns;
    std::string destructure;
    for (const auto& spec : decl.specifiers) {
        if (spec.imported == "*") {
            ns = spec.local;
            continue;
        }
        if (!destructure.empty()) destructure += ", ";
        if (spec.imported == spec.local) {
            destructure += spec.local;
        } else {
            destructure += property_key(spec.imported) + ": " + spec.local;
        }
    }

    if (ns.empty()) {
        return "const { " + destructure + " } = " + source + ";";
    }
    std::string text = "const " + ns + " = " + source + ";";
    if (!destructure.empty()) {
        text += " const { " + destructure + " } = " + ns + ";";
    }
    return text;
}

std::string getters(const std::vector<std::pair<std::string, std::string>>& exports) {
    std::string text = std::string(runtime::kEsm) + "({ ";
    for (size_t i = 0; i < exports.size(); ++i) {
        if (i > 0) text += ", ";
        text += property_key(exports[i].first) + ": () => " + exports[i].second;
    }
    return text + " });";
}

std::string reexports(const js::ExportFromDecl& decl, const std::string& source, uint32_t index) {
    if (decl.star && !decl.star_alias) {
        return std::string(runtime::kExportStar) + "(" + source + ");";
    }

    const std::string binding = "__quickpack_reexport_" + std::to_string(index) + "__";
    std::vector<std::pair<std::string, std::string>> exports;
    if (decl.star) {
        exports.emplace_back(*decl.star_alias, binding);
    } else {
        for (const auto& spec : decl.specifiers) {
            exports.emplace_back(spec.exported, property_access(binding, spec.local));
        }
    }
    return "const " + binding + " = " + source + "; " + getters(exports);
}

}  // namespace

// ============================================================================
// ModuleReference
// ============================================================================

ModuleReference::ModuleReference(const AssetContext& context, std::string origin, Request request,
                                 js::AstPath path)
    : context_(context)
    , origin_(std::move(origin))
    , request_(std::move(request))
    , path_(std::move(path)) {}

TaskGraph::Ref<ResolveResult> ModuleReference::resolve_reference() const {
    return esm_resolve(context_, origin_, request_);
}

// ============================================================================
// EsmAssetReference
// ============================================================================

std::string EsmAssetReference::description() const {
    return "import " + request_.to_string();
}

CodeGeneration EsmAssetReference::code_generation(const ChunkingContext& chunking) const {
    auto mapping = PatternMapping::resolve_request(chunking, *resolve_reference(),
                                                   ResolveType::EsmStatic);
    const uint32_t index = path_.front();
    std::string specifier = request_.specifier();

    CodeGeneration visitors;
    visitors.push_back(js::visit_item(path_, [mapping, index, specifier](js::ModuleItem& item) {
        std::string text;
        if (mapping.is_invalid()) {
            text = throw_unresolved(specifier);
        } else if (const auto* decl = std::get_if<js::ImportDecl>(&item.node)) {
            text = import_bindings(*decl, namespace_source(mapping));
        } else if (const auto* from = std::get_if<js::ExportFromDecl>(&item.node)) {
            text = reexports(*from, namespace_source(mapping), index);
        } else {
            throw std::logic_error("static import reference at " + js::ast_path_to_string({index}) +
                                   " is not an import or re-export");
        }
        item.node = js::Synthetic{std::move(text)};
    }));
    return visitors;
}

// ============================================================================
// EsmAsyncAssetReference
// ============================================================================

std::string EsmAsyncAssetReference::description() const {
    return "dynamic import " + request_.to_string();
}

CodeGeneration EsmAsyncAssetReference::code_generation(const ChunkingContext& chunking) const {
    auto mapping = PatternMapping::resolve_request(chunking, *resolve_reference(),
                                                   ResolveType::EsmAsync);

    CodeGeneration visitors;
    if (mapping.is_invalid()) {
        visitors.push_back(js::visit_call(path_, [](js::Call& call, js::Span) {
            auto old_args = std::move(call.args);
            call.args.clear();

            js::Expr message = [&] {
                if (old_args.empty()) {
                    return js::make_str("import() expressions require at least 1 argument", '\'');
                }
                if (old_args.front().spread) {
                    return js::make_str("spread operator is illegal in import() expressions.", '\'');
                }
                return unresolved_message(std::move(*old_args.front().expr));
            }();

            call.callee = js::make_path("Promise.reject");
            call.args.push_back(js::make_arg(new_error(std::move(message))));
        }));
    } else {
        visitors.push_back(js::visit_call(path_, [mapping](js::Call& call, js::Span) {
            auto old_args = std::move(call.args);
            call.args.clear();

            js::Expr expr = !old_args.empty() && !old_args.front().spread
                                ? mapping.apply(std::move(*old_args.front().expr))
                                : mapping.create();

            if (mapping.is_internal_import()) {
                std::vector<js::Expr> loader_args;
                loader_args.push_back(std::move(expr));
                call.callee = js::make_call(js::make_ident(runtime::kRequire), std::move(loader_args));
                call.args.push_back(js::make_arg(js::make_ident(runtime::kImport)));
            } else {
                call.args.push_back(js::make_arg(std::move(expr)));
            }
        }));
    }
    return visitors;
}

// ============================================================================
// CjsRequireAssetReference
// ============================================================================

std::string CjsRequireAssetReference::description() const {
    return "require " + request_.to_string();
}

CodeGeneration CjsRequireAssetReference::code_generation(const ChunkingContext& chunking) const {
    auto mapping = PatternMapping::resolve_request(chunking, *resolve_reference(), ResolveType::Cjs);

    CodeGeneration visitors;
    visitors.push_back(js::visit_call(path_, [mapping](js::Call& call, js::Span) {
        auto old_args = std::move(call.args);
        call.args.clear();

        if (mapping.is_invalid()) {
            js::Expr message = [&] {
                if (old_args.empty()) {
                    return js::make_str("require() expressions require at least 1 argument", '\'');
                }
                if (old_args.front().spread) {
                    return js::make_str("spread operator is illegal in require() expressions.", '\'');
                }
                return unresolved_message(std::move(*old_args.front().expr));
            }();
            // Thrown when the require runs, as the original call would
            call.callee = js::Expr{
                js::Raw{"() => { throw " + js::print_expr(new_error(std::move(message))) + "; }"}, {}};
            return;
        }

        js::Expr expr = !old_args.empty() && !old_args.front().spread
                            ? mapping.apply(std::move(*old_args.front().expr))
                            : mapping.create();
        if (mapping.is_internal_import()) {
            call.callee = js::make_ident(runtime::kRequire);
        }
        call.args.push_back(js::make_arg(std::move(expr)));
    }));
    return visitors;
}

// ============================================================================
// Reference extraction
// ============================================================================

Request call_request(const js::Call& call) {
    if (call.args.empty()) {
        return Request::parse("");
    }
    const auto& first = call.args.front();
    if (first.spread) {
        return Request::dynamic("..." + js::print_expr(*first.expr));
    }
    if (const auto* str = std::get_if<js::Str>(&first.expr->node)) {
        return Request::parse(str->value);
    }
    return Request::dynamic(js::print_expr(*first.expr));
}

std::vector<ReferenceRef> module_references(const AssetContext& context, const std::string& origin,
                                            const js::Program& program) {
    std::vector<ReferenceRef> references;

    for (uint32_t i = 0; i < program.body.size(); ++i) {
        const auto& item = program.body[i];

        if (const auto* decl = std::get_if<js::ImportDecl>(&item.node)) {
            references.push_back(std::make_shared<EsmAssetReference>(
                context, origin, Request::parse(decl->src.value), js::AstPath{i}));
            continue;
        }
        if (const auto* from = std::get_if<js::ExportFromDecl>(&item.node)) {
            references.push_back(std::make_shared<EsmAssetReference>(
                context, origin, Request::parse(from->src.value), js::AstPath{i}));
            continue;
        }

        js::walk_exprs(item, i, [&](const js::Expr& expr, const js::AstPath& path) {
            const auto* call = std::get_if<js::Call>(&expr.node);
            if (!call) {
                return;
            }
            if (std::holds_alternative<js::Import>(call->callee->node)) {
                references.push_back(std::make_shared<EsmAsyncAssetReference>(
                    context, origin, call_request(*call), path));
            } else if (const auto* ident = std::get_if<js::Ident>(&call->callee->node);
                       ident && ident->sym == "require") {
                references.push_back(std::make_shared<CjsRequireAssetReference>(
                    context, origin, call_request(*call), path));
            }
        });
    }

    return references;
}

CodeGeneration esm_exports_code_generation(const js::Program& program) {
    CodeGeneration visitors;
    std::vector<std::pair<std::string, std::string>> exports;

    auto remove_keyword = [](std::string replacement) {
        return [replacement = std::move(replacement)](js::ModuleItem& item) {
            item.node = js::Synthetic{replacement};
        };
    };

    for (uint32_t i = 0; i < program.body.size(); ++i) {
        const auto& node = program.body[i].node;

        if (const auto* decl = std::get_if<js::ExportDecl>(&node)) {
            for (const auto& name : decl->names) {
                exports.emplace_back(name, name);
            }
            visitors.push_back(js::visit_item({i}, remove_keyword("")));
        } else if (const auto* def = std::get_if<js::ExportDefaultDecl>(&node)) {
            if (def->name) {
                exports.emplace_back("default", *def->name);
                visitors.push_back(js::visit_item({i}, remove_keyword("")));
            } else {
                exports.emplace_back("default", runtime::kDefaultExport);
                visitors.push_back(js::visit_item(
                    {i}, remove_keyword("const " + std::string(runtime::kDefaultExport) + " =")));
            }
        } else if (const auto* named = std::get_if<js::ExportNamedDecl>(&node)) {
            for (const auto& spec : named->specifiers) {
                exports.emplace_back(spec.exported, spec.local);
            }
            visitors.push_back(js::visit_item({i}, remove_keyword("")));
        }
    }

    if (!exports.empty()) {
        // Registered before the body runs so that cyclic importers see the getters
        std::string text = getters(exports) + "\n";
        visitors.push_back(js::visit_program([text](js::Program& target) {
            target.body.insert(target.body.begin(), js::ModuleItem{js::Synthetic{text}, js::Span{}});
        }));
    }

    return visitors;
}

}  // namespace quickpack
