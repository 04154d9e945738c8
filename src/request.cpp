#include "request.hpp"

#include <cctype>

namespace quickpack {

namespace {

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.substr(0, prefix.size()) == prefix;
}

// "scheme:" with a scheme of at least two characters, so "c:/x" stays a path
bool has_uri_scheme(std::string_view specifier, size_t& colon) {
    colon = specifier.find(':');
    if (colon == std::string_view::npos || colon < 2) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(specifier[0]))) {
        return false;
    }
    for (size_t i = 1; i < colon; ++i) {
        char c = specifier[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

}  // namespace

Request Request::parse(std::string_view specifier) {
    Request request;
    request.specifier_ = std::string(specifier);

    if (specifier.empty()) {
        request.kind_ = Kind::Empty;
        return request;
    }

    if (specifier == "." || specifier == ".." || starts_with(specifier, "./") ||
        starts_with(specifier, "../")) {
        request.kind_ = Kind::Relative;
        request.path_ = request.specifier_;
        return request;
    }

    if (specifier[0] == '/') {
        request.kind_ = Kind::Absolute;
        request.path_ = request.specifier_;
        return request;
    }

    size_t colon = 0;
    if (has_uri_scheme(specifier, colon)) {
        request.kind_ = Kind::Uri;
        request.module_ = std::string(specifier.substr(0, colon));
        request.path_ = std::string(specifier.substr(colon + 1));
        return request;
    }

    // Bare specifier: "pkg", "pkg/sub", "@scope/pkg", "@scope/pkg/sub"
    size_t name_end = specifier.find('/');
    if (specifier[0] == '@') {
        if (name_end == std::string_view::npos || name_end + 1 >= specifier.size()) {
            request.kind_ = Kind::Unknown;
            return request;
        }
        name_end = specifier.find('/', name_end + 1);
    }
    request.kind_ = Kind::Module;
    if (name_end == std::string_view::npos) {
        request.module_ = request.specifier_;
    } else {
        request.module_ = std::string(specifier.substr(0, name_end));
        request.path_ = std::string(specifier.substr(name_end));
    }
    return request;
}

Request Request::dynamic(std::string description) {
    Request request;
    request.kind_ = Kind::Dynamic;
    request.specifier_ = std::move(description);
    return request;
}

std::string Request::key() const {
    return std::string(request_kind_name(kind_)) + " " + specifier_;
}

std::string Request::to_string() const {
    if (kind_ == Kind::Dynamic) {
        return "<dynamic " + specifier_ + ">";
    }
    return "\"" + specifier_ + "\"";
}

const char* request_kind_name(Request::Kind kind) {
    switch (kind) {
        case Request::Kind::Empty: return "empty";
        case Request::Kind::Relative: return "relative";
        case Request::Kind::Absolute: return "absolute";
        case Request::Kind::Module: return "module";
        case Request::Kind::Uri: return "uri";
        case Request::Kind::Dynamic: return "dynamic";
        case Request::Kind::Unknown: return "unknown";
    }
    return "unknown";
}

}  // namespace quickpack
