#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace quickpack {

// A parsed import specifier
class Request {
public:
    enum class Kind : uint8_t {
        Empty,     // ""
        Relative,  // "./a", "../b"
        Absolute,  // "/abs/c"
        Module,    // "pkg", "@scope/pkg/sub"
        Uri,       // "https://...", "node:fs", "data:..."
        Dynamic,   // Not a constant string
        Unknown,
    };

    Request() = default;

    // Parses a constant specifier
    [[nodiscard]] static Request parse(std::string_view specifier);

    // A request whose specifier is only known at runtime
    [[nodiscard]] static Request dynamic(std::string description);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& specifier() const noexcept { return specifier_; }

    // Module: package name ("@scope/pkg"); Uri: scheme ("https")
    [[nodiscard]] const std::string& module() const noexcept { return module_; }

    // Module: subpath inside the package ("" or "/sub/path"); Uri: rest after "scheme:"
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Canonical string used in memoization keys
    [[nodiscard]] std::string key() const;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Request&) const = default;

private:
    Kind kind_ = Kind::Empty;
    std::string specifier_;
    std::string module_;
    std::string path_;
};

[[nodiscard]] const char* request_kind_name(Request::Kind kind);

}  // namespace quickpack
