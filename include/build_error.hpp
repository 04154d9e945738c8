#pragma once

#include <stdexcept>
#include <string>

namespace quickpack {

// Infrastructural failure (unreadable content, failed fetch, failed task).
// Aborts the build for the affected asset; never used for unresolvable imports.
class BuildError : public std::runtime_error {
public:
    BuildError(std::string subject, const std::string& message)
        : std::runtime_error(subject + ": " + message)
        , subject_(std::move(subject)) {}

    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }

private:
    std::string subject_;
};

}  // namespace quickpack
