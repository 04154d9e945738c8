#pragma once

#include "file_system.hpp"
#include "task_graph.hpp"

#include <string>

namespace quickpack {

struct RemoteModule {
    std::string url;            // Requested URL
    std::string effective_url;  // After redirects; relative imports resolve against it
    FileContent content;
};

// Fetches url with libcurl. Throws BuildError on transport errors and non-200 responses.
[[nodiscard]] RemoteModule fetch_url(const std::string& url);

// Memoized fetch_url
[[nodiscard]] TaskGraph::Ref<RemoteModule> fetch_remote(TaskGraph& graph, const std::string& url);

[[nodiscard]] bool is_remote_url(std::string_view specifier);

// Resolves specifier (relative, root-relative or absolute) against base_url
[[nodiscard]] std::string join_url(const std::string& base_url, const std::string& specifier);

}  // namespace quickpack
