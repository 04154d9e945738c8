#include "remote_fetch.hpp"
#include "build_error.hpp"

#include <curl/curl.h>

namespace quickpack {

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// "https://host/a/b.js?x" -> "https://host/a/"
std::string get_base_url(const std::string& url) {
    size_t query_pos = url.find('?');
    std::string path = (query_pos != std::string::npos) ? url.substr(0, query_pos) : url;

    size_t scheme_end = path.find("://");
    size_t authority_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    size_t last_slash = path.rfind('/');
    if (last_slash != std::string::npos && last_slash >= authority_start) {
        return path.substr(0, last_slash + 1);
    }
    return path + "/";
}

std::string get_origin(const std::string& url) {
    size_t start = url.find("://");
    if (start == std::string::npos) return "";
    start += 3;
    size_t end = url.find('/', start);
    return end == std::string::npos ? url : url.substr(0, end);
}

}  // namespace

bool is_remote_url(std::string_view specifier) {
    return specifier.rfind("https://", 0) == 0 || specifier.rfind("http://", 0) == 0;
}

std::string join_url(const std::string& base_url, const std::string& specifier) {
    if (is_remote_url(specifier)) {
        return specifier;
    }

    if (!specifier.empty() && specifier[0] == '/') {
        return get_origin(base_url) + specifier;
    }

    std::string base = get_base_url(base_url);
    std::string rel = specifier;
    const size_t origin_len = get_origin(base_url).size();

    while (true) {
        if (rel.rfind("./", 0) == 0) {
            rel = rel.substr(2);
        } else if (rel.rfind("../", 0) == 0) {
            rel = rel.substr(3);
            // Remove one directory from base, never past the origin
            if (base.size() > origin_len + 1) {
                size_t pos = base.rfind('/', base.size() - 2);
                if (pos != std::string::npos && pos >= origin_len) {
                    base = base.substr(0, pos + 1);
                }
            }
        } else {
            break;
        }
    }
    return base + rel;
}

RemoteModule fetch_url(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw BuildError(url, "failed to initialize CURL");
    }

    std::string response_body;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "User-Agent: quickpack/1.0");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    // Get final URL after redirects
    char* final_url = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &final_url);
    std::string effective_url = final_url ? final_url : url;

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw BuildError(url, std::string("fetch failed: ") + curl_easy_strerror(res));
    }
    if (http_code != 200) {
        throw BuildError(url, "HTTP error " + std::to_string(http_code));
    }

    RemoteModule module;
    module.url = url;
    module.effective_url = std::move(effective_url);
    module.content.digest = content_digest(response_body);
    module.content.bytes = std::move(response_body);
    return module;
}

TaskGraph::Ref<RemoteModule> fetch_remote(TaskGraph& graph, const std::string& url) {
    return graph.run<RemoteModule>(TaskKey{"remote.fetch", url}, [&] { return fetch_url(url); });
}

}  // namespace quickpack
