#include "build_error.hpp"
#include "bundle_runner.hpp"
#include "bundler.hpp"
#include "config.hpp"
#include "file_system.hpp"

#include <boost/program_options.hpp>
#include <curl/curl.h>

#include <atomic>
#include <csignal>
#include <iostream>

namespace po = boost::program_options;

namespace {
std::atomic<bool> g_stop{false};

void signal_handler(int /*signum*/) {
    g_stop = true;
}

int run_bundle(const quickpack::Config& config, const quickpack::BundleResult& result) {
    quickpack::BundleRunner runner(config);
    auto run = runner.run(result.code, config.output.filename().generic_string());
    for (const auto& line : run.output) {
        std::cout << line << "\n";
    }
    for (const auto& line : run.errors) {
        std::cerr << line << "\n";
    }
    if (config.verbose) {
        std::cout << "CPU time: " << run.stats.cpu_time_ms << " ms, memory: "
                  << run.stats.memory_used / 1024 << " KB\n";
    }
    if (!run.ok()) {
        std::cerr << "Uncaught error: " << run.error << "\n";
        return 1;
    }
    return 0;
}
}  // namespace

int main(int argc, char* argv[]) {
    quickpack::Config config;
    std::string entry;
    std::string root;
    std::string output;

    po::options_description desc("QuickPack - JavaScript module bundler");
    desc.add_options()
        ("help,h", "Show help message")
        ("entry", po::value<std::string>(&entry), "Entry module")
        ("output,o", po::value<std::string>(&output)->default_value("./dist/bundle.js"),
            "Output bundle; the source map is written next to it")
        ("root,r", po::value<std::string>(&root)->default_value("."),
            "Project root; module ids are relative to it")
        ("watch,w", po::bool_switch(&config.watch), "Rebuild whenever a source file changes")
        ("run", po::bool_switch(&config.run), "Execute the bundle with QuickJS after building")
        ("fetch-remote", po::bool_switch(&config.fetch_remote),
            "Bundle http(s) imports instead of leaving them external")
        ("verbose,v", po::bool_switch(&config.verbose), "Print timings and changed files")
        ("threads,j", po::value<size_t>(&config.thread_count)->default_value(0),
            "Number of worker threads (0 = auto)")
        ("extensions", po::value<std::vector<std::string>>(&config.extensions)->multitoken(),
            "Extensions tried when resolving (default: .js .mjs .cjs .json)")
        ("main-fields", po::value<std::vector<std::string>>(&config.main_fields)->multitoken(),
            "package.json fields naming a package entry (default: module main)")
        ("watch-interval", po::value<uint32_t>(&config.watch_interval_ms)->default_value(500),
            "Polling interval in watch mode in ms")
        ("max-memory,m", po::value<size_t>(&config.max_memory_mb)->default_value(64),
            "Max memory for --run in MB")
        ("max-cpu-time,t", po::value<uint32_t>(&config.max_cpu_time_ms)->default_value(5000),
            "Max execution time for --run in ms")
    ;

    po::positional_options_description positional;
    positional.add("entry", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return 1;
    }

    if (vm.count("help") || entry.empty()) {
        std::cout << desc << "\n";
        std::cout << "\nUsage:\n";
        std::cout << "  # Bundle src/index.js into dist/bundle.js\n";
        std::cout << "  ./quickpack src/index.js -o dist/bundle.js\n\n";
        std::cout << "  # Rebuild on change\n";
        std::cout << "  ./quickpack src/index.js --watch\n\n";
        std::cout << "  # Build and execute\n";
        std::cout << "  ./quickpack src/index.js --run\n";
        return entry.empty() && !vm.count("help") ? 1 : 0;
    }

    std::error_code ec;
    config.root = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        std::cerr << "Error: invalid root " << root << ": " << ec.message() << "\n";
        return 1;
    }
    config.entry = std::filesystem::absolute(entry);
    config.output = output;

    if (!std::filesystem::exists(config.entry)) {
        std::cerr << "Error: Entry file not found: " << entry << "\n";
        return 1;
    }

    // Initialize libcurl globally (required for thread safety)
    curl_global_init(CURL_GLOBAL_ALL);

    int status = 0;
    try {
        quickpack::DiskFileSystem fs;
        quickpack::Bundler bundler(config, fs);

        if (config.watch) {
            std::signal(SIGINT, signal_handler);
            std::signal(SIGTERM, signal_handler);
            bundler.watch(g_stop);
            std::cout << "\nStopped watching.\n";
        } else {
            auto result = bundler.build();
            bundler.write(result);
            std::cout << "Wrote " << config.output.generic_string() << " and "
                      << config.source_map_output().generic_string() << " ("
                      << result.modules.size() << " modules, " << result.warnings.size()
                      << " warnings)\n";
            if (config.run) {
                status = run_bundle(config, result);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }

    curl_global_cleanup();
    return status;
}
