#include "lpb/executor.hpp"
#include "lpb/interrupt.hpp"
#include "lpb/library_index.hpp"
#include "lpb/persistence.hpp"
#include "lpb/pipeline.hpp"
#include "lpb/profile.hpp"
#include "lpb/toolchain.hpp"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <print>
#include <string>

void print_help() {
    std::println("Usage: lpb --json <library_index.json> --hardware <dirs> --tools <dirs> --libraries <dirs> [options]");
    std::println("Options:");
    std::println("  -h, --help                    Show this help message");
    std::println("  --version                     Show version");
    std::println("  --json <file>                 Library catalog to update (required)");
    std::println("  --cache <file>                Processed cache (default: cached_results.json)");
    std::println("  --hardware <dirs>             Hardware folders holding profiles.json (required)");
    std::println("  --tools <dirs>                Tool folders searched for compilers (required)");
    std::println("  --built-in-libraries <dirs>   Built-in library roots");
    std::println("  --libraries <dirs>            Other library roots (required)");
    std::println("  --force                       Probe libraries already marked processed");
    std::println("  --examples                    Also probe every bundled example");
    std::println("  --timeout <seconds>           Limit each probe's build time (default: none)");
    std::println("  --session-deps                Carry imported libraries from one probe to the next");
    std::println("  --no-bundled                  Do not record core or built-in dependencies");
    std::println("  -v, --verbose                 Print probe details");
    std::println("Folder lists may be repeated and separated by ':' or ','.");
}

void print_version() {
    std::println("lpb {}", LIBPROBE_PROJ_VER);
}

int main(const int argc, const char *const *argv) {
    libprobe::ExecutorConfig config;

    auto append_folders = [](std::vector<std::filesystem::path> &dest, std::string_view value) {
        for (auto &folder : libprobe::split_folder_list(value)) {
            dest.emplace_back(std::move(folder));
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "--force") {
            config.force = true;
        } else if (arg == "--examples") {
            config.examples = true;
        } else if (arg == "--session-deps") {
            config.accumulation = libprobe::AccumulationMode::SESSION;
        } else if (arg == "--no-bundled") {
            config.record_bundled = false;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--json" || arg == "--cache" || arg == "--hardware" || arg == "--tools" ||
                   arg == "--built-in-libraries" || arg == "--libraries" || arg == "--timeout") {
            if (i + 1 >= argc) {
                std::println(std::cerr, "Missing argument for {}", arg);
                return 1;
            }
            std::string_view value = argv[++i];
            if (arg == "--json") {
                config.catalog_path = value;
            } else if (arg == "--cache") {
                config.cache_path = value;
            } else if (arg == "--hardware") {
                append_folders(config.hardware_folders, value);
            } else if (arg == "--tools") {
                append_folders(config.tool_folders, value);
            } else if (arg == "--built-in-libraries") {
                append_folders(config.builtin_library_folders, value);
            } else if (arg == "--libraries") {
                append_folders(config.library_folders, value);
            } else {
                unsigned seconds = 0;
                auto res = std::from_chars(value.data(), value.data() + value.size(), seconds);
                if (res.ec != std::errc() || res.ptr != value.data() + value.size()) {
                    std::println(std::cerr, "Invalid timeout: {}", value);
                    return 1;
                }
                config.probe_timeout = std::chrono::seconds(seconds);
            }
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (auto res = config.validate(); !res) {
        std::println(std::cerr, "{}", res.error());
        print_help();
        return 1;
    }

    auto persistence = libprobe::Persistence::open(config.catalog_path, config.cache_path);
    if (!persistence) {
        std::println(std::cerr, "{}", persistence.error());
        return 1;
    }

    libprobe::ToolchainRegistry toolchains;
    for (const auto &folder : config.hardware_folders) {
        if (auto res = toolchains.load_hardware_folder(folder); !res) {
            std::println(std::cerr, "{}", res.error());
            return 1;
        }
    }
    if (toolchains.size() == 0) {
        std::println(std::cerr, "Warning: no profiles.json found in the hardware folders, every probe will fail");
    }

    // Other libraries take precedence over built-in ones when both provide a header.
    libprobe::LibraryIndex index;
    for (const auto &root : config.library_folders) {
        if (auto res = index.add_root(root, libprobe::LibraryLocation::OTHER); !res) {
            std::println(std::cerr, "{}", res.error());
            return 1;
        }
    }
    for (const auto &root : config.builtin_library_folders) {
        if (auto res = index.add_root(root, libprobe::LibraryLocation::BUILT_IN); !res) {
            std::println(std::cerr, "{}", res.error());
            return 1;
        }
    }

    auto watcher = libprobe::InterruptWatcher::start(*persistence);
    if (!watcher) {
        std::println(std::cerr, "{}", watcher.error());
        return 1;
    }

    libprobe::ToolchainPipeline pipeline(toolchains,
                                         {.tool_folders = config.tool_folders,
                                          .timeout = config.probe_timeout,
                                          .verbose = config.verbose});
    libprobe::Executor executor{index, *persistence, pipeline, libprobe::ProfileSelector::standard(), config};

    if (auto res = executor.execute(); !res) {
        std::println(std::cerr, "{}", res.error());
        return 1;
    }
    return 0;
}
