#include "lpb/pipeline.hpp"

#include "lpb/depfile.hpp"
#include "lpb/process_exec.hpp"
#include "lpb/temp_dir.hpp"

#include <algorithm>
#include <csignal>
#include <format>
#include <optional>
#include <print>
#include <system_error>

namespace fs = std::filesystem;

namespace libprobe {

namespace {

bool is_sketch(const fs::path &path) {
    const auto ext = path.extension();
    return ext == ".ino" || ext == ".pde";
}

bool is_c_source(const fs::path &path) {
    return path.extension() == ".c";
}

// A terminal interrupt reaches the compiler too, since it shares our process group.
bool killed_by_interrupt(const ProcessResult &res) {
    return res.signal == SIGINT || res.signal == SIGTERM || res.signal == SIGHUP;
}

// Tracks the remaining time of one pipeline run.
class Deadline {
public:
    explicit Deadline(std::chrono::milliseconds budget)
        : budget_(budget), start_(std::chrono::steady_clock::now()) {
    }

    std::optional<std::chrono::milliseconds> remaining() const {
        if (budget_.count() <= 0)
            return std::nullopt;
        auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_);
        return std::max(budget_ - elapsed, std::chrono::milliseconds(1));
    }

    bool expired() const {
        return budget_.count() > 0 && std::chrono::steady_clock::now() - start_ >= budget_;
    }

private:
    std::chrono::milliseconds budget_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace

std::vector<fs::path> library_sources(const Library &lib) {
    static const std::vector<std::string_view> SOURCE_EXTENSIONS = {".c", ".cpp", ".cc", ".cxx"};

    std::vector<fs::path> sources;
    if (lib.layout == LibraryLayout::RECURSIVE) {
        if (auto found = find_files(lib.source_folder, SOURCE_EXTENSIONS, true)) {
            sources = std::move(*found);
        }
    } else {
        if (auto found = find_files(lib.source_folder, SOURCE_EXTENSIONS, false)) {
            sources = std::move(*found);
        }
        std::error_code ec;
        if (fs::is_directory(lib.source_folder / "utility", ec)) {
            if (auto found = find_files(lib.source_folder / "utility", SOURCE_EXTENSIONS, false)) {
                sources.insert(sources.end(), found->begin(), found->end());
            }
        }
    }
    return sources;
}

ToolchainPipeline::ToolchainPipeline(const ToolchainRegistry &toolchains, PipelineConfig config)
    : toolchains(toolchains), config(std::move(config)) {
}

std::string ToolchainPipeline::find_tool(const std::string &command) const {
    if (command.find('/') != std::string::npos)
        return command;
    std::error_code ec;
    for (const auto &folder : config.tool_folders) {
        for (const auto &candidate : {folder / command, folder / "bin" / command}) {
            if (fs::is_regular_file(candidate, ec))
                return candidate.string();
        }
    }
    return command;
}

ProbeOutcome ToolchainPipeline::run(ProbeJob &job, const SearchContext &search) {
    const Toolchain *tc = toolchains.find(job.profile);
    if (!tc) {
        return {ProbeStatus::FAILED, std::format("No toolchain defined for profile {}", job.profile)};
    }

    auto build_dir = TemporaryDirectory::create("lpb-build");
    if (!build_dir) {
        return {ProbeStatus::FAILED, build_dir.error()};
    }
    const fs::path &build_path = build_dir->path();
    const Deadline deadline(config.timeout);

    std::vector<fs::path> queue{job.unit};
    auto import_library = [&](const Library &lib) {
        if (!job.import(lib))
            return false;
        job.add_include_folder(lib.source_folder);
        std::error_code ec;
        if (lib.layout == LibraryLayout::FLAT && fs::is_directory(lib.source_folder / "utility", ec)) {
            job.add_include_folder(lib.source_folder / "utility");
        }
        for (auto &src : library_sources(lib)) {
            queue.push_back(std::move(src));
        }
        return true;
    };
    // Libraries carried over from an earlier probe still need their sources compiled.
    for (const Library *lib : job.imported) {
        for (auto &src : library_sources(*lib)) {
            queue.push_back(std::move(src));
        }
    }

    auto command_for = [&](const fs::path &source) {
        std::vector<std::string> args;
        const bool c_source = is_c_source(source);
        args.push_back(find_tool(c_source ? tc->cc : tc->cxx));
        const auto &flags = c_source ? tc->cflags : tc->cxxflags;
        args.insert(args.end(), flags.begin(), flags.end());
        if (is_sketch(source)) {
            for (const auto &header : tc->prelude) {
                args.insert(args.end(), {"-include", header});
            }
        }
        for (const auto &inc : tc->include_folders) {
            args.push_back("-I" + inc.string());
        }
        for (const auto &inc : job.include_folders) {
            args.push_back("-I" + inc.string());
        }
        return args;
    };

    auto exec = [&](std::vector<std::string> &&args) {
        if (config.verbose) {
            std::string line;
            for (const auto &a : args) {
                line += a;
                line += ' ';
            }
            std::println("  $ {}", line);
        }
        return process_exec(std::move(args), build_path.string(), deadline.remaining());
    };

    // Discovery: preprocess each queued source and import the libraries providing its missing headers.
    const fs::path depfile = build_path / "probe.d";
    for (size_t i = 0; i < queue.size(); ++i) {
        const fs::path source = queue[i];
        while (true) {
            if (deadline.expired()) {
                return {ProbeStatus::TIMED_OUT, std::format("Timed out while scanning {}", source.string())};
            }

            auto args = command_for(source);
            args.insert(args.end(), {"-M", "-MG", "-MF", depfile.string()});
            if (is_sketch(source)) {
                args.insert(args.end(), {"-x", "c++"});
            }
            args.push_back(source.string());

            auto res = exec(std::move(args));
            if (!res) {
                return {ProbeStatus::FAILED, res.error()};
            }
            if (res->timed_out) {
                return {ProbeStatus::TIMED_OUT, std::format("Timed out while scanning {}", source.string())};
            }
            if (killed_by_interrupt(*res)) {
                return {ProbeStatus::INTERRUPTED, std::format("Interrupted while scanning {}", source.string())};
            }
            if (res->status != 0) {
                // The compile step below reports the actual error.
                break;
            }

            auto deps = parse_depfile(depfile);
            if (!deps) {
                return {ProbeStatus::FAILED, deps.error()};
            }

            bool imported_any = false;
            for (const auto &dep : deps->dependencies) {
                fs::path dep_path(dep);
                std::error_code ec;
                if (fs::exists(dep_path.is_absolute() ? dep_path : build_path / dep_path, ec))
                    continue;
                if (const Library *lib = search.resolve(dep)) {
                    imported_any |= import_library(*lib);
                }
            }
            if (!imported_any)
                break;
        }
    }

    // Compile: the unit first, then every source of the imported libraries.
    for (size_t i = 0; i < queue.size(); ++i) {
        const fs::path &source = queue[i];
        auto args = command_for(source);
        args.push_back("-c");
        if (is_sketch(source)) {
            args.insert(args.end(), {"-x", "c++"});
        }
        args.insert(args.end(), {source.string(), "-o", (build_path / std::format("{}.o", i)).string()});

        auto res = exec(std::move(args));
        if (!res) {
            return {ProbeStatus::FAILED, res.error()};
        }
        if (res->timed_out) {
            return {ProbeStatus::TIMED_OUT, std::format("Timed out while compiling {}", source.string())};
        }
        if (killed_by_interrupt(*res)) {
            return {ProbeStatus::INTERRUPTED, std::format("Interrupted while compiling {}", source.string())};
        }
        if (res->status != 0) {
            return {ProbeStatus::FAILED,
                    std::format("{} failed to compile (exit code {})\n{}", source.string(), res->status, res->output)};
        }
    }
    return {};
}

} // namespace libprobe
