#include "lpb/probe.hpp"

#include "lpb/similarity.hpp"
#include "lpb/temp_dir.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

namespace libprobe {

namespace {

const std::vector<std::string_view> HEADER_EXTENSIONS = {".h", ".hpp", ".hh"};

void warn_alias(const Library &lib, const ScopedAlias &alias) {
    if (alias.needed() && !alias.active()) {
        std::println(stderr, "Warning: cannot alias {} as {}: {}", lib.folder.string(), lib.name, alias.error());
    }
}

} // namespace

std::vector<std::string> select_headers(const std::vector<fs::path> &headers, std::string_view library_name) {
    std::vector<std::string> chosen;
    for (const auto &header : headers) {
        const std::string file_name = header.filename().string();
        if (jaro_winkler(file_name, library_name) > HEADER_MATCH_THRESHOLD) {
            chosen.push_back(file_name);
        }
    }
    if (chosen.empty() && !headers.empty()) {
        chosen.push_back(headers.front().filename().string());
    }
    return chosen;
}

std::string synthesize_unit(const std::vector<std::string> &headers) {
    std::string unit = "\n";
    for (const auto &header : headers) {
        unit += std::format("#include \"{}\"\n", header);
    }
    unit += "\nvoid setup(){}\nvoid loop(){}\n";
    return unit;
}

ProbeJob JobFactory::make(const std::string &profile) const {
    ProbeJob job;
    job.profile = profile;
    if (mode == AccumulationMode::SESSION) {
        job.imported = carried.imported;
        job.include_folders = carried.include_folders;
    }
    return job;
}

void JobFactory::retire(const ProbeJob &job) {
    if (mode == AccumulationMode::SESSION) {
        carried.imported = job.imported;
        carried.include_folders = job.include_folders;
    }
}

ProbeOutcome ProbeCompiler::probe_library(const Library &lib, ProbeJob &job) {
    auto headers = find_files(lib.folder, HEADER_EXTENSIONS, true);
    if (!headers) {
        std::println(stderr, "Warning: {}", headers.error());
        headers = std::vector<fs::path>{};
    }
    // Headers shipped with the bundled examples are not part of the library's interface.
    std::erase_if(*headers, [&](const fs::path &header) {
        const fs::path relative = header.lexically_relative(lib.folder);
        return !relative.empty() && *relative.begin() == "examples";
    });

    std::string prefix = "sketch" + lib.name;
    std::ranges::replace_if(prefix, [](unsigned char c) { return !std::isalnum(c); }, '_');
    auto sketch_dir = TemporaryDirectory::create(prefix);
    if (!sketch_dir) {
        return {ProbeStatus::FAILED, sketch_dir.error()};
    }

    job.unit = sketch_dir->path() / "sketch.ino";
    {
        std::ofstream out(job.unit);
        out << synthesize_unit(select_headers(*headers, lib.name));
        if (!out.good()) {
            return {ProbeStatus::FAILED, std::format("Failed to write {}", job.unit.string())};
        }
    }

    ScopedAlias alias(search, lib);
    warn_alias(lib, alias);
    return pipeline.run(job, search);
}

ProbeOutcome ProbeCompiler::probe_unit(const Library &lib, const fs::path &unit, ProbeJob &job) {
    job.unit = unit;
    ScopedAlias alias(search, lib);
    warn_alias(lib, alias);
    return pipeline.run(job, search);
}

} // namespace libprobe
