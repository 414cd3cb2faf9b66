#include "lpb/library_index.hpp"

#include <algorithm>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace libprobe {

namespace {

struct Properties {
    std::string name;
    std::string version;
    std::string architectures;
};

Properties parse_properties(std::string_view content) {
    Properties props;
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        std::string_view line = trim(content.substr(start, end - start));
        start = end + 1;

        if (line.empty() || line.starts_with("#"))
            continue;
        size_t eq = line.find('=');
        if (eq == std::string_view::npos)
            continue;

        std::string_view key = trim(line.substr(0, eq));
        std::string_view value = trim(line.substr(eq + 1));
        if (key == "name") {
            props.name = value;
        } else if (key == "version") {
            props.version = value;
        } else if (key == "architectures") {
            props.architectures = value;
        }
    }
    return props;
}

std::vector<std::string> split_architectures(std::string_view value) {
    std::vector<std::string> archs;
    while (!value.empty()) {
        size_t comma = value.find(',');
        std::string_view arch = trim(value.substr(0, comma));
        if (!arch.empty()) {
            archs.emplace_back(arch);
        }
        if (comma == std::string_view::npos)
            break;
        value.remove_prefix(comma + 1);
    }
    return archs;
}

} // namespace

bool is_header_file(const fs::path &path) {
    const auto ext = path.extension();
    return ext == ".h" || ext == ".hpp" || ext == ".hh";
}

Result<Library> read_library(const fs::path &folder, LibraryLocation location) {
    Library lib;
    lib.folder = folder;
    lib.location = location;

    Properties props;
    const fs::path properties_path = folder / "library.properties";
    std::error_code ec;
    if (fs::exists(properties_path, ec)) {
        auto content = read_file(properties_path);
        if (!content) {
            return std::unexpected(content.error());
        }
        props = parse_properties(*content);
    }

    lib.name = props.name.empty() ? folder.filename().string() : props.name;
    lib.version = props.version;
    lib.architectures = split_architectures(props.architectures);
    if (lib.architectures.empty()) {
        lib.architectures.emplace_back("*");
    }

    if (fs::is_directory(folder / "src", ec)) {
        lib.layout = LibraryLayout::RECURSIVE;
        lib.source_folder = folder / "src";
    } else {
        lib.layout = LibraryLayout::FLAT;
        lib.source_folder = folder;
    }
    return lib;
}

Result<void> LibraryIndex::add_root(const fs::path &root, LibraryLocation location) {
    std::error_code ec;
    std::vector<fs::path> folders;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            folders.push_back(it->path());
        }
    }
    if (ec) {
        return std::unexpected(std::format("Failed to read library root {}: {}", root.string(), ec.message()));
    }
    std::ranges::sort(folders);

    for (const auto &folder : folders) {
        auto lib = read_library(fs::absolute(folder).lexically_normal(), location);
        if (!lib) {
            return std::unexpected(lib.error());
        }

        size_t id = libraries_.size();
        for (fs::directory_iterator it(lib->source_folder, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec) && is_header_file(it->path())) {
                headers_[it->path().filename().string()].push_back(id);
            }
        }
        if (ec) {
            return std::unexpected(
                std::format("Failed to read library folder {}: {}", lib->source_folder.string(), ec.message()));
        }
        libraries_.push_back(std::move(*lib));
    }
    return {};
}

const Library *LibraryIndex::find(std::string_view name, std::string_view version) const {
    for (const auto &lib : libraries_) {
        if (lib.name == name && lib.version == version)
            return &lib;
    }
    return nullptr;
}

std::vector<size_t> LibraryIndex::providers(std::string_view header) const {
    if (auto it = headers_.find(std::string(header)); it != headers_.end()) {
        return it->second;
    }
    return {};
}

} // namespace libprobe
