#include "lpb/utility.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace libprobe {

#ifdef _WIN32
static constexpr char PATH_LIST_SEPARATOR = ';';
#else
static constexpr char PATH_LIST_SEPARATOR = ':';
#endif

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && static_cast<unsigned char>(sv.front()) <= ' ')
        sv.remove_prefix(1);
    while (!sv.empty() && static_cast<unsigned char>(sv.back()) <= ' ')
        sv.remove_suffix(1);
    return sv;
}

std::vector<std::string> split_folder_list(std::string_view csv) {
    const char separator = csv.find(PATH_LIST_SEPARATOR) != std::string_view::npos ? PATH_LIST_SEPARATOR : ',';

    std::vector<std::string> values;
    std::string_view remaining = csv;
    while (true) {
        size_t pos = remaining.find(separator);
        std::string_view value = trim(remaining.substr(0, pos));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (!value.empty()) {
            values.emplace_back(value);
        }
        if (pos == std::string_view::npos)
            break;
        remaining = remaining.substr(pos + 1);
    }
    return values;
}

Result<std::string> read_file(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(std::format("Could not open {}", path.string()));
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::unexpected(std::format("Failed to read {}", path.string()));
    }
    return content;
}

Result<void> write_file_atomic(const fs::path &path, std::string_view content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(
                std::format("Failed to create directory {}: {}", path.parent_path().string(), ec.message()));
        }
    }

    const fs::path tmp = path.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected(std::format("Failed to open {} for writing", tmp.string()));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out.good()) {
            return std::unexpected(std::format("Failed to write {}", tmp.string()));
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return std::unexpected(std::format("Failed to replace {}: {}", path.string(), ec.message()));
    }
    return {};
}

Result<std::vector<fs::path>> find_files(const fs::path &folder,
                                          const std::vector<std::string_view> &extensions,
                                          bool recurse) {
    std::error_code ec;
    std::vector<fs::path> files;
    std::vector<fs::path> folders;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            folders.push_back(it->path());
        } else if (it->is_regular_file(ec)) {
            const std::string ext = it->path().extension().string();
            for (auto wanted : extensions) {
                if (ext == wanted) {
                    files.push_back(it->path());
                    break;
                }
            }
        }
    }
    if (ec) {
        return std::unexpected(std::format("Failed to read {}: {}", folder.string(), ec.message()));
    }

    std::ranges::sort(files);
    if (recurse) {
        std::ranges::sort(folders);
        for (const auto &sub : folders) {
            auto nested = find_files(sub, extensions, recurse);
            if (!nested) {
                return std::unexpected(nested.error());
            }
            files.insert(files.end(), nested->begin(), nested->end());
        }
    }
    return files;
}

std::string format_list(const std::vector<std::string> &items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i != 0)
            out += ' ';
        out += items[i];
    }
    out += ']';
    return out;
}

} // namespace libprobe
