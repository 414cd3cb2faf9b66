#pragma once

#include "lpb/domain.hpp"
#include "lpb/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace libprobe {

/**
 * @brief The libraries installed under the configured roots.
 *
 * Every immediate subfolder of a root is a library. Its `library.properties` supplies name,
 * version and architectures. Headers directly inside the source folder are indexed by file name
 * so that the pipeline can map a missing include to the libraries that provide it.
 *
 * All roots must be added before any `Library` pointer is handed out.
 */
class LibraryIndex {
public:
    /**
     * @brief Scans a library root.
     * @param root The folder containing one subfolder per library.
     * @param location Whether the root holds other (externally distributed) or built-in libraries.
     * @return Success, or an error if the root cannot be read.
     */
    Result<void> add_root(const std::filesystem::path &root, LibraryLocation location);

    const std::vector<Library> &libraries() const {
        return libraries_;
    }

    const Library *find(std::string_view name, std::string_view version) const;

    /** @return Indices of the libraries whose source folder contains `header`, in scan order. */
    std::vector<size_t> providers(std::string_view header) const;

private:
    std::vector<Library> libraries_;
    std::unordered_map<std::string, std::vector<size_t>> headers_;
};

/** @brief Reads one library folder. Missing properties fall back to folder-derived values. */
Result<Library> read_library(const std::filesystem::path &folder, LibraryLocation location);

bool is_header_file(const std::filesystem::path &path);

} // namespace libprobe
