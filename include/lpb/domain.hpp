#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace libprobe {

enum class LibraryLocation : uint8_t { OTHER, BUILT_IN };

enum class LibraryLayout : uint8_t { FLAT, RECURSIVE };

/** @brief A library installed in one of the scanned roots. */
struct Library {
    std::string name; ///< Canonical name, from library.properties.
    std::string version;
    std::vector<std::string> architectures;
    std::filesystem::path folder;        ///< Library root.
    std::filesystem::path source_folder; ///< `src/` for recursive layouts, the root otherwise.
    LibraryLayout layout = LibraryLayout::FLAT;
    LibraryLocation location = LibraryLocation::OTHER;

    std::string folder_name() const {
        return folder.filename().string();
    }
};

/** INTERRUPTED: the compiler was killed by a termination signal; the result must not be recorded. */
enum class ProbeStatus : uint8_t { SUCCEEDED, FAILED, TIMED_OUT, INTERRUPTED };

struct ProbeOutcome {
    ProbeStatus status = ProbeStatus::SUCCEEDED;
    std::string message;

    bool ok() const {
        return status == ProbeStatus::SUCCEEDED;
    }
};

/**
 * @brief State of one probe attempt.
 *
 * The imported libraries and include folders accumulate while the pipeline resolves headers.
 * Pointers refer into the `LibraryIndex`, which outlives every job.
 */
struct ProbeJob {
    std::string profile;
    std::filesystem::path unit;
    std::vector<const Library *> imported;
    std::vector<std::filesystem::path> include_folders;

    bool has_imported(const Library &lib) const;
    /** @return true if `lib` was not imported yet. */
    bool import(const Library &lib);
    void add_include_folder(const std::filesystem::path &folder);
};

/** @brief Dependencies of one library, split by where they come from. */
struct DependencyClassification {
    std::vector<std::string> external; ///< Under an "other libraries" root.
    std::vector<std::string> bundled;  ///< Core supplied or built-in.

    bool contains(std::string_view name) const;
};

} // namespace libprobe
