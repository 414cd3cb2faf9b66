#pragma once

#include "lpb/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace libprobe {

/** @brief Compiler commands and flags a target profile compiles with. */
struct Toolchain {
    std::string cc = "gcc";
    std::string cxx = "g++";
    std::vector<std::string> cflags;
    std::vector<std::string> cxxflags;
    std::vector<std::filesystem::path> include_folders; ///< Core and variant folders.
    std::vector<std::string> prelude;                   ///< Headers force-included into every unit.
};

/**
 * @brief Toolchains by target profile, read from `profiles.json` in each hardware folder.
 *
 * Lookup tries the exact profile, then its first three `:`-separated components
 * (dropping board options), then the `*` entry.
 */
class ToolchainRegistry {
public:
    /**
     * @brief Loads `<folder>/profiles.json` if present. Later folders override earlier profiles.
     * @return Success, or an error if the folder is missing or the table is malformed.
     */
    Result<void> load_hardware_folder(const std::filesystem::path &folder);

    /** @brief Parses a profile table; relative include folders are resolved against `base`. */
    Result<void> load_table(std::string_view json_text, const std::filesystem::path &base);

    void add(std::string profile, Toolchain toolchain);

    const Toolchain *find(std::string_view profile) const;

    size_t size() const {
        return toolchains_.size();
    }

private:
    std::unordered_map<std::string, Toolchain> toolchains_;
};

} // namespace libprobe
