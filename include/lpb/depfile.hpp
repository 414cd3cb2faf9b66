#pragma once

#include "lpb/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace libprobe {

struct Depfile {
    std::string target;
    std::vector<std::string> dependencies;
};

/**
 * @brief Parses make-style dependency output (`gcc -M`).
 *
 * Handles backslash-newline continuations and backslash-escaped characters in file names.
 * Only the first rule's prerequisites are collected.
 */
Depfile parse_depfile_content(std::string_view content);

Result<Depfile> parse_depfile(const std::filesystem::path &path);

} // namespace libprobe
