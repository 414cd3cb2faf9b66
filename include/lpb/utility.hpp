#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace libprobe {

template <typename T>
using Result = std::expected<T, std::string>;

/**
 * @brief Splits a folder list the way the command line accepts it.
 *
 * Values containing the platform path list separator are split on it, otherwise on commas.
 * Surrounding whitespace and quotes are stripped from every element; empty elements are dropped.
 */
std::vector<std::string> split_folder_list(std::string_view csv);

std::string_view trim(std::string_view sv);

/**
 * @brief Reads a whole file into memory.
 * @return The contents, or an error if the file cannot be opened or read.
 */
Result<std::string> read_file(const std::filesystem::path &path);

/**
 * @brief Replaces `path` with `content` so that readers never observe a partial file.
 *
 * The content is written to `<path>.tmp` first and then renamed over the target.
 */
Result<void> write_file_atomic(const std::filesystem::path &path, std::string_view content);

/**
 * @brief Lists files with one of `extensions` under `folder`.
 *
 * The order is deterministic: the files of a folder (sorted by name) come before the contents
 * of its subfolders, which are visited in sorted order when `recurse` is set.
 */
Result<std::vector<std::filesystem::path>> find_files(const std::filesystem::path &folder,
                                                       const std::vector<std::string_view> &extensions,
                                                       bool recurse);

/** @brief Formats a list as `[a b c]`. */
std::string format_list(const std::vector<std::string> &items);

} // namespace libprobe
