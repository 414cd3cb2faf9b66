#pragma once

#include "lpb/utility.hpp"

#include <filesystem>
#include <string_view>

namespace libprobe {

/**
 * @brief A directory that removes itself, with everything in it, when it falls out of scope.
 */
class TemporaryDirectory {
public:
    /**
     * @brief Creates a fresh directory named `<prefix>-<random hex>` under `parent`.
     * @param prefix A prefix for the name.
     * @param parent Where to create it; the system temp directory when empty.
     */
    static Result<TemporaryDirectory> create(std::string_view prefix, const std::filesystem::path &parent = {});

    TemporaryDirectory(TemporaryDirectory &&other) noexcept;
    TemporaryDirectory &operator=(TemporaryDirectory &&other) noexcept;
    TemporaryDirectory(const TemporaryDirectory &) = delete;
    TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;
    ~TemporaryDirectory();

    const std::filesystem::path &path() const {
        return path_;
    }

private:
    explicit TemporaryDirectory(std::filesystem::path path) : path_(std::move(path)) {
    }
    void remove();

    std::filesystem::path path_;
};

} // namespace libprobe
