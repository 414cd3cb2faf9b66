#include "lpb/temp_dir.hpp"

#include <format>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace libprobe {

Result<TemporaryDirectory> TemporaryDirectory::create(std::string_view prefix, const fs::path &parent) {
    static thread_local std::mt19937_64 prng{std::random_device{}()};

    std::error_code ec;
    fs::path base = parent.empty() ? fs::temp_directory_path(ec) : parent;
    if (ec) {
        return std::unexpected(std::format("No temporary directory available: {}", ec.message()));
    }

    static constexpr int MAX_ATTEMPTS = 16;
    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        fs::path candidate = base / std::format("{}-{:016x}", prefix, prng());
        if (fs::create_directories(candidate, ec)) {
            return TemporaryDirectory(std::move(candidate));
        }
        if (ec) {
            return std::unexpected(std::format("Failed to create {}: {}", candidate.string(), ec.message()));
        }
    }
    return std::unexpected(std::format("Failed to create a unique directory under {}", base.string()));
}

TemporaryDirectory::TemporaryDirectory(TemporaryDirectory &&other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TemporaryDirectory &TemporaryDirectory::operator=(TemporaryDirectory &&other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    remove();
}

void TemporaryDirectory::remove() {
    if (path_.empty())
        return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    path_.clear();
}

} // namespace libprobe
