#include "lpb/persistence.hpp"

#include <format>

namespace fs = std::filesystem;

namespace libprobe {

Persistence::Persistence(Catalog catalog, ProcessedCache cache, fs::path catalog_path, fs::path cache_path)
    : catalog_(std::move(catalog)),
      cache_(std::move(cache)),
      catalog_path_(std::move(catalog_path)),
      cache_path_(std::move(cache_path)) {
}

Result<Persistence> Persistence::open(const fs::path &catalog_path, const fs::path &cache_path) {
    auto cache = ProcessedCache::load(cache_path);
    if (!cache) {
        return std::unexpected(cache.error());
    }
    auto catalog = Catalog::load(catalog_path);
    if (!catalog) {
        return std::unexpected(catalog.error());
    }
    return Result<Persistence>(std::in_place, std::move(*catalog), std::move(*cache), catalog_path, cache_path);
}

bool Persistence::processed(std::string_view name) const {
    std::lock_guard lock(mtx_);
    return cache_.processed(name);
}

bool Persistence::finalize(size_t entry,
                           const std::string &library,
                           const DependencyClassification &deps,
                           bool record_bundled) {
    std::lock_guard lock(mtx_);
    if (shutting_down_.load())
        return false;
    catalog_.set_dependencies(entry, deps, record_bundled);
    cache_.mark(library);
    return true;
}

Result<void> Persistence::flush() {
    std::lock_guard lock(mtx_);
    if (flushed_)
        return {};
    flushed_ = true;

    if (auto res = write_file_atomic(catalog_path_, catalog_.dump()); !res) {
        return std::unexpected(std::format("Failed to save catalog: {}", res.error()));
    }
    if (auto res = write_file_atomic(cache_path_, cache_.dump()); !res) {
        return std::unexpected(std::format("Failed to save processed cache: {}", res.error()));
    }
    return {};
}

bool Persistence::flushed() const {
    std::lock_guard lock(mtx_);
    return flushed_;
}

} // namespace libprobe
