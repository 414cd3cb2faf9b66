#pragma once

#include "lpb/catalog.hpp"
#include "lpb/domain.hpp"
#include "lpb/utility.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>

namespace libprobe {

/**
 * @brief Owns the catalog and the processed cache for one run.
 *
 * The probing loop only changes them through `finalize`, and both are written only through
 * `flush`. The two take the same lock, so a flush from the interrupt watcher sees every record
 * either fully finalized or untouched. The first flush is final; later calls do nothing.
 *
 * Once `begin_shutdown` was called, `finalize` records nothing: a probe cut short by the interrupt
 * must not be saved as processed.
 */
class Persistence {
public:
    Persistence(Catalog catalog,
                ProcessedCache cache,
                std::filesystem::path catalog_path,
                std::filesystem::path cache_path);

    /** @brief Loads both files. A malformed catalog or cache is an error. */
    static Result<Persistence> open(const std::filesystem::path &catalog_path,
                                    const std::filesystem::path &cache_path);

    /** @brief Read access for the probing thread, which is the only writer. */
    const Catalog &catalog() const {
        return catalog_;
    }

    bool processed(std::string_view name) const;

    /**
     * @brief Records the dependencies of a catalog entry and marks the library processed.
     * @return false if shutdown has begun and nothing was recorded.
     */
    bool finalize(size_t entry, const std::string &library, const DependencyClassification &deps, bool record_bundled);

    /** @brief Stops accepting records. Async-signal-safe. */
    void begin_shutdown() noexcept {
        shutting_down_.store(true);
    }

    bool shutting_down() const noexcept {
        return shutting_down_.load();
    }

    /**
     * @brief Atomically writes the catalog and the cache.
     * @return Success (also when an earlier flush already wrote), or the first write error.
     */
    Result<void> flush();

    bool flushed() const;

private:
    mutable std::mutex mtx_;
    Catalog catalog_;
    ProcessedCache cache_;
    std::filesystem::path catalog_path_;
    std::filesystem::path cache_path_;
    bool flushed_ = false;
    std::atomic<bool> shutting_down_{false};
};

} // namespace libprobe
