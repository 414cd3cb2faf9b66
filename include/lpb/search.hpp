#pragma once

#include "lpb/domain.hpp"
#include "lpb/library_index.hpp"
#include "lpb/utility.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace libprobe {

/**
 * @brief Maps include names to installed libraries for the build pipeline.
 *
 * A header `X.h` provided by several libraries resolves, in order, to the library aliased as `X`,
 * to a library whose folder is named `X`, and otherwise to the first provider (other roots before
 * built-in roots).
 */
class SearchContext {
public:
    explicit SearchContext(const LibraryIndex &index) : index_(index) {
    }

    const Library *resolve(std::string_view header) const;

    /**
     * @brief Makes `lib` reachable under `name` for header resolution.
     * @return Success, or an error if `name` is empty or already aliased to another library.
     */
    Result<void> add_alias(const std::string &name, const Library &lib);
    void remove_alias(const std::string &name);

    const Library *alias(std::string_view name) const;

    const LibraryIndex &index() const {
        return index_;
    }

private:
    const LibraryIndex &index_;
    std::unordered_map<std::string, const Library *> aliases_;
};

/**
 * @brief Aliases a library under its canonical name for the lifetime of the guard.
 *
 * Nothing is registered when the folder is already named after the library. A failed
 * registration leaves the guard inactive and the error available through `error()`.
 */
class ScopedAlias {
public:
    ScopedAlias(SearchContext &ctx, const Library &lib);
    ~ScopedAlias();

    ScopedAlias(const ScopedAlias &) = delete;
    ScopedAlias &operator=(const ScopedAlias &) = delete;

    bool needed() const {
        return needed_;
    }
    bool active() const {
        return active_;
    }
    const std::string &error() const {
        return error_;
    }

private:
    SearchContext &ctx_;
    std::string name_;
    bool needed_ = false;
    bool active_ = false;
    std::string error_;
};

} // namespace libprobe
