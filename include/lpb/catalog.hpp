#pragma once

#include "lpb/domain.hpp"
#include "lpb/utility.hpp"

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace libprobe {

/**
 * @brief The library index file: `{"libraries": [ {...}, ... ]}`.
 *
 * Entries are kept as JSON objects so that every field survives a rewrite in its original
 * order. Only the dependency fields are ever modified.
 */
class Catalog {
public:
    static constexpr const char *REQUIRES_KEY = "requires";
    static constexpr const char *BUNDLED_KEY = "bundledRequires";

    /** @brief Parses a catalog. Every entry must be an object with string `name` and `version`. */
    static Result<Catalog> parse(std::string_view text);
    static Result<Catalog> load(const std::filesystem::path &path);

    std::optional<size_t> find(std::string_view name, std::string_view version) const;

    size_t size() const;
    std::string name(size_t entry) const;
    std::string version(size_t entry) const;
    std::vector<std::string> requires_of(size_t entry) const;
    std::vector<std::string> bundled_of(size_t entry) const;

    /**
     * @brief Writes the dependencies of one entry.
     * @param record_bundled Also write the locally provided dependencies under `bundledRequires`.
     */
    void set_dependencies(size_t entry, const DependencyClassification &deps, bool record_bundled);

    /** @brief Serialized form, indented by four spaces. */
    std::string dump() const;

private:
    explicit Catalog(nlohmann::ordered_json document) : document_(std::move(document)) {
    }

    const nlohmann::ordered_json &entry(size_t i) const {
        return document_["libraries"][i];
    }

    nlohmann::ordered_json document_;
};

/**
 * @brief Which libraries earlier runs already probed: `{"name": {"<library>": true}}`.
 */
class ProcessedCache {
public:
    ProcessedCache() = default;

    static Result<ProcessedCache> parse(std::string_view text);

    /** @brief Loads the cache; a missing file is an empty cache, a malformed one an error. */
    static Result<ProcessedCache> load(const std::filesystem::path &path);

    bool processed(std::string_view name) const;
    void mark(const std::string &name);

    size_t size() const {
        return entries_.size();
    }

    std::string dump() const;

private:
    std::map<std::string, bool, std::less<>> entries_;
};

} // namespace libprobe
