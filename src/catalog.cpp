#include "lpb/catalog.hpp"

#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace libprobe {

using ordered_json = nlohmann::ordered_json;

namespace {

std::vector<std::string> string_array(const ordered_json &entry, const char *key) {
    std::vector<std::string> values;
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_array())
        return values;
    for (const auto &v : *it) {
        if (v.is_string())
            values.push_back(v.get<std::string>());
    }
    return values;
}

} // namespace

Result<Catalog> Catalog::parse(std::string_view text) {
    ordered_json doc;
    try {
        doc = ordered_json::parse(text);
    } catch (const ordered_json::parse_error &err) {
        return std::unexpected(std::format("Malformed catalog: {}", err.what()));
    }

    if (!doc.is_object() || !doc.contains("libraries") || !doc["libraries"].is_array()) {
        return std::unexpected("Malformed catalog: expected an object with a \"libraries\" array");
    }

    const auto &libraries = doc["libraries"];
    for (size_t i = 0; i < libraries.size(); ++i) {
        const auto &lib = libraries[i];
        if (!lib.is_object()) {
            return std::unexpected(std::format("Malformed catalog: entry {} is not an object", i));
        }
        for (const char *key : {"name", "version"}) {
            auto it = lib.find(key);
            if (it == lib.end() || !it->is_string()) {
                return std::unexpected(std::format("Malformed catalog: entry {} has no string \"{}\"", i, key));
            }
        }
        if (auto it = lib.find(REQUIRES_KEY); it != lib.end() && !it->is_array() && !it->is_null()) {
            return std::unexpected(std::format("Malformed catalog: entry {} has a non-array \"{}\"", i, REQUIRES_KEY));
        }
    }
    return Catalog(std::move(doc));
}

Result<Catalog> Catalog::load(const fs::path &path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    auto catalog = parse(*content);
    if (!catalog) {
        return std::unexpected(std::format("{}: {}", path.string(), catalog.error()));
    }
    return catalog;
}

std::optional<size_t> Catalog::find(std::string_view name, std::string_view version) const {
    for (size_t i = 0; i < size(); ++i) {
        const auto &e = entry(i);
        if (e["name"].get_ref<const std::string &>() == name && e["version"].get_ref<const std::string &>() == version)
            return i;
    }
    return std::nullopt;
}

size_t Catalog::size() const {
    return document_["libraries"].size();
}

std::string Catalog::name(size_t i) const {
    return entry(i)["name"].get<std::string>();
}

std::string Catalog::version(size_t i) const {
    return entry(i)["version"].get<std::string>();
}

std::vector<std::string> Catalog::requires_of(size_t i) const {
    return string_array(entry(i), REQUIRES_KEY);
}

std::vector<std::string> Catalog::bundled_of(size_t i) const {
    return string_array(entry(i), BUNDLED_KEY);
}

void Catalog::set_dependencies(size_t i, const DependencyClassification &deps, bool record_bundled) {
    auto &e = document_["libraries"][i];
    e[REQUIRES_KEY] = deps.external;
    if (record_bundled) {
        e[BUNDLED_KEY] = deps.bundled;
    }
}

std::string Catalog::dump() const {
    return document_.dump(4);
}

Result<ProcessedCache> ProcessedCache::parse(std::string_view text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &err) {
        return std::unexpected(std::format("Malformed processed cache: {}", err.what()));
    }

    ProcessedCache cache;
    if (doc.is_null())
        return cache;
    if (!doc.is_object()) {
        return std::unexpected("Malformed processed cache: expected an object");
    }

    auto names = doc.find("name");
    if (names == doc.end() || names->is_null())
        return cache;
    if (!names->is_object()) {
        return std::unexpected("Malformed processed cache: \"name\" must be an object");
    }
    for (const auto &[name, flag] : names->items()) {
        if (!flag.is_boolean()) {
            return std::unexpected(std::format("Malformed processed cache: \"{}\" is not a boolean", name));
        }
        cache.entries_.emplace(name, flag.get<bool>());
    }
    return cache;
}

Result<ProcessedCache> ProcessedCache::load(const fs::path &path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return ProcessedCache{};
    }
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    auto cache = parse(*content);
    if (!cache) {
        return std::unexpected(std::format("{}: {}", path.string(), cache.error()));
    }
    return cache;
}

bool ProcessedCache::processed(std::string_view name) const {
    auto it = entries_.find(name);
    return it != entries_.end() && it->second;
}

void ProcessedCache::mark(const std::string &name) {
    entries_.insert_or_assign(name, true);
}

std::string ProcessedCache::dump() const {
    nlohmann::json names = nlohmann::json::object();
    for (const auto &[name, flag] : entries_) {
        names[name] = flag;
    }
    nlohmann::json doc;
    doc["name"] = std::move(names);
    return doc.dump(4);
}

} // namespace libprobe
