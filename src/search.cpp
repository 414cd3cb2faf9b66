#include "lpb/search.hpp"

#include <algorithm>
#include <filesystem>
#include <format>

namespace libprobe {

const Library *SearchContext::resolve(std::string_view header) const {
    std::vector<size_t> candidates = index_.providers(header);
    if (candidates.empty())
        return nullptr;

    const auto &libs = index_.libraries();
    const std::string stem = std::filesystem::path(header).stem().string();

    if (const Library *aliased = alias(stem)) {
        for (size_t id : candidates) {
            if (&libs[id] == aliased)
                return aliased;
        }
    }

    for (size_t id : candidates) {
        if (libs[id].folder_name() == stem)
            return &libs[id];
    }

    std::ranges::stable_sort(candidates, {}, [&](size_t id) { return libs[id].location; });
    return &libs[candidates.front()];
}

Result<void> SearchContext::add_alias(const std::string &name, const Library &lib) {
    if (name.empty()) {
        return std::unexpected(std::format("Cannot alias {} under an empty name", lib.folder.string()));
    }
    auto [it, inserted] = aliases_.emplace(name, &lib);
    if (!inserted && it->second != &lib) {
        return std::unexpected(
            std::format("{} is already aliased to {}", name, it->second->folder.string()));
    }
    return {};
}

void SearchContext::remove_alias(const std::string &name) {
    aliases_.erase(name);
}

const Library *SearchContext::alias(std::string_view name) const {
    if (auto it = aliases_.find(std::string(name)); it != aliases_.end()) {
        return it->second;
    }
    return nullptr;
}

ScopedAlias::ScopedAlias(SearchContext &ctx, const Library &lib) : ctx_(ctx), name_(lib.name) {
    if (lib.folder_name() == lib.name)
        return;
    needed_ = true;
    if (auto res = ctx_.add_alias(name_, lib); !res) {
        error_ = res.error();
        return;
    }
    active_ = true;
}

ScopedAlias::~ScopedAlias() {
    if (active_) {
        ctx_.remove_alias(name_);
    }
}

} // namespace libprobe
