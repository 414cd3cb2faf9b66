#include "lpb/classifier.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace libprobe {

namespace {

fs::path normalize(const fs::path &p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    return (ec ? p : abs).lexically_normal();
}

bool is_within(const fs::path &path, const fs::path &root) {
    // "libs/" normalizes with a trailing empty component
    auto root_end = root.end();
    if (!root.has_filename() && root_end != root.begin()) {
        --root_end;
    }
    auto [root_it, path_it] = std::mismatch(root.begin(), root_end, path.begin(), path.end());
    return root_it == root_end;
}

} // namespace

DependencyClassifier::DependencyClassifier(std::vector<fs::path> external_roots) {
    for (const auto &root : external_roots) {
        external_roots_.push_back(normalize(root));
    }
}

bool DependencyClassifier::is_external(const Library &lib) const {
    const fs::path folder = normalize(lib.folder);
    return std::ranges::any_of(external_roots_, [&](const fs::path &root) { return is_within(folder, root); });
}

void DependencyClassifier::accumulate(const ProbeJob &job, std::string_view self, DependencyClassification &into) const {
    for (const Library *dep : job.imported) {
        if (dep->name == self || into.contains(dep->name))
            continue;
        if (is_external(*dep)) {
            into.external.push_back(dep->name);
        } else {
            into.bundled.push_back(dep->name);
        }
    }
}

} // namespace libprobe
