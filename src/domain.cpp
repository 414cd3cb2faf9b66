#include "lpb/domain.hpp"

#include <algorithm>

namespace libprobe {

bool ProbeJob::has_imported(const Library &lib) const {
    return std::ranges::any_of(imported, [&](const Library *l) { return l->name == lib.name; });
}

bool ProbeJob::import(const Library &lib) {
    if (has_imported(lib))
        return false;
    imported.push_back(&lib);
    return true;
}

void ProbeJob::add_include_folder(const std::filesystem::path &folder) {
    if (std::ranges::find(include_folders, folder) == include_folders.end()) {
        include_folders.push_back(folder);
    }
}

bool DependencyClassification::contains(std::string_view name) const {
    return std::ranges::find(external, name) != external.end() || std::ranges::find(bundled, name) != bundled.end();
}

} // namespace libprobe
