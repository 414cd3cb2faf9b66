#pragma once

#include "lpb/domain.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace libprobe {

/**
 * @brief Splits the libraries a probe imported into externally distributed and bundled ones.
 *
 * A library is externally distributed when its folder lies under one of the "other libraries"
 * roots. The probed library itself is never classified.
 */
class DependencyClassifier {
public:
    explicit DependencyClassifier(std::vector<std::filesystem::path> external_roots);

    bool is_external(const Library &lib) const;

    /** @brief Adds the job's imported libraries to `into`, keeping discovery order and skipping duplicates. */
    void accumulate(const ProbeJob &job, std::string_view self, DependencyClassification &into) const;

private:
    std::vector<std::filesystem::path> external_roots_;
};

} // namespace libprobe
