#pragma once

#include "lpb/domain.hpp"
#include "lpb/pipeline.hpp"
#include "lpb/search.hpp"
#include "lpb/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace libprobe {

/** Headers scoring above this against the library name are included in the probe unit. */
inline constexpr double HEADER_MATCH_THRESHOLD = 0.9;

/**
 * @brief Picks the headers a probe unit includes.
 *
 * Every header whose file name scores above `HEADER_MATCH_THRESHOLD` against `library_name` is
 * chosen, in traversal order. When none does, the first header is chosen alone.
 *
 * @return File names (not paths) to include.
 */
std::vector<std::string> select_headers(const std::vector<std::filesystem::path> &headers,
                                        std::string_view library_name);

/** @brief Source of a probe unit including `headers`, followed by empty `setup` and `loop`. */
std::string synthesize_unit(const std::vector<std::string> &headers);

enum class AccumulationMode : uint8_t {
    PER_LIBRARY, ///< Every probe starts with no imported libraries.
    SESSION,     ///< Every probe starts with what the previous probe imported.
};

/** @brief Hands out probe jobs, carrying imports from one probe to the next in session mode. */
class JobFactory {
public:
    explicit JobFactory(AccumulationMode mode) : mode(mode) {
    }

    ProbeJob make(const std::string &profile) const;
    void retire(const ProbeJob &job);

private:
    AccumulationMode mode;
    ProbeJob carried;
};

/**
 * @brief Builds probe units and hands them to the build pipeline.
 *
 * Every probe owns its temporary files; they are removed when the probe returns.
 */
class ProbeCompiler {
public:
    ProbeCompiler(BuildPipeline &pipeline, SearchContext &search) : pipeline(pipeline), search(search) {
    }

    /**
     * @brief Probes a library with a synthetic unit including its best-matching headers.
     *
     * The library is aliased under its canonical name for the duration of the probe when its
     * folder is named differently.
     */
    ProbeOutcome probe_library(const Library &lib, ProbeJob &job);

    /** @brief Probes an existing unit (an example sketch) with the library aliased as above. */
    ProbeOutcome probe_unit(const Library &lib, const std::filesystem::path &unit, ProbeJob &job);

private:
    BuildPipeline &pipeline;
    SearchContext &search;
};

} // namespace libprobe
