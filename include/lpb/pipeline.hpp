#pragma once

#include "lpb/domain.hpp"
#include "lpb/search.hpp"
#include "lpb/toolchain.hpp"
#include "lpb/utility.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace libprobe {

/**
 * @brief Preprocesses and compiles a probe unit.
 *
 * Implementations resolve the unit's includes through `search`, record every library they pull
 * in into `job.imported` and the folders they add into `job.include_folders`, and report whether
 * the build succeeded. Libraries recorded before a failure stay in the job.
 */
class BuildPipeline {
public:
    virtual ~BuildPipeline() = default;
    virtual ProbeOutcome run(ProbeJob &job, const SearchContext &search) = 0;
};

struct PipelineConfig {
    std::vector<std::filesystem::path> tool_folders;
    std::chrono::milliseconds timeout{0}; ///< 0 disables the deadline.
    bool verbose = false;
};

/** @brief Drives a GCC-compatible compiler picked by the job's target profile. */
class ToolchainPipeline : public BuildPipeline {
public:
    ToolchainPipeline(const ToolchainRegistry &toolchains, PipelineConfig config);

    ProbeOutcome run(ProbeJob &job, const SearchContext &search) override;

    /** @brief Resolves a bare executable name against the tool folders. */
    std::string find_tool(const std::string &command) const;

private:
    const ToolchainRegistry &toolchains;
    PipelineConfig config;
};

/** @brief Sources compiled for a library: recursive under `src/`, otherwise the root plus `utility/`. */
std::vector<std::filesystem::path> library_sources(const Library &lib);

} // namespace libprobe
