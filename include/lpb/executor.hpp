#pragma once

#include "lpb/classifier.hpp"
#include "lpb/library_index.hpp"
#include "lpb/persistence.hpp"
#include "lpb/pipeline.hpp"
#include "lpb/probe.hpp"
#include "lpb/profile.hpp"
#include "lpb/search.hpp"
#include "lpb/utility.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace libprobe {

struct ExecutorConfig {
    std::filesystem::path catalog_path;
    std::filesystem::path cache_path = "cached_results.json";
    std::vector<std::filesystem::path> hardware_folders;
    std::vector<std::filesystem::path> tool_folders;
    std::vector<std::filesystem::path> builtin_library_folders;
    std::vector<std::filesystem::path> library_folders;
    bool force = false;
    bool examples = false;
    bool record_bundled = true;
    bool verbose = false;
    AccumulationMode accumulation = AccumulationMode::PER_LIBRARY;
    std::chrono::milliseconds probe_timeout{0};

    /** @return An error naming the first mandatory setting that is missing. */
    Result<void> validate() const;
};

/** @brief What happened to one library during a run. */
struct LibraryReport {
    std::string name;
    std::string profile;
    ProbeOutcome outcome;
    DependencyClassification deps;
    size_t examples = 0;
    std::vector<std::string> example_errors;
};

struct RunSummary {
    size_t processed = 0;
    size_t failed = 0;
    size_t skipped = 0;
    size_t not_in_catalog = 0;
    size_t interrupted = 0; ///< Probed but left unrecorded because of an interrupt.
    std::vector<LibraryReport> reports;
};

/**
 * @brief Probes every installed library that has a catalog entry, one at a time.
 *
 * Libraries already marked processed are skipped unless `force` is set. Each probed library is
 * finalized (dependencies written, marked processed) whether or not its probes compiled, unless an
 * interrupt cut the probe short. The loop stops once shutdown has begun.
 */
class Executor {
public:
    Executor(const LibraryIndex &index,
             Persistence &persistence,
             BuildPipeline &pipeline,
             ProfileSelector selector,
             ExecutorConfig config);

    /** @brief Runs the batch and flushes the results. */
    Result<RunSummary> execute();

    /** @brief Probes one library, including its examples when enabled. Does not finalize. */
    LibraryReport process(const Library &lib);

private:
    const LibraryIndex &index;
    Persistence &persistence;
    SearchContext search;
    ProbeCompiler compiler;
    DependencyClassifier classifier;
    ProfileSelector selector;
    JobFactory jobs;
    ExecutorConfig config;
};

/** @brief The summary line printed for a library, e.g. `Library X depends on: [..] ...`. */
std::string describe(const LibraryReport &report);
std::string describe_examples(const LibraryReport &report);

} // namespace libprobe
