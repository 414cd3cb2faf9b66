#pragma once

#include "lpb/classifier.hpp"
#include "lpb/domain.hpp"
#include "lpb/probe.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace libprobe {

struct ExamplePassReport {
    size_t examples = 0;
    std::vector<std::string> errors; ///< One entry per example that did not build.
};

/** @brief Example sketches (`.ino`, `.pde`) under `<library>/examples`, in traversal order. */
std::vector<std::filesystem::path> find_examples(const Library &lib);

/**
 * @brief Probes every example of a library and merges what they import into `deps`.
 *
 * A failing example is recorded in the report and does not stop the pass. Dependencies found
 * earlier are never dropped.
 */
ExamplePassReport run_example_pass(ProbeCompiler &compiler,
                                   JobFactory &jobs,
                                   const DependencyClassifier &classifier,
                                   const Library &lib,
                                   const std::string &profile,
                                   DependencyClassification &deps);

} // namespace libprobe
