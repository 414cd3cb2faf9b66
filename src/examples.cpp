#include "lpb/examples.hpp"

#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace libprobe {

std::vector<fs::path> find_examples(const Library &lib) {
    const fs::path examples = lib.folder / "examples";
    std::error_code ec;
    if (!fs::is_directory(examples, ec))
        return {};
    auto found = find_files(examples, {".ino", ".pde"}, true);
    return found ? std::move(*found) : std::vector<fs::path>{};
}

ExamplePassReport run_example_pass(ProbeCompiler &compiler,
                                   JobFactory &jobs,
                                   const DependencyClassifier &classifier,
                                   const Library &lib,
                                   const std::string &profile,
                                   DependencyClassification &deps) {
    ExamplePassReport report;
    for (const auto &example : find_examples(lib)) {
        ++report.examples;
        ProbeJob job = jobs.make(profile);
        ProbeOutcome outcome = compiler.probe_unit(lib, example, job);
        if (!outcome.ok()) {
            report.errors.push_back(std::format("{}: {}", example.string(), outcome.message));
        }
        classifier.accumulate(job, lib.name, deps);
        jobs.retire(job);
    }
    return report;
}

} // namespace libprobe
