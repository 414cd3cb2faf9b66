#include "lpb/executor.hpp"

#include "lpb/examples.hpp"

#include <format>
#include <print>

namespace libprobe {

Result<void> ExecutorConfig::validate() const {
    if (catalog_path.empty()) {
        return std::unexpected("You need to pass the path of a library_index.json");
    }
    if (hardware_folders.empty()) {
        return std::unexpected("Parameter 'hardware' is mandatory");
    }
    if (tool_folders.empty()) {
        return std::unexpected("Parameter 'tools' is mandatory");
    }
    if (library_folders.empty()) {
        return std::unexpected("Parameter 'libraries' is mandatory");
    }
    return {};
}

std::string describe(const LibraryReport &report) {
    std::string line = std::format("Library {} depends on: {} provided by lib manager and {} provided by cores or builtin",
                                   report.name,
                                   format_list(report.deps.external),
                                   format_list(report.deps.bundled));
    switch (report.outcome.status) {
    case ProbeStatus::SUCCEEDED:
        break;
    case ProbeStatus::FAILED:
        line += std::format(" but failed to compile on {}", report.profile);
        break;
    case ProbeStatus::TIMED_OUT:
        line += std::format(" but timed out on {}", report.profile);
        break;
    case ProbeStatus::INTERRUPTED:
        line += std::format(" but was interrupted on {}", report.profile);
        break;
    }
    return line;
}

std::string describe_examples(const LibraryReport &report) {
    std::string line =
        std::format("Examples for {} depend on: {} provided by lib manager and {} provided by cores or builtin",
                    report.name,
                    format_list(report.deps.external),
                    format_list(report.deps.bundled));
    if (!report.example_errors.empty()) {
        line += std::format(" but {} failed to compile on {}", report.example_errors.size(), report.profile);
    }
    return line;
}

Executor::Executor(const LibraryIndex &index,
                   Persistence &persistence,
                   BuildPipeline &pipeline,
                   ProfileSelector selector,
                   ExecutorConfig config)
    : index(index),
      persistence(persistence),
      search(index),
      compiler(pipeline, search),
      classifier(config.library_folders),
      selector(std::move(selector)),
      jobs(config.accumulation),
      config(std::move(config)) {
}

LibraryReport Executor::process(const Library &lib) {
    const ProfileSelection selection = selector.select(lib.name, lib.architectures);
    if (config.verbose) {
        std::println("Probing {} {} from {} on {} ({})",
                     lib.name,
                     lib.version,
                     lib.folder.string(),
                     selection.profile,
                     selection.rule);
    }

    LibraryReport report;
    report.name = lib.name;
    report.profile = selection.profile;

    ProbeJob job = jobs.make(selection.profile);
    report.outcome = compiler.probe_library(lib, job);
    classifier.accumulate(job, lib.name, report.deps);
    jobs.retire(job);

    std::println("{}", describe(report));
    if (!report.outcome.ok() && config.verbose) {
        std::println(stderr, "{}", report.outcome.message);
    }

    if (config.examples && report.outcome.status != ProbeStatus::INTERRUPTED) {
        ExamplePassReport examples = run_example_pass(compiler, jobs, classifier, lib, selection.profile, report.deps);
        report.examples = examples.examples;
        report.example_errors = std::move(examples.errors);
        std::println("{}", describe_examples(report));
        if (config.verbose) {
            for (const auto &err : report.example_errors) {
                std::println(stderr, "{}", err);
            }
        }
    }
    return report;
}

Result<RunSummary> Executor::execute() {
    RunSummary summary;

    for (const auto &lib : index.libraries()) {
        if (persistence.shutting_down())
            break;

        auto entry = persistence.catalog().find(lib.name, lib.version);
        if (!entry) {
            // library not in the catalog, nothing to record
            ++summary.not_in_catalog;
            continue;
        }

        if (persistence.processed(lib.name) && !config.force) {
            ++summary.skipped;
            if (config.verbose) {
                std::println("Skipping {}, already processed", lib.name);
            }
            continue;
        }

        LibraryReport report = process(lib);
        // a probe killed by the interrupt saw only part of its dependencies
        if (report.outcome.status == ProbeStatus::INTERRUPTED ||
            !persistence.finalize(*entry, lib.name, report.deps, config.record_bundled)) {
            ++summary.interrupted;
            summary.reports.push_back(std::move(report));
            break;
        }

        ++summary.processed;
        if (!report.outcome.ok()) {
            ++summary.failed;
        }
        summary.reports.push_back(std::move(report));
    }

    if (auto res = persistence.flush(); !res) {
        return std::unexpected(res.error());
    }

    std::println("Processed {} libraries ({} did not compile), skipped {} already processed, {} not in catalog",
                 summary.processed,
                 summary.failed,
                 summary.skipped,
                 summary.not_in_catalog);
    if (summary.interrupted > 0) {
        std::println("Stopped by an interrupt, {} left unrecorded", summary.interrupted);
    }
    return summary;
}

} // namespace libprobe
