#include "fixtures.hpp"
#include "lpb/library_index.hpp"
#include "lpb/probe.hpp"
#include "lpb/similarity.hpp"

#include <catch2/catch.hpp>

namespace fs = std::filesystem;
using namespace libprobe;

namespace {

// Records what the probe compiler handed over while the probe is running.
class RecordingPipeline : public BuildPipeline {
public:
    ProbeOutcome run(ProbeJob &job, const SearchContext &search) override {
        ++calls;
        unit = job.unit;
        unit_existed = fs::exists(job.unit);
        std::ifstream in(job.unit);
        unit_source.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        aliased = search.alias(alias_probe);
        return outcome;
    }

    ProbeOutcome outcome;
    std::string alias_probe;
    int calls = 0;
    fs::path unit;
    bool unit_existed = false;
    std::string unit_source;
    const Library *aliased = nullptr;
};

} // namespace

TEST_CASE("jaro_winkler matches the textbook values", "[similarity]") {
    REQUIRE(jaro_winkler("MARTHA", "MARHTA") == Approx(0.9611).margin(0.0001));
    REQUIRE(jaro_winkler("DWAYNE", "DUANE") == Approx(0.84).margin(0.0001));
    REQUIRE(jaro_winkler("same", "same") == Approx(1.0));
    REQUIRE(jaro_winkler("abc", "xyz") == Approx(0.0));
    REQUIRE(jaro_winkler("", "") == Approx(1.0));
    REQUIRE(jaro_winkler("Servo", "servo") < 1.0);
}

TEST_CASE("select_headers keeps every header scoring above the threshold", "[probe]") {
    const std::vector<fs::path> headers = {"/l/Servo/src/Servo.h", "/l/Servo/src/ServoTimers.h"};
    REQUIRE(select_headers(headers, "Servo") == std::vector<std::string>{"Servo.h"});
}

TEST_CASE("select_headers falls back to the first header in traversal order", "[probe]") {
    const std::vector<fs::path> headers = {"/l/x/config.h", "/l/x/util.h"};
    REQUIRE(select_headers(headers, "WiFiManager") == std::vector<std::string>{"config.h"});
    REQUIRE(select_headers({}, "WiFiManager").empty());
}

TEST_CASE("synthesize_unit includes the headers and defines empty setup and loop", "[probe]") {
    const std::string unit = synthesize_unit({"A.h", "B.h"});
    REQUIRE(unit.find("#include \"A.h\"\n#include \"B.h\"\n") != std::string::npos);
    REQUIRE(unit.ends_with("void setup(){}\nvoid loop(){}\n"));
}

TEST_CASE("JobFactory resets imports per library unless carrying a session", "[probe]") {
    Library dep;
    dep.name = "Dep";

    JobFactory per_library(AccumulationMode::PER_LIBRARY);
    ProbeJob first = per_library.make("p");
    first.import(dep);
    per_library.retire(first);
    REQUIRE(per_library.make("p").imported.empty());

    JobFactory session(AccumulationMode::SESSION);
    ProbeJob carried = session.make("p");
    carried.import(dep);
    carried.add_include_folder("/libs/Dep");
    session.retire(carried);
    ProbeJob next = session.make("q");
    REQUIRE(next.profile == "q");
    REQUIRE(next.imported.size() == 1);
    REQUIRE(next.include_folders == std::vector<fs::path>{"/libs/Dep"});
}

TEST_CASE("ProbeCompiler writes a unit, aliases the library and cleans up", "[probe]") {
    test::Workspace ws;
    ws.library("libs", "mylib-2.0.0", "MyLib", "2.0.0", "", {{"src/MyLib.h", ""}, {"src/detail/Impl.h", ""}});

    LibraryIndex index;
    REQUIRE(index.add_root(ws.path() / "libs", LibraryLocation::OTHER).has_value());
    const Library &lib = index.libraries().front();

    SearchContext search(index);
    RecordingPipeline pipeline;
    pipeline.alias_probe = "MyLib";
    ProbeCompiler compiler(pipeline, search);

    ProbeJob job;
    job.profile = "arduino:avr:micro";
    ProbeOutcome outcome = compiler.probe_library(lib, job);

    REQUIRE(outcome.ok());
    REQUIRE(pipeline.calls == 1);
    REQUIRE(pipeline.unit_existed);
    REQUIRE(pipeline.unit.filename() == "sketch.ino");
    REQUIRE(pipeline.unit_source.find("#include \"MyLib.h\"") != std::string::npos);
    REQUIRE(pipeline.unit_source.find("Impl.h") == std::string::npos);
    REQUIRE(pipeline.aliased == &lib);

    REQUIRE_FALSE(fs::exists(pipeline.unit.parent_path()));
    REQUIRE(search.alias("MyLib") == nullptr);
}

TEST_CASE("ProbeCompiler removes the alias and unit after a failed probe", "[probe]") {
    test::Workspace ws;
    ws.library("libs", "weird_folder", "Weird", "1.0", "", {{"Weird.h", ""}});

    LibraryIndex index;
    REQUIRE(index.add_root(ws.path() / "libs", LibraryLocation::OTHER).has_value());
    SearchContext search(index);
    RecordingPipeline pipeline;
    pipeline.alias_probe = "Weird";
    pipeline.outcome = {ProbeStatus::FAILED, "boom"};
    ProbeCompiler compiler(pipeline, search);

    ProbeJob job;
    ProbeOutcome outcome = compiler.probe_library(index.libraries().front(), job);
    REQUIRE(outcome.status == ProbeStatus::FAILED);
    REQUIRE(pipeline.aliased != nullptr);
    REQUIRE(search.alias("Weird") == nullptr);
    REQUIRE_FALSE(fs::exists(pipeline.unit));
}

TEST_CASE("ProbeCompiler probes without an alias when registration fails", "[probe]") {
    test::Workspace ws;
    ws.library("libs", "first", "Shared", "1.0", "", {{"Shared.h", ""}});
    ws.library("libs", "second", "Shared", "2.0", "", {{"Shared.h", ""}});

    LibraryIndex index;
    REQUIRE(index.add_root(ws.path() / "libs", LibraryLocation::OTHER).has_value());
    const Library &first = index.libraries()[0];
    const Library &second = index.libraries()[1];

    SearchContext search(index);
    REQUIRE(search.add_alias("Shared", first).has_value());

    RecordingPipeline pipeline;
    pipeline.alias_probe = "Shared";
    ProbeCompiler compiler(pipeline, search);
    ProbeJob job;
    REQUIRE(compiler.probe_library(second, job).ok());
    REQUIRE(pipeline.calls == 1);
    REQUIRE(pipeline.aliased == &first);
    REQUIRE(search.alias("Shared") == &first);
}

TEST_CASE("Header selection skips the examples folder", "[headers]") {
    test::Workspace ws;
    ws.library("libs", "zzyzx", "Zzyzx", "1.0", "",
               {{"examples/Demo/Demo.h", ""}, {"examples/Demo/Demo.ino", ""}, {"src/config.h", ""}});

    LibraryIndex index;
    REQUIRE(index.add_root(ws.path() / "libs", LibraryLocation::OTHER).has_value());
    SearchContext search(index);
    RecordingPipeline pipeline;
    ProbeCompiler compiler(pipeline, search);

    ProbeJob job;
    REQUIRE(compiler.probe_library(index.libraries().front(), job).ok());
    REQUIRE(pipeline.unit_source.find("#include \"config.h\"") != std::string::npos);
    REQUIRE(pipeline.unit_source.find("Demo.h") == std::string::npos);
}
