#include "lpb/classifier.hpp"

#include <catch2/catch.hpp>

using namespace libprobe;

namespace {

Library make_library(const std::string &name, const std::string &folder) {
    Library lib;
    lib.name = name;
    lib.folder = folder;
    return lib;
}

} // namespace

TEST_CASE("DependencyClassifier splits imports by the other-libraries roots", "[classifier]") {
    DependencyClassifier classifier({"/home/u/libraries/", "/opt/extra"});
    const Library external = make_library("External", "/home/u/libraries/External");
    const Library extra = make_library("Extra", "/opt/extra/Extra");
    const Library builtin = make_library("SPI", "/opt/hardware/avr/libraries/SPI");
    const Library lookalike = make_library("Look", "/home/u/libraries-old/Look");

    REQUIRE(classifier.is_external(external));
    REQUIRE(classifier.is_external(extra));
    REQUIRE_FALSE(classifier.is_external(builtin));
    REQUIRE_FALSE(classifier.is_external(lookalike));
}

TEST_CASE("DependencyClassifier skips the probed library and duplicates", "[classifier]") {
    DependencyClassifier classifier({"/libs"});
    const Library self = make_library("Self", "/libs/Self");
    const Library a = make_library("A", "/libs/A");
    const Library wire = make_library("Wire", "/core/libraries/Wire");

    ProbeJob first;
    first.import(self);
    first.import(a);
    first.import(wire);

    DependencyClassification deps;
    classifier.accumulate(first, "Self", deps);
    REQUIRE(deps.external == std::vector<std::string>{"A"});
    REQUIRE(deps.bundled == std::vector<std::string>{"Wire"});

    const Library b = make_library("B", "/libs/B");
    ProbeJob second;
    second.import(wire);
    second.import(b);
    second.import(a);
    classifier.accumulate(second, "Self", deps);
    REQUIRE(deps.external == std::vector<std::string>{"A", "B"});
    REQUIRE(deps.bundled == std::vector<std::string>{"Wire"});
    REQUIRE_FALSE(deps.contains("Self"));
}
