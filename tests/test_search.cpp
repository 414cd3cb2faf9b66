#include "fixtures.hpp"
#include "lpb/search.hpp"

#include <catch2/catch.hpp>

using namespace libprobe;

namespace {

struct CollidingLibraries {
    CollidingLibraries() {
        ws.library("libs", "mylib-2.0.0", "MyLib", "2.0.0", "", {{"src/MyLib.h", ""}});
        ws.library("builtin", "MyLib", "MyLib", "1.0.0", "", {{"MyLib.h", ""}});
        ws.library("builtin", "Other", "Other", "1.0.0", "", {{"Shared.h", ""}});
        ws.library("libs", "zeta", "Zeta", "1.0.0", "", {{"Shared.h", ""}});
        REQUIRE(index.add_root(ws.path() / "libs", LibraryLocation::OTHER).has_value());
        REQUIRE(index.add_root(ws.path() / "builtin", LibraryLocation::BUILT_IN).has_value());
    }

    const Library &get(const std::string &name, const std::string &version) const {
        const Library *lib = index.find(name, version);
        REQUIRE(lib != nullptr);
        return *lib;
    }

    test::Workspace ws;
    LibraryIndex index;
};

} // namespace

TEST_CASE("SearchContext prefers a folder named after the header", "[search]") {
    CollidingLibraries fx;
    SearchContext search(fx.index);
    REQUIRE(search.resolve("MyLib.h") == &fx.get("MyLib", "1.0.0"));
}

TEST_CASE("SearchContext prefers an aliased library over the folder name", "[search]") {
    CollidingLibraries fx;
    SearchContext search(fx.index);
    const Library &versioned = fx.get("MyLib", "2.0.0");

    REQUIRE(search.add_alias("MyLib", versioned).has_value());
    REQUIRE(search.resolve("MyLib.h") == &versioned);

    search.remove_alias("MyLib");
    REQUIRE(search.resolve("MyLib.h") == &fx.get("MyLib", "1.0.0"));
}

TEST_CASE("SearchContext falls back to other libraries before built-in ones", "[search]") {
    CollidingLibraries fx;
    SearchContext search(fx.index);
    REQUIRE(search.resolve("Shared.h") == &fx.get("Zeta", "1.0.0"));
    REQUIRE(search.resolve("Unknown.h") == nullptr);
}

TEST_CASE("SearchContext refuses conflicting or empty aliases", "[search]") {
    CollidingLibraries fx;
    SearchContext search(fx.index);
    const Library &a = fx.get("MyLib", "2.0.0");
    const Library &b = fx.get("Zeta", "1.0.0");

    REQUIRE(search.add_alias("MyLib", a).has_value());
    REQUIRE(search.add_alias("MyLib", a).has_value());
    REQUIRE_FALSE(search.add_alias("MyLib", b).has_value());
    REQUIRE_FALSE(search.add_alias("", b).has_value());
    REQUIRE(search.alias("MyLib") == &a);
}

TEST_CASE("ScopedAlias lives exactly as long as the guard", "[search]") {
    CollidingLibraries fx;
    SearchContext search(fx.index);
    const Library &versioned = fx.get("MyLib", "2.0.0");
    {
        ScopedAlias alias(search, versioned);
        REQUIRE(alias.needed());
        REQUIRE(alias.active());
        REQUIRE(search.alias("MyLib") == &versioned);
    }
    REQUIRE(search.alias("MyLib") == nullptr);

    {
        ScopedAlias alias(search, fx.get("Zeta", "1.0.0"));
        REQUIRE(alias.needed());
    }
    {
        ScopedAlias alias(search, fx.get("Other", "1.0.0"));
        REQUIRE_FALSE(alias.needed());
        REQUIRE_FALSE(alias.active());
        REQUIRE(search.alias("Other") == nullptr);
    }
}

TEST_CASE("ScopedAlias keeps an existing alias it failed to replace", "[search]") {
    CollidingLibraries fx;
    SearchContext search(fx.index);
    const Library &zeta = fx.get("Zeta", "1.0.0");
    REQUIRE(search.add_alias("MyLib", zeta).has_value());
    {
        ScopedAlias alias(search, fx.get("MyLib", "2.0.0"));
        REQUIRE(alias.needed());
        REQUIRE_FALSE(alias.active());
        REQUIRE_FALSE(alias.error().empty());
    }
    REQUIRE(search.alias("MyLib") == &zeta);
}
