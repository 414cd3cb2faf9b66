#pragma once

#include "lpb/temp_dir.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace libprobe::test {

/** @brief A scratch directory for one test case, removed with everything in it afterwards. */
class Workspace {
public:
    Workspace() : dir_(make()) {
    }

    const std::filesystem::path &path() const {
        return dir_.path();
    }

    std::filesystem::path write(const std::filesystem::path &relative, const std::string &content) const {
        const auto full = path() / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary | std::ios::trunc);
        out << content;
        REQUIRE(out.good());
        return full;
    }

    std::string read(const std::filesystem::path &relative) const {
        std::ifstream in(path() / relative, std::ios::binary);
        REQUIRE(in.is_open());
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    /**
     * @brief Creates `<root>/<folder>` with a library.properties and the given files.
     * @param files Pairs of path (relative to the library folder) and content.
     */
    std::filesystem::path library(const std::string &root,
                                  const std::string &folder,
                                  const std::string &name,
                                  const std::string &version,
                                  const std::string &architectures,
                                  const std::vector<std::pair<std::string, std::string>> &files) const {
        std::string props = "name=" + name + "\nversion=" + version + "\n";
        if (!architectures.empty()) {
            props += "architectures=" + architectures + "\n";
        }
        write(std::filesystem::path(root) / folder / "library.properties", props);
        for (const auto &[file, content] : files) {
            write(std::filesystem::path(root) / folder / file, content);
        }
        return path() / root / folder;
    }

private:
    static TemporaryDirectory make() {
        auto dir = TemporaryDirectory::create("lpb-test");
        REQUIRE(dir.has_value());
        return std::move(*dir);
    }

    TemporaryDirectory dir_;
};

/** @brief A catalog document listing `(name, version)` pairs with some extra fields. */
inline std::string catalog_json(const std::vector<std::pair<std::string, std::string>> &entries) {
    std::string out = "{\n  \"libraries\": [\n";
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto &[name, version] = entries[i];
        out += "    {\"name\": \"" + name + "\", \"version\": \"" + version +
               "\", \"author\": \"someone\", \"url\": \"https://example.invalid/" + name + ".zip\", \"requires\": null}";
        out += i + 1 < entries.size() ? ",\n" : "\n";
    }
    out += "  ]\n}\n";
    return out;
}

} // namespace libprobe::test
