#include "lpb/toolchain.hpp"

#include <format>
#include <nlohmann/json.hpp>
#include <system_error>

namespace fs = std::filesystem;

namespace libprobe {

namespace {

using json = nlohmann::json;

Result<std::vector<std::string>> string_list(const json &entry, std::string_view profile, const char *key) {
    std::vector<std::string> values;
    auto it = entry.find(key);
    if (it == entry.end())
        return values;
    if (!it->is_array()) {
        return std::unexpected(std::format("Profile {}: \"{}\" must be an array of strings", profile, key));
    }
    for (const auto &value : *it) {
        if (!value.is_string()) {
            return std::unexpected(std::format("Profile {}: \"{}\" must be an array of strings", profile, key));
        }
        values.push_back(value.get<std::string>());
    }
    return values;
}

} // namespace

Result<void> ToolchainRegistry::load_hardware_folder(const fs::path &folder) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        return std::unexpected(std::format("Hardware folder {} does not exist", folder.string()));
    }
    const fs::path table = folder / "profiles.json";
    if (!fs::exists(table, ec)) {
        return {};
    }
    auto content = read_file(table);
    if (!content) {
        return std::unexpected(content.error());
    }
    if (auto res = load_table(*content, folder); !res) {
        return std::unexpected(std::format("{}: {}", table.string(), res.error()));
    }
    return {};
}

Result<void> ToolchainRegistry::load_table(std::string_view json_text, const fs::path &base) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error &err) {
        return std::unexpected(err.what());
    }

    if (!doc.is_object() || !doc.contains("profiles") || !doc["profiles"].is_object()) {
        return std::unexpected("expected an object with a \"profiles\" object");
    }

    for (const auto &[profile, entry] : doc["profiles"].items()) {
        if (!entry.is_object()) {
            return std::unexpected(std::format("Profile {} must be an object", profile));
        }

        Toolchain tc;
        for (const char *key : {"cc", "cxx"}) {
            if (auto it = entry.find(key); it != entry.end()) {
                if (!it->is_string()) {
                    return std::unexpected(std::format("Profile {}: \"{}\" must be a string", profile, key));
                }
                (std::string_view(key) == "cc" ? tc.cc : tc.cxx) = it->get<std::string>();
            }
        }

        auto cflags = string_list(entry, profile, "cflags");
        auto cxxflags = string_list(entry, profile, "cxxflags");
        auto includes = string_list(entry, profile, "includes");
        auto prelude = string_list(entry, profile, "prelude");
        for (const auto *res : {&cflags, &cxxflags, &includes, &prelude}) {
            if (!*res)
                return std::unexpected(res->error());
        }

        tc.cflags = std::move(*cflags);
        tc.cxxflags = std::move(*cxxflags);
        tc.prelude = std::move(*prelude);
        for (const auto &inc : *includes) {
            fs::path p(inc);
            tc.include_folders.push_back(p.is_absolute() ? p : (base / p).lexically_normal());
        }
        add(profile, std::move(tc));
    }
    return {};
}

void ToolchainRegistry::add(std::string profile, Toolchain toolchain) {
    toolchains_.insert_or_assign(std::move(profile), std::move(toolchain));
}

const Toolchain *ToolchainRegistry::find(std::string_view profile) const {
    if (auto it = toolchains_.find(std::string(profile)); it != toolchains_.end()) {
        return &it->second;
    }

    size_t colons = 0;
    for (size_t i = 0; i < profile.size(); ++i) {
        if (profile[i] == ':' && ++colons == 3) {
            if (auto it = toolchains_.find(std::string(profile.substr(0, i))); it != toolchains_.end()) {
                return &it->second;
            }
            break;
        }
    }

    if (auto it = toolchains_.find("*"); it != toolchains_.end()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace libprobe
