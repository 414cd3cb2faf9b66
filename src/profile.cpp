#include "lpb/profile.hpp"

#include <algorithm>

namespace libprobe {

namespace {

auto has_arch(std::string arch) {
    return [arch = std::move(arch)](std::string_view, const std::vector<std::string> &archs) {
        return std::ranges::find(archs, arch) != archs.end();
    };
}

auto name_has(std::vector<std::string> keywords) {
    return [keywords = std::move(keywords)](std::string_view name, const std::vector<std::string> &) {
        return std::ranges::all_of(keywords, [&](const std::string &kw) { return name.contains(kw); });
    };
}

} // namespace

ProfileSelector::ProfileSelector(std::string fallback, std::vector<ProfileRule> rules)
    : fallback_(std::move(fallback)), rules_(std::move(rules)) {
}

ProfileSelector ProfileSelector::standard() {
    std::vector<ProfileRule> rules;
    // "*" only counts as the first tag, "avr" anywhere
    rules.push_back({"architecture * or avr",
                     [](std::string_view, const std::vector<std::string> &archs) {
                         const bool wildcard = !archs.empty() && archs.front() == "*";
                         return wildcard || std::ranges::find(archs, "avr") != archs.end();
                     },
                     "arduino:avr:micro"});
    rules.push_back({"name contains Robot", name_has({"Robot"}), "arduino:avr:robotMotor"});
    rules.push_back({"name contains Robot and Control", name_has({"Robot", "Control"}), "arduino:avr:robotControl"});
    rules.push_back(
        {"name contains Adafruit and Playground", name_has({"Adafruit", "Playground"}), "arduino:avr:circuitplay32u4cat"});
    rules.push_back({"architecture sam", has_arch("sam"), "arduino:sam:arduino_due_x_dbg"});
    rules.push_back({"architecture samd", has_arch("samd"), "arduino:samd:mkr1000"});
    rules.push_back({"architecture arc32", has_arch("arc32"), "Intel:arc32:arduino_101"});
    rules.push_back({"architecture esp8266",
                     has_arch("esp8266"),
                     "esp8266:esp8266:nodemcuv2:CpuFrequency=80,UploadSpeed=115200,FlashSize=4M3M"});
    return ProfileSelector(std::string(FALLBACK_PROFILE), std::move(rules));
}

ProfileSelection ProfileSelector::select(std::string_view name, const std::vector<std::string> &architectures) const {
    ProfileSelection selection{fallback_, "fallback"};
    for (const auto &rule : rules_) {
        if (rule.matches(name, architectures)) {
            selection = {rule.profile, rule.description};
        }
    }
    return selection;
}

} // namespace libprobe
