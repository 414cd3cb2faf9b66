#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace libprobe {

inline constexpr std::string_view FALLBACK_PROFILE = "arduino:avr:uno";

struct ProfileRule {
    std::string description;
    std::function<bool(std::string_view name, const std::vector<std::string> &architectures)> matches;
    std::string profile;
};

struct ProfileSelection {
    std::string profile;
    std::string rule; ///< Description of the rule that decided, or "fallback".
};

/**
 * @brief Picks the target profile a library is probed with.
 *
 * Rules are evaluated in table order and the last matching rule wins, so later rules override
 * earlier ones. When nothing matches the fallback profile is used.
 */
class ProfileSelector {
public:
    ProfileSelector(std::string fallback, std::vector<ProfileRule> rules);

    /** @brief The architecture and keyword rules used for the library catalog. */
    static ProfileSelector standard();

    ProfileSelection select(std::string_view name, const std::vector<std::string> &architectures) const;

    const std::vector<ProfileRule> &rules() const {
        return rules_;
    }

private:
    std::string fallback_;
    std::vector<ProfileRule> rules_;
};

} // namespace libprobe
