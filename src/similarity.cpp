#include "lpb/similarity.hpp"

#include <algorithm>
#include <vector>

namespace libprobe {

double jaro(std::string_view a, std::string_view b) {
    if (a.empty() && b.empty())
        return 1.0;
    if (a.empty() || b.empty())
        return 0.0;

    const size_t window = std::max(a.size(), b.size()) / 2 - (std::max(a.size(), b.size()) >= 2 ? 1 : 0);

    std::vector<bool> a_matched(a.size(), false);
    std::vector<bool> b_matched(b.size(), false);
    size_t matches = 0;

    for (size_t i = 0; i < a.size(); ++i) {
        const size_t lo = i > window ? i - window : 0;
        const size_t hi = std::min(i + window + 1, b.size());
        for (size_t j = lo; j < hi; ++j) {
            if (b_matched[j] || a[i] != b[j])
                continue;
            a_matched[i] = b_matched[j] = true;
            ++matches;
            break;
        }
    }
    if (matches == 0)
        return 0.0;

    size_t transpositions = 0;
    size_t k = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!a_matched[i])
            continue;
        while (!b_matched[k])
            ++k;
        if (a[i] != b[k])
            ++transpositions;
        ++k;
    }

    const double m = static_cast<double>(matches);
    const double t = static_cast<double>(transpositions) / 2.0;
    return (m / static_cast<double>(a.size()) + m / static_cast<double>(b.size()) + (m - t) / m) / 3.0;
}

double jaro_winkler(std::string_view a, std::string_view b) {
    static constexpr size_t MAX_PREFIX = 4;
    static constexpr double PREFIX_SCALE = 0.1;

    const double j = jaro(a, b);
    size_t prefix = 0;
    const size_t limit = std::min({a.size(), b.size(), MAX_PREFIX});
    while (prefix < limit && a[prefix] == b[prefix])
        ++prefix;
    return j + PREFIX_SCALE * static_cast<double>(prefix) * (1.0 - j);
}

} // namespace libprobe
