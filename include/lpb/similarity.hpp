#pragma once

#include <string_view>

namespace libprobe {

/** @brief Jaro similarity in [0, 1]; 1 for identical strings, 0 when nothing matches. */
double jaro(std::string_view a, std::string_view b);

/**
 * @brief Jaro-Winkler similarity: Jaro boosted by a common prefix of up to four characters
 * with scaling factor 0.1. Case-sensitive.
 */
double jaro_winkler(std::string_view a, std::string_view b);

} // namespace libprobe
