#ifndef NAME_NORMALIZER_H
#define NAME_NORMALIZER_H

#include <string>

namespace poi
{
    /**
     * @brief Canonical form of a POI name for identity matching.
     *
     * Lowercases, decomposes (NFD) and drops non-spacing marks, maps letters
     * without a decomposition (đ, ł, ø, ß, ...) through a fallback table, removes
     * parenthesized text and every character outside [a-z0-9], then collapses
     * whitespace and trims. Idempotent. Invalid UTF-8 is dropped, never thrown on.
     *
     * "Phố Cổ Hội An" -> "pho co hoi an"
     */
    std::string normalizeName(const std::string &text);

    /// @brief normalizeName with the spaces removed: "Phố Cổ Hội An" -> "phocohoian".
    std::string compactName(const std::string &text);

    /// @brief Indel similarity of two strings: 2 * LCS / (len_a + len_b), 1.0 for equal strings.
    double nameSimilarity(const std::string &a, const std::string &b);

} // namespace poi

#endif // NAME_NORMALIZER_H
