#ifndef DUPLICATE_MATCHER_H
#define DUPLICATE_MATCHER_H

#include "AlgorithmParameters.h"
#include "PoiRecord.h"

#include <map>
#include <vector>

namespace poi
{
    /// Canonical records and, per canonical index, the records folded into it.
    struct DedupeResult
    {
        std::vector<PoiRecord> canonical;
        std::map<size_t, std::vector<PoiRecord>> duplicates;

        size_t duplicateCount() const;
    };

    /**
     * @class DuplicateMatcher
     * @brief Decides whether two records describe the same physical place.
     *
     * Two records match when their dedupe keys are equal, or when their compact
     * names are similar enough and they lie within the distance threshold. The
     * second rule catches duplicates whose coordinates straddle a geohash cell
     * boundary.
     */
    class DuplicateMatcher
    {
    public:
        DuplicateMatcher() = default;
        explicit DuplicateMatcher(const AlgorithmParameters &params);

        bool areDuplicates(const PoiRecord &a, const PoiRecord &b) const;

        /// @brief Fold later duplicates into the first record seen for each place.
        DedupeResult collapse(const std::vector<PoiRecord> &records) const;

        double distanceThresholdMeters() const { return m_distance_threshold_m; }
        int precision() const { return m_precision; }
        double minNameSimilarity() const { return m_min_name_similarity; }

    private:
        bool fuzzyMatch(const PoiRecord &a, const PoiRecord &b) const;

        double m_distance_threshold_m = 150.0;
        int m_precision = 7;
        double m_min_name_similarity = 1.0; // 1.0 requires identical compact names
    };

    /// @brief DuplicateMatcher with default settings.
    bool areDuplicates(const PoiRecord &a, const PoiRecord &b);

} // namespace poi

#endif // DUPLICATE_MATCHER_H
