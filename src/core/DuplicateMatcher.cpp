#include "DuplicateMatcher.h"
#include "CoordinateExtractor.h"
#include "DedupeKey.h"
#include "GeoPoint.h"
#include "NameNormalizer.h"

#include <spdlog/spdlog.h>

namespace poi
{
    size_t DedupeResult::duplicateCount() const
    {
        size_t total = 0;
        for (const auto &entry : duplicates)
        {
            total += entry.second.size();
        }
        return total;
    }

    DuplicateMatcher::DuplicateMatcher(const AlgorithmParameters &params)
    {
        // Only override if parameter was explicitly set
        if (params.has("distance_threshold_m"))
        {
            m_distance_threshold_m = params.get<double>("distance_threshold_m");
        }

        if (params.has("precision"))
        {
            m_precision = params.get<int>("precision");
        }

        if (params.has("min_name_similarity"))
        {
            m_min_name_similarity = params.get<double>("min_name_similarity");
        }

        spdlog::debug("DuplicateMatcher: threshold={}m, precision={}, min_name_similarity={}",
                      m_distance_threshold_m, m_precision, m_min_name_similarity);
    }

    bool DuplicateMatcher::areDuplicates(const PoiRecord &a, const PoiRecord &b) const
    {
        auto key_a = dedupeKeyFor(a, m_precision);
        auto key_b = dedupeKeyFor(b, m_precision);
        if (key_a && key_b && *key_a == *key_b)
        {
            return true;
        }
        return fuzzyMatch(a, b);
    }

    bool DuplicateMatcher::fuzzyMatch(const PoiRecord &a, const PoiRecord &b) const
    {
        const std::string name_a = compactName(a.name);
        const std::string name_b = compactName(b.name);
        if (name_a.empty() || name_b.empty())
        {
            return false;
        }
        if (nameSimilarity(name_a, name_b) < m_min_name_similarity)
        {
            return false;
        }

        auto loc_a = extractLocation(a);
        auto loc_b = extractLocation(b);
        if (!loc_a || !loc_b)
        {
            return false;
        }

        double distance_m = haversineKm(*loc_a, *loc_b) * 1000.0;
        spdlog::debug("DuplicateMatcher: '{}' vs '{}' {:.1f}m apart", a.name, b.name, distance_m);
        return distance_m <= m_distance_threshold_m;
    }

    DedupeResult DuplicateMatcher::collapse(const std::vector<PoiRecord> &records) const
    {
        DedupeResult result;
        for (const auto &record : records)
        {
            bool merged = false;
            for (size_t i = 0; i < result.canonical.size(); ++i)
            {
                if (areDuplicates(result.canonical[i], record))
                {
                    result.duplicates[i].push_back(record);
                    merged = true;
                    break;
                }
            }
            if (!merged)
            {
                result.canonical.push_back(record);
            }
        }

        spdlog::info("DuplicateMatcher: {} records collapsed to {} places ({} duplicates)",
                     records.size(), result.canonical.size(), result.duplicateCount());
        return result;
    }

    bool areDuplicates(const PoiRecord &a, const PoiRecord &b)
    {
        return DuplicateMatcher().areDuplicates(a, b);
    }

} // namespace poi
