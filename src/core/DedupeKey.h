#ifndef DEDUPE_KEY_H
#define DEDUPE_KEY_H

#include "PoiRecord.h"

#include <optional>
#include <string>

namespace poi
{
    static constexpr int DEFAULT_DEDUPE_PRECISION = 7; // ~150 m cells

    /**
     * @brief Identity key "{compact_name}_{geohash}".
     *
     * "Mỹ Khê Beach" at (16.0544, 108.2428) -> "mykhebeach_w6ugr4s".
     * Finer precision splits true duplicates on small coordinate jitter, coarser
     * precision merges unrelated places that share a generic name.
     *
     * @throws std::invalid_argument if precision is outside 1..12.
     */
    std::string generateDedupeKey(const std::string &name, double latitude, double longitude,
                                  int precision = DEFAULT_DEDUPE_PRECISION);

    /// @brief Key of a record: its stored key if present, else one derived from name and location.
    std::optional<std::string> dedupeKeyFor(const PoiRecord &record, int precision = DEFAULT_DEDUPE_PRECISION);

    /**
     * @brief Fill a missing dedupe_key (and a missing poi_id as "poi_{key}").
     *
     * An existing dedupe_key is never recomputed.
     * @return false if the record has no key and no valid coordinates to derive one.
     */
    bool assignIdentity(PoiRecord &record, int precision = DEFAULT_DEDUPE_PRECISION);

} // namespace poi

#endif // DEDUPE_KEY_H
