#include "DedupeKey.h"
#include "CoordinateExtractor.h"
#include "Geohash.h"
#include "NameNormalizer.h"

#include <spdlog/spdlog.h>

namespace poi
{
    std::string generateDedupeKey(const std::string &name, double latitude, double longitude, int precision)
    {
        return compactName(name) + "_" + geohash::encode(latitude, longitude, precision);
    }

    std::optional<std::string> dedupeKeyFor(const PoiRecord &record, int precision)
    {
        if (record.dedupe_key)
        {
            return record.dedupe_key;
        }
        auto point = extractLocation(record);
        if (!point)
        {
            return std::nullopt;
        }
        return generateDedupeKey(record.name, point->latitude, point->longitude, precision);
    }

    bool assignIdentity(PoiRecord &record, int precision)
    {
        if (!record.dedupe_key)
        {
            auto point = extractLocation(record);
            if (!point)
            {
                spdlog::debug("DedupeKey: cannot derive key for '{}', no valid location", record.name);
                return false;
            }
            record.dedupe_key = generateDedupeKey(record.name, point->latitude, point->longitude, precision);
        }

        if (record.poi_id.empty())
        {
            record.poi_id = "poi_" + *record.dedupe_key;
        }
        return true;
    }

} // namespace poi
