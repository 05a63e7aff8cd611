#ifndef COORDINATE_EXTRACTOR_H
#define COORDINATE_EXTRACTOR_H

#include "GeoPoint.h"
#include "PoiRecord.h"

#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace poi
{

    /**
     * @brief Dense coordinates of the located records plus the mapping back to
     * their positions in the input sequence.
     */
    struct ExtractedCoordinates
    {
        std::vector<GeoPoint> coords; ///< (latitude, longitude) per valid record
        std::vector<size_t> indices;  ///< indices[i] is the input position of coords[i]
        std::vector<size_t> excluded; ///< Input positions without valid coordinates

        size_t size() const { return coords.size(); }
        bool empty() const { return coords.empty(); }
    };

    /// @brief Read a coordinate pair from a raw location value.
    /// Accepts [lng, lat], {"coordinates": [lng, lat]} and
    /// {"latitude": .., "longitude": ..} / {"lat": .., "lng": ..}.
    /// @return The point, or std::nullopt when absent, non-numeric, not finite,
    /// or outside [-90, 90] x [-180, 180].
    std::optional<GeoPoint> extractLocation(const nlohmann::json &location);

    std::optional<GeoPoint> extractLocation(const PoiRecord &record);

    /// @brief Extract coordinates for every record, preserving input order.
    /// Records without valid coordinates are listed in `excluded`, never thrown on.
    ExtractedCoordinates extractCoordinates(const std::vector<PoiRecord> &records);

} // namespace poi

#endif // COORDINATE_EXTRACTOR_H
