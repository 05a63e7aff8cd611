#ifndef GEO_CENTER_H
#define GEO_CENTER_H

#include "GeoPoint.h"
#include "PoiRecord.h"

#include <vector>

namespace poi
{
    /// @brief Arithmetic mean of (latitude, longitude) over records with valid coordinates.
    /// @return (0, 0) when no record is located.
    GeoPoint clusterCenter(const std::vector<PoiRecord> &records);

    /// @brief Mean of the points selected by `members` (indices into `coords`).
    GeoPoint centroidOf(const std::vector<GeoPoint> &coords, const std::vector<size_t> &members);

} // namespace poi

#endif // GEO_CENTER_H
