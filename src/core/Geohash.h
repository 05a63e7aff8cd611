#ifndef GEOHASH_H
#define GEOHASH_H

#include "GeoPoint.h"

#include <string>

namespace poi
{
    namespace geohash
    {
        static constexpr int MIN_PRECISION = 1;
        static constexpr int MAX_PRECISION = 12;

        /// Bounding box of a geohash cell.
        struct Cell
        {
            double min_latitude;
            double max_latitude;
            double min_longitude;
            double max_longitude;

            GeoPoint center() const
            {
                return GeoPoint((min_latitude + max_latitude) / 2.0, (min_longitude + max_longitude) / 2.0);
            }

            bool contains(const GeoPoint &p) const
            {
                return p.latitude >= min_latitude && p.latitude <= max_latitude &&
                       p.longitude >= min_longitude && p.longitude <= max_longitude;
            }
        };

        /// @brief Base-32 geohash of (latitude, longitude). Precision 7 is a ~153 m x 153 m cell.
        /// @throws std::invalid_argument if precision is outside 1..12.
        std::string encode(double latitude, double longitude, int precision = 7);

        /// @brief Cell covered by a geohash.
        /// @throws std::invalid_argument on an empty hash or a character outside the alphabet.
        Cell decode(const std::string &hash);

    } // namespace geohash
} // namespace poi

#endif // GEOHASH_H
