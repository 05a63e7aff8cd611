#ifndef GEO_POINT_H
#define GEO_POINT_H

#include <cmath>

#define EARTH_RADIUS_KM 6371.0   // Mean Earth radius in kilometers
#define DEGREES_PER_KM (1.0 / 111.0) // Planar approximation used by the proximity graph

namespace poi
{

    /**
     * @struct GeoPoint
     * @brief A latitude/longitude pair in degrees.
     */
    struct GeoPoint
    {
        double latitude = 0.0;
        double longitude = 0.0;

        GeoPoint() = default;
        GeoPoint(double lat, double lng) : latitude(lat), longitude(lng) {}

        bool operator==(const GeoPoint &other) const
        {
            return latitude == other.latitude && longitude == other.longitude;
        }
    };

    /// @brief Calculate the Haversine distance between two geographical points.
    /// @param lat1 Latitude of point 1 in degrees.
    /// @param lon1 Longitude of point 1 in degrees.
    /// @param lat2 Latitude of point 2 in degrees.
    /// @param lon2 Longitude of point 2 in degrees.
    /// @param radius Radius of the sphere (default is EARTH_RADIUS_KM).
    /// @return Distance in kilometers.
    inline double haversineKm(double lat1, double lon1, double lat2, double lon2, const double radius = EARTH_RADIUS_KM)
    {
        const double toRad = M_PI / 180.0;
        double phi1 = lat1 * toRad;
        double phi2 = lat2 * toRad;
        double dlat = phi2 - phi1;
        double dlon = lon2 * toRad - lon1 * toRad;
        double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(phi1) * std::cos(phi2) *
                       std::sin(dlon / 2) * std::sin(dlon / 2);
        double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
        return radius * c;
    }

    inline double haversineKm(const GeoPoint &a, const GeoPoint &b)
    {
        return haversineKm(a.latitude, a.longitude, b.latitude, b.longitude);
    }

    /// @brief Euclidean distance in degree space, sqrt(dlat^2 + dlng^2).
    /// Not geodesic; only meaningful at city scale.
    inline double degreeDistance(const GeoPoint &a, const GeoPoint &b)
    {
        double dlat = a.latitude - b.latitude;
        double dlng = a.longitude - b.longitude;
        return std::sqrt(dlat * dlat + dlng * dlng);
    }

} // namespace poi

#endif // GEO_POINT_H
