#ifndef DBSCAN_H
#define DBSCAN_H

#include "GeoPoint.h"

#include <vector>

namespace poi
{
    /**
     * @class Dbscan
     * @brief Flat density clustering with a fixed haversine radius.
     *
     * A point is core when at least min_samples points (itself included) lie
     * within eps_km. Border points join the first cluster that reaches them.
     */
    class Dbscan
    {
    public:
        enum class PointType
        {
            Unvisited,
            Core,
            Border,
            Noise
        };

        Dbscan(double eps_km, size_t min_samples);

        /// @brief Label each point with 0..K-1 in discovery order, or NOISE_LABEL.
        std::vector<int> fit(const std::vector<GeoPoint> &coords);

        const std::vector<PointType> &pointTypes() const { return m_types; }

    private:
        std::vector<size_t> regionQuery(const std::vector<GeoPoint> &coords, size_t idx) const;

        double m_eps_km;
        size_t m_min_samples;
        std::vector<PointType> m_types;
    };

} // namespace poi

#endif // DBSCAN_H
