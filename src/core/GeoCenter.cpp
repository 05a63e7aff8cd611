#include "GeoCenter.h"
#include "CoordinateExtractor.h"

namespace poi
{
    GeoPoint clusterCenter(const std::vector<PoiRecord> &records)
    {
        double sum_lat = 0.0;
        double sum_lng = 0.0;
        size_t count = 0;

        for (const auto &record : records)
        {
            auto point = extractLocation(record);
            if (!point)
            {
                continue;
            }
            sum_lat += point->latitude;
            sum_lng += point->longitude;
            ++count;
        }

        if (count == 0)
        {
            return GeoPoint(0.0, 0.0);
        }
        return GeoPoint(sum_lat / static_cast<double>(count), sum_lng / static_cast<double>(count));
    }

    GeoPoint centroidOf(const std::vector<GeoPoint> &coords, const std::vector<size_t> &members)
    {
        if (members.empty())
        {
            return GeoPoint(0.0, 0.0);
        }

        double sum_lat = 0.0;
        double sum_lng = 0.0;
        for (size_t idx : members)
        {
            sum_lat += coords[idx].latitude;
            sum_lng += coords[idx].longitude;
        }
        double n = static_cast<double>(members.size());
        return GeoPoint(sum_lat / n, sum_lng / n);
    }

} // namespace poi
