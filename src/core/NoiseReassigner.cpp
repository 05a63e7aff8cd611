#include "NoiseReassigner.h"
#include "GeoCenter.h"

#include <limits>
#include <spdlog/spdlog.h>

namespace poi
{
    size_t assignNoiseToNearest(IndexClusters &clusters,
                                const std::vector<size_t> &noise,
                                const std::vector<GeoPoint> &coords)
    {
        if (noise.empty())
        {
            return 0;
        }
        if (clusters.empty())
        {
            spdlog::warn("NoiseReassigner: cannot assign {} noise POIs, no clusters", noise.size());
            return 0;
        }

        std::vector<std::pair<int, GeoPoint>> centers;
        centers.reserve(clusters.size());
        for (const auto &entry : clusters)
        {
            centers.emplace_back(entry.first, centroidOf(coords, entry.second));
        }

        spdlog::info("NoiseReassigner: assigning {} noise POIs to {} clusters", noise.size(), centers.size());

        for (size_t pos : noise)
        {
            int nearest_id = centers.front().first;
            double min_distance = std::numeric_limits<double>::infinity();
            for (const auto &center : centers)
            {
                double d = haversineKm(coords[pos], center.second);
                if (d < min_distance)
                {
                    min_distance = d;
                    nearest_id = center.first;
                }
            }

            clusters[nearest_id].push_back(pos);
            spdlog::debug("NoiseReassigner: POI {} assigned to cluster {} (distance: {:.2f}km)", pos, nearest_id, min_distance);
        }
        return noise.size();
    }

} // namespace poi
