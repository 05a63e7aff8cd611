#include "ClusterBalancer.h"
#include "GeoCenter.h"

#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace poi
{
    size_t mergeToTarget(IndexClusters &clusters, const std::vector<GeoPoint> &coords, size_t target)
    {
        if (target == 0)
        {
            target = 1;
        }

        const size_t members_before = countMembers(clusters);
        size_t merges = 0;

        if (clusters.size() > target)
        {
            spdlog::info("ClusterBalancer: merging {} clusters down to {}", clusters.size(), target);
        }

        while (clusters.size() > target && clusters.size() > 1)
        {
            auto smallest = clusters.begin();
            for (auto it = clusters.begin(); it != clusters.end(); ++it)
            {
                if (it->second.size() < smallest->second.size())
                {
                    smallest = it;
                }
            }

            const GeoPoint smallest_center = centroidOf(coords, smallest->second);

            auto nearest = clusters.end();
            double min_distance = std::numeric_limits<double>::infinity();
            for (auto it = clusters.begin(); it != clusters.end(); ++it)
            {
                if (it == smallest)
                {
                    continue;
                }
                double d = degreeDistance(smallest_center, centroidOf(coords, it->second));
                if (d < min_distance)
                {
                    min_distance = d;
                    nearest = it;
                }
            }

            if (nearest == clusters.end())
            {
                break;
            }

            const int smallest_id = smallest->first;
            const size_t moved = smallest->second.size();
            nearest->second.insert(nearest->second.end(), smallest->second.begin(), smallest->second.end());
            clusters.erase(smallest);
            ++merges;

            spdlog::debug("ClusterBalancer: merged cluster {} ({} POIs) into cluster {} (distance={:.2f}km), {} clusters remain",
                          smallest_id, moved, nearest->first, min_distance / DEGREES_PER_KM, clusters.size());
        }

        if (countMembers(clusters) != members_before)
        {
            throw std::logic_error("ClusterBalancer: member count changed during merge");
        }
        return merges;
    }

    IndexClusters balanceClusters(const IndexClusters &clusters, const std::vector<GeoPoint> &coords, size_t target)
    {
        IndexClusters working = clusters;
        size_t merges = mergeToTarget(working, coords, target);
        if (merges > 0)
        {
            spdlog::info("ClusterBalancer: {} merges, {} clusters remain", merges, working.size());
        }
        return reindexClusters(working);
    }

} // namespace poi
