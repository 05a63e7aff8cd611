#include "ProximityClustering.h"
#include "ClusterBalancer.h"
#include "CoordinateExtractor.h"
#include "ProximityGraph.h"

#include <spdlog/spdlog.h>

namespace poi
{
    ClusterAssignment clusterByProximity(const std::vector<PoiRecord> &records,
                                         double radius_km,
                                         std::optional<size_t> target_clusters)
    {
        ClusterAssignment result;
        if (records.empty())
        {
            return result;
        }

        ExtractedCoordinates extracted = extractCoordinates(records);
        if (extracted.empty())
        {
            spdlog::warn("ProximityClustering: no located POIs, returning all {} records as one cluster", records.size());
            result.clusters[1] = records;
            return result;
        }

        ProximityGraph graph = buildProximityGraph(extracted.coords, radius_km);
        IndexClusters clusters = groupByLabel(labelConnectedComponents(graph));

        spdlog::info("ProximityClustering: BFS created {} clusters from {} POIs (radius={}km, unlocated={})",
                     clusters.size(), extracted.size(), radius_km, extracted.excluded.size());

        if (target_clusters && clusters.size() > *target_clusters)
        {
            clusters = balanceClusters(clusters, extracted.coords, *target_clusters);
        }

        return materialize(records, extracted, clusters);
    }

} // namespace poi
