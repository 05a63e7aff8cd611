#ifndef PROXIMITY_CLUSTERING_H
#define PROXIMITY_CLUSTERING_H

#include "ClusterAssignment.h"
#include "PoiRecord.h"

#include <optional>
#include <vector>

namespace poi
{
    /**
     * @brief Cluster POIs by connected components of the proximity graph, then
     * optionally merge down to `target_clusters`.
     *
     * Records without coordinates go to `unlocated`. If no record has valid
     * coordinates the whole input is returned as cluster 1 (empty input gives an
     * empty assignment).
     */
    ClusterAssignment clusterByProximity(const std::vector<PoiRecord> &records,
                                         double radius_km,
                                         std::optional<size_t> target_clusters = std::nullopt);

} // namespace poi

#endif // PROXIMITY_CLUSTERING_H
