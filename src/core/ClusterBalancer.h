#ifndef CLUSTER_BALANCER_H
#define CLUSTER_BALANCER_H

#include "ClusterAssignment.h"
#include "GeoPoint.h"

#include <vector>

namespace poi
{
    /**
     * @brief Merge the smallest cluster into the cluster with the nearest centroid
     * until at most `target` clusters remain.
     *
     * Smallest = fewest members, ties to the lowest id. Nearest = Euclidean
     * distance between degree-space centroids, ties to the lowest id. The merged
     * members are appended to the surviving cluster, which keeps its id.
     * Stops early when one cluster is left. A target of 0 is treated as 1.
     *
     * @return Number of merges performed.
     */
    size_t mergeToTarget(IndexClusters &clusters, const std::vector<GeoPoint> &coords, size_t target);

    /// @brief mergeToTarget followed by reindexClusters.
    IndexClusters balanceClusters(const IndexClusters &clusters, const std::vector<GeoPoint> &coords, size_t target);

} // namespace poi

#endif // CLUSTER_BALANCER_H
