#ifndef DENSITY_CLUSTERING_H
#define DENSITY_CLUSTERING_H

#include "ClusterAssignment.h"
#include "PoiRecord.h"

#include <optional>
#include <vector>

namespace poi
{
    /**
     * @brief Cluster POIs with hierarchical density clustering over haversine distance.
     *
     * @param min_cluster_size Smallest group treated as a cluster (at least 2).
     * @param min_samples Neighbor count defining a point's core distance.
     * @param max_clusters When set, the smallest clusters are merged into their
     *        nearest neighbor (degree-space centroids) until this many remain.
     *        Runs before noise reassignment.
     * @param assign_noise_to_nearest When true, noise POIs join the cluster with the
     *        nearest centroid; otherwise they are returned in `noise`.
     *
     * No valid coordinates yields no clusters; every record is in `unlocated`.
     */
    ClusterAssignment clusterByDensity(const std::vector<PoiRecord> &records,
                                       size_t min_cluster_size = 3,
                                       size_t min_samples = 2,
                                       std::optional<size_t> max_clusters = std::nullopt,
                                       bool assign_noise_to_nearest = true);

    /// @brief Flat DBSCAN with a fixed radius; noise handling as clusterByDensity.
    ClusterAssignment clusterByDbscan(const std::vector<PoiRecord> &records,
                                      double eps_km = 2.0,
                                      size_t min_samples = 3,
                                      bool assign_noise_to_nearest = true);

    /**
     * @brief Fixed-count k-means on raw degrees, seeded so repeated runs agree.
     *
     * Asks for min(n_clusters, located POIs) clusters; every located POI is
     * assigned, so `noise` is always empty.
     */
    ClusterAssignment clusterByKMeans(const std::vector<PoiRecord> &records, size_t n_clusters = 5);

} // namespace poi

#endif // DENSITY_CLUSTERING_H
