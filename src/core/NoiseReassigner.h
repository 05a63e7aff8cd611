#ifndef NOISE_REASSIGNER_H
#define NOISE_REASSIGNER_H

#include "ClusterAssignment.h"
#include "GeoPoint.h"

#include <vector>

namespace poi
{
    /**
     * @brief Append every noise position to the cluster whose centroid is nearest
     * by haversine distance.
     *
     * Centroids are computed once from the clusters as given, before any noise is
     * attached. Ties go to the lowest cluster id. Nothing happens when there are
     * no clusters.
     *
     * @return Number of noise positions assigned (0 or noise.size()).
     */
    size_t assignNoiseToNearest(IndexClusters &clusters,
                                const std::vector<size_t> &noise,
                                const std::vector<GeoPoint> &coords);

} // namespace poi

#endif // NOISE_REASSIGNER_H
