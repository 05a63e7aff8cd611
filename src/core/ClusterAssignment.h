#ifndef CLUSTER_ASSIGNMENT_H
#define CLUSTER_ASSIGNMENT_H

#include "CoordinateExtractor.h"
#include "PoiRecord.h"

#include <map>
#include <vector>
#include <nlohmann/json.hpp>

namespace poi
{
    /// Cluster id -> positions in an ExtractedCoordinates array.
    using IndexClusters = std::map<int, std::vector<size_t>>;

    /**
     * @class ClusterAssignment
     * @brief Result of a clustering call.
     *
     * Cluster ids are contiguous and 1-based. Records that could not be placed
     * are never dropped: density noise that was not reassigned goes to `noise`,
     * records without coordinates go to `unlocated`.
     */
    class ClusterAssignment
    {
    public:
        std::map<int, std::vector<PoiRecord>> clusters;
        std::vector<PoiRecord> noise;
        std::vector<PoiRecord> unlocated;

        size_t clusterCount() const { return clusters.size(); }
        size_t clusteredCount() const;
        size_t totalCount() const;
        bool empty() const { return clusters.empty() && noise.empty() && unlocated.empty(); }

        nlohmann::json toJson() const;
    };

    /// @brief Group positions by label in ascending position order. Negative labels are skipped.
    IndexClusters groupByLabel(const std::vector<int> &labels);

    /// @brief Positions whose label is negative, in ascending order.
    std::vector<size_t> noiseFromLabels(const std::vector<int> &labels);

    /// @brief Renumber clusters to 1..K in ascending order of their current ids.
    IndexClusters reindexClusters(const IndexClusters &clusters);

    size_t countMembers(const IndexClusters &clusters);

    /// @brief Turn index clusters back into records using the extraction mapping.
    ClusterAssignment materialize(const std::vector<PoiRecord> &records,
                                  const ExtractedCoordinates &extracted,
                                  const IndexClusters &clusters,
                                  const std::vector<size_t> &noise = {});

} // namespace poi

#endif // CLUSTER_ASSIGNMENT_H
