#ifndef DENSITY_CLUSTERER_H
#define DENSITY_CLUSTERER_H

#include "GeoPoint.h"

#include <map>
#include <vector>

namespace poi
{
    static constexpr int NOISE_LABEL = -1;

    /**
     * @brief One row of the condensed cluster tree.
     * Ids below the point count are points, the rest are clusters (root == point count).
     */
    struct CondensedEdge
    {
        int parent;
        int child;
        double lambda;     ///< 1 / distance at which child left parent
        size_t child_size; ///< 1 for points
    };

    /**
     * @class DensityClusterer
     * @brief HDBSCAN over great-circle distance with excess-of-mass selection.
     *
     * Core distance is the haversine distance to the min_samples-th nearest
     * point (the point itself counts as the first). Pairwise work is O(N^2).
     * The root takes part in selection, so a group that splits into short-lived
     * halves stays one cluster and a non-empty input always produces at least one.
     */
    class DensityClusterer
    {
    public:
        DensityClusterer(size_t min_cluster_size, size_t min_samples);

        /// @brief Label each point with 0..K-1, or NOISE_LABEL.
        std::vector<int> fit(const std::vector<GeoPoint> &coords);

        size_t clusterCount() const { return m_cluster_count; }
        size_t noiseCount() const;
        bool singleClusterFallback() const { return m_root_selected; }

        const std::vector<double> &coreDistances() const { return m_core_distances; }
        const std::vector<CondensedEdge> &condensedTree() const { return m_condensed; }
        const std::map<int, double> &stability() const { return m_stability; }

    private:
        struct MergeRow
        {
            int left;
            int right;
            double distance;
            size_t size;
        };

        void computeCoreDistances(const std::vector<double> &dist, size_t n);
        std::vector<MergeRow> buildSingleLinkage(const std::vector<double> &dist, size_t n) const;
        void condenseTree(const std::vector<MergeRow> &hierarchy, size_t n);
        void computeStability();
        std::vector<int> selectClusters();
        std::vector<int> labelPoints(const std::vector<int> &selected, size_t n) const;

        size_t m_min_cluster_size;
        size_t m_min_samples;

        std::vector<double> m_core_distances;
        std::vector<CondensedEdge> m_condensed;
        std::map<int, double> m_stability;
        std::vector<int> m_labels;
        int m_root = 0;
        bool m_root_selected = false;
        size_t m_cluster_count = 0;
    };

} // namespace poi

#endif // DENSITY_CLUSTERER_H
