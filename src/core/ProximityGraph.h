#ifndef PROXIMITY_GRAPH_H
#define PROXIMITY_GRAPH_H

#include "GeoPoint.h"

#include <vector>

namespace poi
{

    /**
     * @class ProximityGraph
     * @brief Undirected graph over located POIs; an edge joins every pair whose
     * degree-space distance is within the radius.
     *
     * Construction compares every pair, O(N^2). Intended for itinerary-sized
     * inputs (tens to low hundreds of POIs).
     */
    class ProximityGraph
    {
    public:
        ProximityGraph() = default;
        explicit ProximityGraph(size_t node_count);

        void addEdge(size_t a, size_t b);
        const std::vector<size_t> &neighbors(size_t node) const;
        bool hasEdge(size_t a, size_t b) const;

        size_t nodeCount() const { return m_adjacency.size(); }
        size_t edgeCount() const { return m_edge_count; }

    private:
        std::vector<std::vector<size_t>> m_adjacency;
        size_t m_edge_count = 0;
    };

    /// @brief Connect all pairs with sqrt(dlat^2 + dlng^2) <= radius_km * DEGREES_PER_KM.
    ProximityGraph buildProximityGraph(const std::vector<GeoPoint> &coords, double radius_km);

    /// @brief Breadth-first connected-component labeling in node order.
    /// @return One label per node; labels start at 1 and increase as new components are found.
    std::vector<int> labelConnectedComponents(const ProximityGraph &graph);

} // namespace poi

#endif // PROXIMITY_GRAPH_H
