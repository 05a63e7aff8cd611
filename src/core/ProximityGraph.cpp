#include "ProximityGraph.h"

#include <algorithm>
#include <queue>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace poi
{
    ProximityGraph::ProximityGraph(size_t node_count)
        : m_adjacency(node_count)
    {
    }

    void ProximityGraph::addEdge(size_t a, size_t b)
    {
        if (a >= m_adjacency.size() || b >= m_adjacency.size())
        {
            throw std::out_of_range("ProximityGraph: edge endpoint out of range");
        }
        m_adjacency[a].push_back(b);
        m_adjacency[b].push_back(a);
        ++m_edge_count;
    }

    const std::vector<size_t> &ProximityGraph::neighbors(size_t node) const
    {
        return m_adjacency.at(node);
    }

    bool ProximityGraph::hasEdge(size_t a, size_t b) const
    {
        const auto &adj = m_adjacency.at(a);
        return std::find(adj.begin(), adj.end(), b) != adj.end();
    }

    ProximityGraph buildProximityGraph(const std::vector<GeoPoint> &coords, double radius_km)
    {
        ProximityGraph graph(coords.size());
        const double radius_deg = std::max(0.0, radius_km) * DEGREES_PER_KM;

        for (size_t i = 0; i < coords.size(); ++i)
        {
            for (size_t j = i + 1; j < coords.size(); ++j)
            {
                if (degreeDistance(coords[i], coords[j]) <= radius_deg)
                {
                    graph.addEdge(i, j);
                }
            }
        }

        spdlog::debug("ProximityGraph: {} nodes, {} edges (radius={}km, {} deg)",
                      graph.nodeCount(), graph.edgeCount(), radius_km, radius_deg);
        return graph;
    }

    std::vector<int> labelConnectedComponents(const ProximityGraph &graph)
    {
        std::vector<int> labels(graph.nodeCount(), 0);
        int cluster_id = 0;

        for (size_t start = 0; start < graph.nodeCount(); ++start)
        {
            if (labels[start] != 0)
            {
                continue;
            }

            ++cluster_id;
            labels[start] = cluster_id;
            std::queue<size_t> queue;
            queue.push(start);

            while (!queue.empty())
            {
                size_t current = queue.front();
                queue.pop();
                for (size_t next : graph.neighbors(current))
                {
                    if (labels[next] != 0)
                    {
                        continue;
                    }
                    labels[next] = cluster_id;
                    queue.push(next);
                }
            }
        }
        return labels;
    }

} // namespace poi
