#include "DensityClusterer.h"

#include <algorithm>
#include <limits>
#include <set>
#include <spdlog/spdlog.h>

namespace
{
    // Coincident POIs would give an infinite lambda
    static constexpr double MIN_DISTANCE_KM = 1e-9;

    std::vector<double> pairwiseHaversine(const std::vector<poi::GeoPoint> &coords)
    {
        const size_t n = coords.size();
        std::vector<double> dist(n * n, 0.0);
        for (size_t i = 0; i < n; ++i)
        {
            for (size_t j = i + 1; j < n; ++j)
            {
                double d = poi::haversineKm(coords[i], coords[j]);
                dist[i * n + j] = d;
                dist[j * n + i] = d;
            }
        }
        return dist;
    }

    class LinkageUnionFind
    {
    public:
        explicit LinkageUnionFind(size_t size) : m_parent(size)
        {
            for (size_t i = 0; i < size; ++i)
            {
                m_parent[i] = static_cast<int>(i);
            }
        }

        int find(int x)
        {
            int root = x;
            while (m_parent[root] != root)
            {
                root = m_parent[root];
            }
            while (m_parent[x] != root)
            {
                int next = m_parent[x];
                m_parent[x] = root;
                x = next;
            }
            return root;
        }

        void attach(int child, int parent)
        {
            m_parent[child] = parent;
        }

    private:
        std::vector<int> m_parent;
    };
} // namespace

namespace poi
{
    DensityClusterer::DensityClusterer(size_t min_cluster_size, size_t min_samples)
        : m_min_cluster_size(std::max<size_t>(2, min_cluster_size))
        , m_min_samples(std::max<size_t>(1, min_samples))
    {
    }

    size_t DensityClusterer::noiseCount() const
    {
        return static_cast<size_t>(std::count(m_labels.begin(), m_labels.end(), NOISE_LABEL));
    }

    std::vector<int> DensityClusterer::fit(const std::vector<GeoPoint> &coords)
    {
        m_core_distances.clear();
        m_condensed.clear();
        m_stability.clear();
        m_labels.clear();
        m_root_selected = false;
        m_cluster_count = 0;

        const size_t n = coords.size();
        m_root = static_cast<int>(n);
        if (n == 0)
        {
            return m_labels;
        }
        if (n == 1)
        {
            m_core_distances.assign(1, 0.0);
            m_root_selected = true;
            m_cluster_count = 1;
            m_labels.assign(1, 0);
            return m_labels;
        }

        std::vector<double> dist = pairwiseHaversine(coords);
        computeCoreDistances(dist, n);
        std::vector<MergeRow> hierarchy = buildSingleLinkage(dist, n);
        condenseTree(hierarchy, n);
        computeStability();
        std::vector<int> selected = selectClusters();
        m_labels = labelPoints(selected, n);
        m_cluster_count = selected.size();

        spdlog::info("DensityClusterer: found {} clusters from {} POIs (noise: {}, min_cluster_size={}, min_samples={}{})",
                     m_cluster_count, n, noiseCount(), m_min_cluster_size, m_min_samples,
                     m_root_selected ? ", root cluster selected" : "");
        return m_labels;
    }

    void DensityClusterer::computeCoreDistances(const std::vector<double> &dist, size_t n)
    {
        const size_t k = std::min(m_min_samples, n);
        if (k < m_min_samples)
        {
            spdlog::debug("DensityClusterer: min_samples {} exceeds point count, using {}", m_min_samples, k);
        }

        m_core_distances.assign(n, 0.0);
        std::vector<double> row(n);
        for (size_t i = 0; i < n; ++i)
        {
            std::copy(dist.begin() + static_cast<std::ptrdiff_t>(i * n),
                      dist.begin() + static_cast<std::ptrdiff_t>((i + 1) * n), row.begin());
            // Row includes the zero self-distance
            std::nth_element(row.begin(), row.begin() + static_cast<std::ptrdiff_t>(k - 1), row.end());
            m_core_distances[i] = row[k - 1];
        }
    }

    std::vector<DensityClusterer::MergeRow> DensityClusterer::buildSingleLinkage(const std::vector<double> &dist, size_t n) const
    {
        struct MstEdge
        {
            int a;
            int b;
            double weight;
        };

        // Prim's algorithm over mutual reachability distance
        std::vector<bool> in_tree(n, false);
        std::vector<double> best(n, std::numeric_limits<double>::infinity());
        std::vector<int> from(n, -1);
        std::vector<MstEdge> edges;
        edges.reserve(n - 1);

        size_t current = 0;
        in_tree[current] = true;
        for (size_t step = 1; step < n; ++step)
        {
            size_t next = n;
            for (size_t j = 0; j < n; ++j)
            {
                if (in_tree[j])
                {
                    continue;
                }
                double reach = std::max({m_core_distances[current], m_core_distances[j], dist[current * n + j]});
                if (reach < best[j])
                {
                    best[j] = reach;
                    from[j] = static_cast<int>(current);
                }
                if (next == n || best[j] < best[next])
                {
                    next = j;
                }
            }
            edges.push_back({from[next], static_cast<int>(next), best[next]});
            in_tree[next] = true;
            current = next;
        }

        std::stable_sort(edges.begin(), edges.end(), [](const MstEdge &x, const MstEdge &y)
                         { return x.weight < y.weight; });

        LinkageUnionFind uf(2 * n - 1);
        std::vector<size_t> sizes(2 * n - 1, 1);
        std::vector<MergeRow> hierarchy;
        hierarchy.reserve(n - 1);

        for (size_t k = 0; k < edges.size(); ++k)
        {
            int ra = uf.find(edges[k].a);
            int rb = uf.find(edges[k].b);
            int node = static_cast<int>(n + k);
            uf.attach(ra, node);
            uf.attach(rb, node);
            sizes[node] = sizes[ra] + sizes[rb];
            hierarchy.push_back({ra, rb, std::max(edges[k].weight, MIN_DISTANCE_KM), sizes[node]});
        }
        return hierarchy;
    }

    void DensityClusterer::condenseTree(const std::vector<MergeRow> &hierarchy, size_t n)
    {
        const int n_points = static_cast<int>(n);
        const int root_node = 2 * n_points - 2;

        auto nodeSize = [&](int node) -> size_t
        {
            return node < n_points ? 1 : hierarchy[node - n_points].size;
        };

        // Breadth-first list of hierarchy nodes under (and including) `start`
        auto subtree = [&](int start)
        {
            std::vector<int> order{start};
            for (size_t i = 0; i < order.size(); ++i)
            {
                int node = order[i];
                if (node >= n_points)
                {
                    order.push_back(hierarchy[node - n_points].left);
                    order.push_back(hierarchy[node - n_points].right);
                }
            }
            return order;
        };

        std::vector<int> relabel(2 * n - 1, -1);
        std::vector<bool> ignore(2 * n - 1, false);
        relabel[root_node] = m_root;
        int next_label = m_root + 1;

        auto dropPoints = [&](int parent_label, int start, double lambda)
        {
            for (int sub : subtree(start))
            {
                if (sub < n_points)
                {
                    m_condensed.push_back({parent_label, sub, lambda, 1});
                }
                ignore[sub] = true;
            }
        };

        for (int node : subtree(root_node))
        {
            if (ignore[node] || node < n_points)
            {
                continue;
            }

            const MergeRow &row = hierarchy[node - n_points];
            const double lambda = 1.0 / row.distance;
            const size_t left_count = nodeSize(row.left);
            const size_t right_count = nodeSize(row.right);
            const int label = relabel[node];

            if (left_count >= m_min_cluster_size && right_count >= m_min_cluster_size)
            {
                relabel[row.left] = next_label++;
                m_condensed.push_back({label, relabel[row.left], lambda, left_count});
                relabel[row.right] = next_label++;
                m_condensed.push_back({label, relabel[row.right], lambda, right_count});
            }
            else if (left_count < m_min_cluster_size && right_count < m_min_cluster_size)
            {
                dropPoints(label, row.left, lambda);
                dropPoints(label, row.right, lambda);
            }
            else if (left_count < m_min_cluster_size)
            {
                relabel[row.right] = label;
                dropPoints(label, row.left, lambda);
            }
            else
            {
                relabel[row.left] = label;
                dropPoints(label, row.right, lambda);
            }
        }
    }

    void DensityClusterer::computeStability()
    {
        std::map<int, double> births;
        births[m_root] = 0.0;
        m_stability[m_root] = 0.0;
        for (const auto &edge : m_condensed)
        {
            if (edge.child >= m_root)
            {
                births[edge.child] = edge.lambda;
                m_stability[edge.child] = 0.0;
            }
        }

        for (const auto &edge : m_condensed)
        {
            m_stability[edge.parent] += (edge.lambda - births[edge.parent]) * static_cast<double>(edge.child_size);
        }
    }

    std::vector<int> DensityClusterer::selectClusters()
    {
        std::map<int, std::vector<int>> children;
        for (const auto &edge : m_condensed)
        {
            if (edge.child_size > 1)
            {
                children[edge.parent].push_back(edge.child);
            }
        }

        // The root competes like any other cluster, so children only replace it
        // when their combined persistence beats it
        std::map<int, double> stability = m_stability;
        std::map<int, bool> is_cluster;
        for (const auto &entry : stability)
        {
            is_cluster[entry.first] = true;
        }

        // Children always carry larger ids than their parent
        for (auto it = is_cluster.rbegin(); it != is_cluster.rend(); ++it)
        {
            const int node = it->first;
            double subtree_stability = 0.0;
            for (int child : children[node])
            {
                subtree_stability += stability[child];
            }

            if (subtree_stability > stability[node])
            {
                is_cluster[node] = false;
                stability[node] = subtree_stability;
            }
            else
            {
                std::vector<int> stack(children[node].begin(), children[node].end());
                while (!stack.empty())
                {
                    int sub = stack.back();
                    stack.pop_back();
                    is_cluster[sub] = false;
                    for (int grandchild : children[sub])
                    {
                        stack.push_back(grandchild);
                    }
                }
            }
        }

        std::vector<int> selected;
        for (const auto &entry : is_cluster)
        {
            if (entry.second)
            {
                selected.push_back(entry.first);
            }
        }

        m_root_selected = selected.size() == 1 && selected.front() == m_root;
        return selected;
    }

    std::vector<int> DensityClusterer::labelPoints(const std::vector<int> &selected, size_t n) const
    {
        int max_id = m_root;
        for (const auto &edge : m_condensed)
        {
            max_id = std::max(max_id, edge.child);
        }

        std::vector<int> parent_of(static_cast<size_t>(max_id) + 1, -1);
        std::vector<double> point_lambda(n, 0.0);
        double root_max_lambda = 0.0;
        for (const auto &edge : m_condensed)
        {
            parent_of[edge.child] = edge.parent;
            if (edge.child < m_root)
            {
                point_lambda[edge.child] = edge.lambda;
            }
            if (edge.parent == m_root)
            {
                root_max_lambda = std::max(root_max_lambda, edge.lambda);
            }
        }

        std::map<int, int> label_of;
        for (size_t i = 0; i < selected.size(); ++i)
        {
            label_of[selected[i]] = static_cast<int>(i);
        }

        std::vector<int> labels(n, NOISE_LABEL);
        for (size_t p = 0; p < n; ++p)
        {
            int cluster = parent_of[p];
            while (cluster != m_root && cluster >= 0 && label_of.find(cluster) == label_of.end())
            {
                cluster = parent_of[cluster];
            }

            if (cluster >= 0 && cluster != m_root)
            {
                labels[p] = label_of[cluster];
            }
            else if (m_root_selected && point_lambda[p] >= root_max_lambda)
            {
                // Only the points that stay in the root longest belong to it
                labels[p] = 0;
            }
        }
        return labels;
    }

} // namespace poi
