#include "Dbscan.h"
#include "DensityClusterer.h"

#include <algorithm>
#include <deque>
#include <spdlog/spdlog.h>

namespace poi
{
    Dbscan::Dbscan(double eps_km, size_t min_samples)
        : m_eps_km(std::max(0.0, eps_km))
        , m_min_samples(std::max<size_t>(1, min_samples))
    {
    }

    std::vector<size_t> Dbscan::regionQuery(const std::vector<GeoPoint> &coords, size_t idx) const
    {
        std::vector<size_t> neighbors;
        for (size_t j = 0; j < coords.size(); ++j)
        {
            if (haversineKm(coords[idx], coords[j]) <= m_eps_km)
            {
                neighbors.push_back(j);
            }
        }
        return neighbors;
    }

    std::vector<int> Dbscan::fit(const std::vector<GeoPoint> &coords)
    {
        const size_t n = coords.size();
        m_types.assign(n, PointType::Unvisited);
        std::vector<int> labels(n, NOISE_LABEL);
        int cluster_id = 0;

        for (size_t i = 0; i < n; ++i)
        {
            if (m_types[i] != PointType::Unvisited)
            {
                continue;
            }

            std::vector<size_t> neighbors = regionQuery(coords, i);
            if (neighbors.size() < m_min_samples)
            {
                // May still become a border point of a later cluster
                m_types[i] = PointType::Noise;
                continue;
            }

            m_types[i] = PointType::Core;
            labels[i] = cluster_id;
            std::deque<size_t> queue(neighbors.begin(), neighbors.end());

            while (!queue.empty())
            {
                size_t p = queue.front();
                queue.pop_front();

                if (m_types[p] == PointType::Noise)
                {
                    m_types[p] = PointType::Border;
                    labels[p] = cluster_id;
                    continue;
                }
                if (m_types[p] != PointType::Unvisited)
                {
                    continue;
                }

                labels[p] = cluster_id;
                std::vector<size_t> expansion = regionQuery(coords, p);
                if (expansion.size() >= m_min_samples)
                {
                    m_types[p] = PointType::Core;
                    for (size_t q : expansion)
                    {
                        if (m_types[q] == PointType::Unvisited || m_types[q] == PointType::Noise)
                        {
                            queue.push_back(q);
                        }
                    }
                }
                else
                {
                    m_types[p] = PointType::Border;
                }
            }
            ++cluster_id;
        }

        spdlog::info("Dbscan: found {} clusters from {} POIs (noise: {}, eps={}km, min_samples={})",
                     cluster_id, n, std::count(labels.begin(), labels.end(), NOISE_LABEL), m_eps_km, m_min_samples);
        return labels;
    }

} // namespace poi
