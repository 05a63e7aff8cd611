#include "KMeans.h"

#include <algorithm>
#include <limits>
#include <utility>
#include <spdlog/spdlog.h>

namespace poi
{
    namespace
    {
        double squaredDegreeDistance(const GeoPoint &a, const GeoPoint &b)
        {
            double dlat = a.latitude - b.latitude;
            double dlng = a.longitude - b.longitude;
            return dlat * dlat + dlng * dlng;
        }

        size_t nearestCenter(const GeoPoint &point, const std::vector<GeoPoint> &centers)
        {
            size_t best = 0;
            double best_distance = std::numeric_limits<double>::infinity();
            for (size_t c = 0; c < centers.size(); ++c)
            {
                double d = squaredDegreeDistance(point, centers[c]);
                if (d < best_distance)
                {
                    best_distance = d;
                    best = c;
                }
            }
            return best;
        }
    } // namespace

    KMeans::KMeans(size_t n_clusters, unsigned seed, size_t n_init, size_t max_iter)
        : m_n_clusters(std::max<size_t>(1, n_clusters))
        , m_seed(seed)
        , m_n_init(std::max<size_t>(1, n_init))
        , m_max_iter(std::max<size_t>(1, max_iter))
    {
    }

    std::vector<GeoPoint> KMeans::seedCenters(const std::vector<GeoPoint> &coords, size_t k, std::mt19937 &rng) const
    {
        const size_t n = coords.size();
        std::uniform_int_distribution<size_t> first(0, n - 1);

        std::vector<GeoPoint> centers;
        centers.push_back(coords[first(rng)]);

        std::vector<double> closest(n);
        for (size_t p = 0; p < n; ++p)
        {
            closest[p] = squaredDegreeDistance(coords[p], centers.front());
        }

        // k-means++: next center drawn with probability proportional to squared distance
        while (centers.size() < k)
        {
            double total = 0.0;
            for (double d : closest)
            {
                total += d;
            }
            if (total <= 0.0)
            {
                spdlog::debug("KMeans: only {} distinct locations, using {} clusters instead of {}",
                              centers.size(), centers.size(), k);
                break;
            }

            std::uniform_real_distribution<double> draw(0.0, total);
            const double target = draw(rng);

            size_t chosen = n;
            double cumulative = 0.0;
            for (size_t p = 0; p < n; ++p)
            {
                if (closest[p] <= 0.0)
                {
                    continue;
                }
                chosen = p;
                cumulative += closest[p];
                if (cumulative >= target)
                {
                    break;
                }
            }

            centers.push_back(coords[chosen]);
            for (size_t p = 0; p < n; ++p)
            {
                closest[p] = std::min(closest[p], squaredDegreeDistance(coords[p], centers.back()));
            }
        }
        return centers;
    }

    KMeans::Run KMeans::runOnce(const std::vector<GeoPoint> &coords, size_t k, std::mt19937 &rng) const
    {
        const size_t n = coords.size();
        Run run;
        run.centers = seedCenters(coords, k, rng);
        run.labels.assign(n, -1); // Unassigned, so the first pass always counts as a change

        const size_t centers = run.centers.size();
        while (run.iterations < m_max_iter)
        {
            ++run.iterations;

            bool changed = false;
            for (size_t p = 0; p < n; ++p)
            {
                int label = static_cast<int>(nearestCenter(coords[p], run.centers));
                if (label != run.labels[p])
                {
                    run.labels[p] = label;
                    changed = true;
                }
            }
            if (!changed)
            {
                break;
            }

            std::vector<double> lat_sum(centers, 0.0);
            std::vector<double> lng_sum(centers, 0.0);
            std::vector<size_t> counts(centers, 0);
            for (size_t p = 0; p < n; ++p)
            {
                size_t c = static_cast<size_t>(run.labels[p]);
                lat_sum[c] += coords[p].latitude;
                lng_sum[c] += coords[p].longitude;
                ++counts[c];
            }

            // An emptied cluster keeps its previous center
            for (size_t c = 0; c < centers; ++c)
            {
                if (counts[c] > 0)
                {
                    run.centers[c] = GeoPoint(lat_sum[c] / static_cast<double>(counts[c]),
                                              lng_sum[c] / static_cast<double>(counts[c]));
                }
            }
        }

        for (size_t p = 0; p < n; ++p)
        {
            run.inertia += squaredDegreeDistance(coords[p], run.centers[static_cast<size_t>(run.labels[p])]);
        }
        return run;
    }

    std::vector<int> KMeans::fit(const std::vector<GeoPoint> &coords)
    {
        m_centers.clear();
        m_inertia = 0.0;
        m_iterations = 0;

        const size_t n = coords.size();
        if (n == 0)
        {
            return {};
        }

        const size_t k = std::min(m_n_clusters, n);
        if (k < m_n_clusters)
        {
            spdlog::debug("KMeans: {} clusters requested for {} POIs, using {}", m_n_clusters, n, k);
        }

        std::mt19937 rng(m_seed);
        Run best;
        for (size_t attempt = 0; attempt < m_n_init; ++attempt)
        {
            Run run = runOnce(coords, k, rng);
            if (attempt == 0 || run.inertia < best.inertia)
            {
                best = std::move(run);
            }
        }

        // Number clusters by first appearance so ids do not depend on the seeding order
        std::vector<int> remap(best.centers.size(), -1);
        int next_label = 0;
        std::vector<int> labels(n);
        for (size_t p = 0; p < n; ++p)
        {
            int &mapped = remap[static_cast<size_t>(best.labels[p])];
            if (mapped < 0)
            {
                mapped = next_label++;
                m_centers.push_back(best.centers[static_cast<size_t>(best.labels[p])]);
            }
            labels[p] = mapped;
        }

        m_inertia = best.inertia;
        m_iterations = best.iterations;

        spdlog::info("KMeans: {} clusters from {} POIs (requested: {}, inertia={:.8f}, iterations={})",
                     m_centers.size(), n, m_n_clusters, m_inertia, m_iterations);
        return labels;
    }

} // namespace poi
