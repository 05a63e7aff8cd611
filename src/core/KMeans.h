#ifndef KMEANS_H
#define KMEANS_H

#include "GeoPoint.h"

#include <random>
#include <vector>

namespace poi
{
    static constexpr unsigned DEFAULT_KMEANS_SEED = 42;

    /**
     * @class KMeans
     * @brief Lloyd's k-means on raw (latitude, longitude) degrees.
     *
     * Centers are seeded with k-means++ from a fixed-seed std::mt19937, and the
     * best of n_init runs (lowest inertia) is kept, so the same input always
     * gives the same labels. Fewer distinct locations than requested clusters
     * reduce the cluster count.
     */
    class KMeans
    {
    public:
        explicit KMeans(size_t n_clusters, unsigned seed = DEFAULT_KMEANS_SEED, size_t n_init = 10, size_t max_iter = 300);

        /// @brief Label each point with 0..K-1, numbered by first appearance in the input.
        std::vector<int> fit(const std::vector<GeoPoint> &coords);

        /// @brief Centers of the last fit, indexed by label.
        const std::vector<GeoPoint> &centers() const { return m_centers; }
        double inertia() const { return m_inertia; }
        size_t iterations() const { return m_iterations; }

    private:
        struct Run
        {
            std::vector<int> labels;
            std::vector<GeoPoint> centers;
            double inertia = 0.0;
            size_t iterations = 0;
        };

        std::vector<GeoPoint> seedCenters(const std::vector<GeoPoint> &coords, size_t k, std::mt19937 &rng) const;
        Run runOnce(const std::vector<GeoPoint> &coords, size_t k, std::mt19937 &rng) const;

        size_t m_n_clusters;
        unsigned m_seed;
        size_t m_n_init;
        size_t m_max_iter;

        std::vector<GeoPoint> m_centers;
        double m_inertia = 0.0;
        size_t m_iterations = 0;
    };

} // namespace poi

#endif // KMEANS_H
