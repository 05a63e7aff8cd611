#include "DensityClustering.h"
#include "ClusterBalancer.h"
#include "CoordinateExtractor.h"
#include "Dbscan.h"
#include "DensityClusterer.h"
#include "KMeans.h"
#include "NoiseReassigner.h"

#include <spdlog/spdlog.h>

namespace poi
{
    namespace
    {
        ClusterAssignment finish(const std::vector<PoiRecord> &records,
                                 const ExtractedCoordinates &extracted,
                                 const std::vector<int> &labels,
                                 std::optional<size_t> max_clusters,
                                 bool assign_noise_to_nearest)
        {
            IndexClusters clusters = groupByLabel(labels);
            std::vector<size_t> noise = noiseFromLabels(labels);

            if (max_clusters && clusters.size() > *max_clusters)
            {
                mergeToTarget(clusters, extracted.coords, *max_clusters);
                spdlog::info("DensityClustering: reduced to {} clusters (target: {})", clusters.size(), *max_clusters);
            }

            if (!noise.empty())
            {
                spdlog::info("DensityClustering: {} noise POIs detected", noise.size());
                if (assign_noise_to_nearest && assignNoiseToNearest(clusters, noise, extracted.coords) > 0)
                {
                    noise.clear();
                }
            }

            return materialize(records, extracted, reindexClusters(clusters), noise);
        }
    } // namespace

    ClusterAssignment clusterByDensity(const std::vector<PoiRecord> &records,
                                       size_t min_cluster_size,
                                       size_t min_samples,
                                       std::optional<size_t> max_clusters,
                                       bool assign_noise_to_nearest)
    {
        ExtractedCoordinates extracted = extractCoordinates(records);
        if (extracted.empty())
        {
            spdlog::warn("DensityClustering: no valid coordinates, returning empty clustering");
            return materialize(records, extracted, {});
        }

        DensityClusterer clusterer(min_cluster_size, min_samples);
        std::vector<int> labels = clusterer.fit(extracted.coords);
        return finish(records, extracted, labels, max_clusters, assign_noise_to_nearest);
    }

    ClusterAssignment clusterByDbscan(const std::vector<PoiRecord> &records,
                                      double eps_km,
                                      size_t min_samples,
                                      bool assign_noise_to_nearest)
    {
        ExtractedCoordinates extracted = extractCoordinates(records);
        if (extracted.empty())
        {
            spdlog::warn("DensityClustering: no valid coordinates, returning empty clustering");
            return materialize(records, extracted, {});
        }

        Dbscan dbscan(eps_km, min_samples);
        std::vector<int> labels = dbscan.fit(extracted.coords);
        return finish(records, extracted, labels, std::nullopt, assign_noise_to_nearest);
    }

    ClusterAssignment clusterByKMeans(const std::vector<PoiRecord> &records, size_t n_clusters)
    {
        ExtractedCoordinates extracted = extractCoordinates(records);
        if (extracted.empty())
        {
            spdlog::warn("DensityClustering: no valid coordinates, returning empty clustering");
            return materialize(records, extracted, {});
        }

        KMeans kmeans(n_clusters);
        std::vector<int> labels = kmeans.fit(extracted.coords);
        return materialize(records, extracted, reindexClusters(groupByLabel(labels)));
    }

} // namespace poi
