#include "ClusterAssignment.h"

#include <string>

namespace poi
{
    size_t ClusterAssignment::clusteredCount() const
    {
        size_t total = 0;
        for (const auto &entry : clusters)
        {
            total += entry.second.size();
        }
        return total;
    }

    size_t ClusterAssignment::totalCount() const
    {
        return clusteredCount() + noise.size() + unlocated.size();
    }

    nlohmann::json ClusterAssignment::toJson() const
    {
        nlohmann::json j;
        j["clusters"] = nlohmann::json::object();
        for (const auto &entry : clusters)
        {
            nlohmann::json members = nlohmann::json::array();
            for (const auto &record : entry.second)
            {
                members.push_back(record.toJson());
            }
            j["clusters"][std::to_string(entry.first)] = members;
        }

        j["noise"] = nlohmann::json::array();
        for (const auto &record : noise)
        {
            j["noise"].push_back(record.toJson());
        }
        j["unlocated"] = nlohmann::json::array();
        for (const auto &record : unlocated)
        {
            j["unlocated"].push_back(record.toJson());
        }
        return j;
    }

    IndexClusters groupByLabel(const std::vector<int> &labels)
    {
        IndexClusters clusters;
        for (size_t i = 0; i < labels.size(); ++i)
        {
            if (labels[i] < 0)
            {
                continue;
            }
            clusters[labels[i]].push_back(i);
        }
        return clusters;
    }

    std::vector<size_t> noiseFromLabels(const std::vector<int> &labels)
    {
        std::vector<size_t> noise;
        for (size_t i = 0; i < labels.size(); ++i)
        {
            if (labels[i] < 0)
            {
                noise.push_back(i);
            }
        }
        return noise;
    }

    IndexClusters reindexClusters(const IndexClusters &clusters)
    {
        // std::map iterates in ascending id order
        IndexClusters reindexed;
        int next_id = 1;
        for (const auto &entry : clusters)
        {
            reindexed.emplace(next_id++, entry.second);
        }
        return reindexed;
    }

    size_t countMembers(const IndexClusters &clusters)
    {
        size_t total = 0;
        for (const auto &entry : clusters)
        {
            total += entry.second.size();
        }
        return total;
    }

    ClusterAssignment materialize(const std::vector<PoiRecord> &records,
                                  const ExtractedCoordinates &extracted,
                                  const IndexClusters &clusters,
                                  const std::vector<size_t> &noise)
    {
        ClusterAssignment result;
        for (const auto &entry : clusters)
        {
            auto &members = result.clusters[entry.first];
            members.reserve(entry.second.size());
            for (size_t pos : entry.second)
            {
                members.push_back(records[extracted.indices[pos]]);
            }
        }

        for (size_t pos : noise)
        {
            result.noise.push_back(records[extracted.indices[pos]]);
        }
        for (size_t idx : extracted.excluded)
        {
            result.unlocated.push_back(records[idx]);
        }
        return result;
    }

} // namespace poi
