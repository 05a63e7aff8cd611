#include "core/CliParser.h"
#include "core/DedupeKey.h"
#include "core/DensityClustering.h"
#include "core/DuplicateMatcher.h"
#include "core/GeoCenter.h"
#include "core/JsonPoiParser.h"
#include "core/NameNormalizer.h"
#include "core/ProximityClustering.h"

#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#define LOG_FILE_PATH "logs"

namespace
{
    const std::set<std::string> KNOWN_PARAMS = {
        "radius_km", "target_clusters", "min_cluster_size", "min_samples", "max_clusters",
        "assign_noise_to_nearest", "eps_km", "n_clusters", "precision", "distance_threshold_m", "min_name_similarity"};

    void warnUnknownParams(const poi::AlgorithmParameters &params)
    {
        for (const auto &name : params.names())
        {
            if (KNOWN_PARAMS.find(name) == KNOWN_PARAMS.end())
            {
                spdlog::warn("Ignoring unknown parameter '{}'", name);
            }
        }
    }

    void setupFileLogging(spdlog::level::level_enum level)
    {
        std::filesystem::path logs_dir(LOG_FILE_PATH);
        if (!std::filesystem::exists(logs_dir))
        {
            std::filesystem::create_directories(logs_dir);
        }

        auto now = std::chrono::system_clock::now();
        std::time_t ts = std::chrono::system_clock::to_time_t(now);
        std::tm tmnow;
#ifdef _WIN32
        localtime_s(&tmnow, &ts);
#else
        localtime_r(&ts, &tmnow);
#endif

        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y%m%d", &tmnow);

        std::string filename = std::string("poi-cluster_") + buf + ".log";
        std::filesystem::path filepath = logs_dir / filename;

        auto file_logger = spdlog::basic_logger_mt("file_logger", filepath.string());
        spdlog::set_default_logger(file_logger);
        spdlog::set_level(level);

        spdlog::info("Logging initialized");
    }

    nlohmann::json normalizeText(const std::string &text)
    {
        nlohmann::json out;
        out["input"] = text;
        out["normalized"] = poi::normalizeName(text);
        out["compact"] = poi::compactName(text);
        return out;
    }

    nlohmann::json centerOf(const std::vector<poi::PoiRecord> &records)
    {
        poi::GeoPoint center = poi::clusterCenter(records);
        nlohmann::json out;
        out["latitude"] = center.latitude;
        out["longitude"] = center.longitude;
        return out;
    }

    nlohmann::json withIdentity(std::vector<poi::PoiRecord> records, int precision)
    {
        nlohmann::json out;
        out["pois"] = nlohmann::json::array();
        size_t unkeyed = 0;
        for (auto &record : records)
        {
            if (!poi::assignIdentity(record, precision))
            {
                ++unkeyed;
            }
            out["pois"].push_back(record.toJson());
        }
        out["unkeyed"] = unkeyed;
        if (unkeyed > 0)
        {
            spdlog::warn("{} POIs have no location and no stored key", unkeyed);
        }
        return out;
    }

    nlohmann::json collapsed(const poi::DedupeResult &result)
    {
        nlohmann::json out;
        out["pois"] = nlohmann::json::array();
        for (size_t i = 0; i < result.canonical.size(); ++i)
        {
            nlohmann::json entry = result.canonical[i].toJson();
            entry["duplicates"] = nlohmann::json::array();
            auto it = result.duplicates.find(i);
            if (it != result.duplicates.end())
            {
                for (const auto &dup : it->second)
                {
                    entry["duplicates"].push_back(dup.toJson());
                }
            }
            out["pois"].push_back(entry);
        }
        return out;
    }

    nlohmann::json runOperation(const CliParser::Result &cli)
    {
        const auto &params = cli.algorithm_params;

        if (cli.operation == CliParser::Operation::Normalize)
        {
            return normalizeText(cli.text);
        }

        std::vector<poi::PoiRecord> records = poi::JsonPoiParser::parseFileToVector(cli.input_file);
        spdlog::info("Loaded {} POIs from {}", records.size(), cli.input_file);

        switch (cli.operation)
        {
        case CliParser::Operation::Proximity:
            return poi::clusterByProximity(records,
                                           params.getOr<double>("radius_km", 2.0),
                                           params.getCount("target_clusters"))
                .toJson();
        case CliParser::Operation::Density:
            return poi::clusterByDensity(records,
                                         params.getCountOr("min_cluster_size", 3),
                                         params.getCountOr("min_samples", 2),
                                         params.getCount("max_clusters"),
                                         params.getOr<bool>("assign_noise_to_nearest", true))
                .toJson();
        case CliParser::Operation::Dbscan:
            return poi::clusterByDbscan(records,
                                        params.getOr<double>("eps_km", 2.0),
                                        params.getCountOr("min_samples", 3),
                                        params.getOr<bool>("assign_noise_to_nearest", true))
                .toJson();
        case CliParser::Operation::KMeans:
            return poi::clusterByKMeans(records,
                                        params.getCountOr("n_clusters", params.getCountOr("max_clusters", 5)))
                .toJson();
        case CliParser::Operation::Center:
            return centerOf(records);
        case CliParser::Operation::DedupeKeys:
            return withIdentity(std::move(records), params.getOr<int>("precision", poi::DEFAULT_DEDUPE_PRECISION));
        case CliParser::Operation::Duplicates:
            return collapsed(poi::DuplicateMatcher(params).collapse(records));
        case CliParser::Operation::Normalize:
            break;
        }
        throw std::logic_error(std::string("Unhandled operation ") + CliParser::operationName(cli.operation));
    }
} // namespace

int main(int argc, char *argv[])
{
    CliParser::Result cli = CliParser::parse(argc, argv);
    if (!cli.valid)
    {
        std::cout << "Error: " << cli.error_message << std::endl;
        return 1;
    }

    if (cli.show_help)
    {
        CliParser::printHelp(argv[0]);
        return 0;
    }
    if (cli.show_param_help)
    {
        CliParser::printParamHelp();
        return 0;
    }

    try
    {
        setupFileLogging(cli.log_level);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Logging init failed: " << ex.what() << std::endl;
    }

    spdlog::info("CLI config: input={}, operation={}, params={}",
                 cli.input_file, CliParser::operationName(cli.operation), cli.algorithm_params.size());
    warnUnknownParams(cli.algorithm_params);

    try
    {
        nlohmann::json result = runOperation(cli);
        std::cout << result.dump(2) << std::endl;
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Operation {} failed: {}", CliParser::operationName(cli.operation), ex.what());
        std::cout << "Error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
