#include "CliParser.h"

#include <cctype>
#include <iostream>
#include <utility>
#include <vector>

namespace
{
    const std::vector<std::pair<const char *, CliParser::Operation>> OPERATIONS = {
        {"proximity", CliParser::Operation::Proximity},
        {"density", CliParser::Operation::Density},
        {"dbscan", CliParser::Operation::Dbscan},
        {"kmeans", CliParser::Operation::KMeans},
        {"center", CliParser::Operation::Center},
        {"dedupe-keys", CliParser::Operation::DedupeKeys},
        {"duplicates", CliParser::Operation::Duplicates},
        {"normalize", CliParser::Operation::Normalize}};

    // "--radius-km" style names become "radius_km"
    std::string toParamName(const std::string &flag)
    {
        std::string name = flag;
        for (char &c : name)
        {
            if (c == '-')
            {
                c = '_';
            }
        }
        return name;
    }

    // Negative numbers are values, not flags
    bool isValueToken(const char *token)
    {
        return token[0] != '-' || std::isdigit(static_cast<unsigned char>(token[1])) || token[1] == '.';
    }
} // namespace

std::optional<CliParser::Operation> CliParser::parseOperation(const std::string &name)
{
    for (const auto &entry : OPERATIONS)
    {
        if (name == entry.first)
        {
            return entry.second;
        }
    }
    return std::nullopt;
}

const char *CliParser::operationName(Operation op)
{
    for (const auto &entry : OPERATIONS)
    {
        if (entry.second == op)
        {
            return entry.first;
        }
    }
    return "unknown";
}

CliParser::Result CliParser::parse(int argc, char *argv[])
{
    Result r;

    auto fail = [&r](const std::string &message)
    {
        r.valid = false;
        r.error_message = message;
        return r;
    };

    for (int i = 1; i < argc; i++)
    {
        const std::string a = argv[i];

        if (a == "--help" || a == "-h")
        {
            r.show_help = true;
            return r;
        }
        if (a == "--param-help")
        {
            r.show_param_help = true;
            return r;
        }

        const bool takes_value = a == "--input" || a == "-i" || a == "--operation" || a == "-o" ||
                                 a == "--text" || a == "-t" || a == "--log-level" || a == "-l";
        if (takes_value)
        {
            if (i + 1 >= argc)
            {
                return fail("Missing value for " + a);
            }
            const std::string value = argv[++i];

            if (a == "--input" || a == "-i")
            {
                r.input_file = value;
            }
            else if (a == "--operation" || a == "-o")
            {
                auto op = parseOperation(value);
                if (!op)
                {
                    return fail("Unknown operation: " + value);
                }
                r.operation = *op;
            }
            else if (a == "--text" || a == "-t")
            {
                r.text = value;
            }
            else
            {
                r.log_level = parseLogLevel(value);
            }
            continue;
        }

        if (a.rfind("--", 0) != 0 || a.size() == 2)
        {
            return fail("Unknown argument: " + a);
        }

        // Anything else is a clustering or dedupe parameter
        std::string flag = a.substr(2);
        std::string value = "true";
        auto eq_pos = flag.find('=');
        if (eq_pos != std::string::npos)
        {
            value = flag.substr(eq_pos + 1);
            flag = flag.substr(0, eq_pos);
        }
        else if (i + 1 < argc && isValueToken(argv[i + 1]))
        {
            value = argv[++i];
        }

        const std::string name = toParamName(flag);
        try
        {
            r.algorithm_params.setFromString(name, value);
        }
        catch (const std::invalid_argument &e)
        {
            return fail("Invalid value for --" + flag + " (" + name + "): " + e.what());
        }
    }

    return r;
}

void CliParser::printHelp(const std::string &exeName)
{
    std::cout << "Usage: " << exeName << " [options] [--param-name value ...]\n"
              << "\n"
              << "Clusters points of interest and assigns stable identity keys.\n"
              << "Results are printed to stdout as JSON, logs go to logs/poi-cluster_YYYYMMDD.log.\n"
              << "\n"
              << "Options:\n"
              << "  --input, -i FILE             POI JSON file ({\"pois\": [...]} or an array)\n"
              << "  --operation, -o OP           One of:\n"
              << "                                 proximity    connected components within a radius\n"
              << "                                 density      hierarchical density clustering\n"
              << "                                 dbscan       fixed-radius density clustering\n"
              << "                                 kmeans       fixed number of clusters\n"
              << "                                 center       mean location of all POIs\n"
              << "                                 dedupe-keys  fill dedupe_key and poi_id\n"
              << "                                 duplicates   collapse records of the same place\n"
              << "                                 normalize    normalize --text\n"
              << "  --text, -t TEXT              Name to normalize\n"
              << "  --log-level, -l LEVEL        trace/debug/info/warn/error/critical/off\n"
              << "  --param-help                 Show algorithm parameter help\n"
              << "  --help, -h                   Show this help message\n"
              << std::endl;
}

void CliParser::printParamHelp()
{
    std::cout << "Algorithm Parameters (--name=value or --name value):\n"
              << "\n"
              << "proximity:\n"
              << "  --radius-km FLOAT            Linking radius in kilometers (default: 2.0)\n"
              << "  --target-clusters INT        Merge down to this many clusters (default: unset)\n"
              << "\n"
              << "density / dbscan:\n"
              << "  --min-cluster-size INT       Smallest cluster, density only (default: 3)\n"
              << "  --min-samples INT            Neighbors for a core point (default: 2, dbscan 3)\n"
              << "  --max-clusters INT           Merge down to this many clusters, density only\n"
              << "  --assign-noise-to-nearest BOOL  Attach outliers to nearest cluster (default: true)\n"
              << "  --eps-km FLOAT               Neighborhood radius, dbscan only (default: 2.0)\n"
              << "\n"
              << "kmeans:\n"
              << "  --n-clusters INT             Number of clusters (default: --max-clusters, else 5)\n"
              << "\n"
              << "dedupe-keys / duplicates:\n"
              << "  --precision INT              Geohash precision 1-12 (default: 7, ~150 m)\n"
              << "  --distance-threshold-m FLOAT Fuzzy match distance in meters (default: 150)\n"
              << "  --min-name-similarity FLOAT  Fuzzy name similarity 0-1 (default: 1.0)\n"
              << std::endl;
}

spdlog::level::level_enum CliParser::parseLogLevel(const std::string &s)
{
    std::string lvl = s;
    for (char &c : lvl)
        c = char(std::tolower(static_cast<unsigned char>(c)));

    if (lvl == "trace")
        return spdlog::level::trace;
    if (lvl == "debug")
        return spdlog::level::debug;
    if (lvl == "warn" || lvl == "warning")
        return spdlog::level::warn;
    if (lvl == "err" || lvl == "error")
        return spdlog::level::err;
    if (lvl == "critical")
        return spdlog::level::critical;
    if (lvl == "off")
        return spdlog::level::off;

    return spdlog::level::info;
}
