#pragma once

#include "AlgorithmParameters.h"

#include <optional>
#include <string>
#include <spdlog/spdlog.h>

class CliParser
{
public:
    enum class Operation
    {
        Proximity,
        Density,
        Dbscan,
        KMeans,
        Center,
        DedupeKeys,
        Duplicates,
        Normalize
    };

    struct Result
    {
        bool valid = true;
        bool show_help = false;
        bool show_param_help = false;
        std::string error_message;

        std::string input_file = "pois.json";
        Operation operation = Operation::Proximity;
        std::string text; // Name for the normalize operation

        spdlog::level::level_enum log_level = spdlog::level::info;

        // --name value pairs not consumed above, with dashes mapped to underscores
        poi::AlgorithmParameters algorithm_params;
    };

    static Result parse(int argc, char *argv[]);
    static void printHelp(const std::string &exeName);
    static void printParamHelp();

    static std::optional<Operation> parseOperation(const std::string &name);
    static const char *operationName(Operation op);

private:
    static spdlog::level::level_enum parseLogLevel(const std::string &s);
};
