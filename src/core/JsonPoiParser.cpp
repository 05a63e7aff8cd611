#include "JsonPoiParser.h"

#include <fstream>
#include <stdexcept>

namespace poi
{
    std::vector<PoiRecord> JsonPoiParser::parseFileToVector(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open JSON file: " + path);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::runtime_error("Failed to parse JSON file " + path + ": " + ex.what());
        }

        return parseJsonToVector(j);
    }

    std::vector<PoiRecord> JsonPoiParser::parseJsonToVector(const nlohmann::json &j)
    {
        const nlohmann::json *arr = &j;
        if (j.is_object())
        {
            if (!j.contains("pois") || !j["pois"].is_array())
            {
                throw std::runtime_error("JSON does not contain a pois array");
            }
            arr = &j["pois"];
        }
        else if (!j.is_array())
        {
            throw std::runtime_error("JSON must be an object with a pois array or an array of POIs");
        }

        std::vector<PoiRecord> result;
        result.reserve(arr->size());
        for (const auto &item : *arr)
        {
            result.push_back(PoiRecord::fromJson(item));
        }
        return result;
    }

} // namespace poi
