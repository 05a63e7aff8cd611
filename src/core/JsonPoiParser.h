#ifndef JSON_POI_PARSER_H
#define JSON_POI_PARSER_H

#include "PoiRecord.h"

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace poi
{
    class JsonPoiParser
    {
    public:
        // Parse a file holding {"pois": [...]} or a bare array of POI objects.
        static std::vector<PoiRecord> parseFileToVector(const std::string &path);
        static std::vector<PoiRecord> parseJsonToVector(const nlohmann::json &j);
    };
} // namespace poi

#endif // JSON_POI_PARSER_H
