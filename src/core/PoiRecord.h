#ifndef POI_RECORD_H
#define POI_RECORD_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace poi
{

    /**
     * @class PoiRecord
     * @brief A point of interest as supplied by an ingestion/storage collaborator.
     *
     * The location and any additional attributes are kept as the raw JSON the
     * provider sent, so records pass through clustering unchanged.
     */
    class PoiRecord
    {
    public:
        std::string poi_id;                    ///< Identifier, may be empty before identity assignment
        std::string name;                      ///< Display name, may contain diacritics
        std::optional<std::string> dedupe_key; ///< Existing identity key, if any
        nlohmann::json location;               ///< [lng, lat], {type, coordinates} or {latitude, longitude}
        nlohmann::json attributes;             ///< Everything else, opaque to this library

        PoiRecord();
        PoiRecord(const std::string &id, const std::string &display_name, const nlohmann::json &loc);

        static PoiRecord fromJson(const nlohmann::json &j);
        nlohmann::json toJson() const;

        bool operator==(const PoiRecord &other) const;
        bool operator!=(const PoiRecord &other) const { return !(*this == other); }
    };

} // namespace poi

#endif // POI_RECORD_H
