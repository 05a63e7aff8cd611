#include "PoiRecord.h"

namespace poi
{
    namespace
    {
        std::string stringField(const nlohmann::json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
            {
                return "";
            }
            return it->get<std::string>();
        }
    } // namespace

    PoiRecord::PoiRecord()
        : poi_id()
        , name()
        , dedupe_key()
        , location(nullptr)
        , attributes(nlohmann::json::object())
    {
    }

    PoiRecord::PoiRecord(const std::string &id, const std::string &display_name, const nlohmann::json &loc)
        : poi_id(id)
        , name(display_name)
        , dedupe_key()
        , location(loc)
        , attributes(nlohmann::json::object())
    {
    }

    PoiRecord PoiRecord::fromJson(const nlohmann::json &j)
    {
        PoiRecord record;
        if (!j.is_object())
        {
            // Keep the value so it is handed back unchanged
            record.attributes = j;
            return record;
        }

        record.poi_id = stringField(j, "poi_id");
        record.name = stringField(j, "name");

        auto key_it = j.find("dedupe_key");
        if (key_it != j.end() && key_it->is_string() && !key_it->get<std::string>().empty())
        {
            record.dedupe_key = key_it->get<std::string>();
        }

        auto loc_it = j.find("location");
        if (loc_it != j.end())
        {
            record.location = *loc_it;
        }

        for (auto it = j.begin(); it != j.end(); ++it)
        {
            const std::string &key = it.key();
            if (key == "poi_id" || key == "name" || key == "dedupe_key" || key == "location")
            {
                continue;
            }
            record.attributes[key] = it.value();
        }
        return record;
    }

    nlohmann::json PoiRecord::toJson() const
    {
        if (!attributes.is_object())
        {
            return attributes;
        }

        nlohmann::json j = attributes;
        if (!poi_id.empty())
        {
            j["poi_id"] = poi_id;
        }
        if (!name.empty())
        {
            j["name"] = name;
        }
        if (dedupe_key)
        {
            j["dedupe_key"] = *dedupe_key;
        }
        if (!location.is_null())
        {
            j["location"] = location;
        }
        return j;
    }

    bool PoiRecord::operator==(const PoiRecord &other) const
    {
        return poi_id == other.poi_id && name == other.name && dedupe_key == other.dedupe_key &&
               location == other.location && attributes == other.attributes;
    }

} // namespace poi
