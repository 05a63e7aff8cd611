#include "CoordinateExtractor.h"

#include <cmath>
#include <spdlog/spdlog.h>

namespace poi
{
    namespace
    {
        std::optional<GeoPoint> validPoint(double lat, double lng)
        {
            if (!std::isfinite(lat) || !std::isfinite(lng))
            {
                return std::nullopt;
            }
            if (lat < -90.0 || lat > 90.0 || lng < -180.0 || lng > 180.0)
            {
                return std::nullopt;
            }
            return GeoPoint(lat, lng);
        }

        std::optional<GeoPoint> fromPair(const nlohmann::json &pair)
        {
            if (!pair.is_array() || pair.size() < 2)
            {
                return std::nullopt;
            }
            // GeoJSON order is [longitude, latitude]
            const auto &lng = pair[0];
            const auto &lat = pair[1];
            if (!lng.is_number() || !lat.is_number())
            {
                return std::nullopt;
            }
            return validPoint(lat.get<double>(), lng.get<double>());
        }

        std::optional<GeoPoint> fromKeys(const nlohmann::json &obj, const char *lat_key, const char *lng_key)
        {
            auto lat = obj.find(lat_key);
            auto lng = obj.find(lng_key);
            if (lat == obj.end() || lng == obj.end())
            {
                return std::nullopt;
            }
            if (!lat->is_number() || !lng->is_number())
            {
                return std::nullopt;
            }
            return validPoint(lat->get<double>(), lng->get<double>());
        }
    } // namespace

    std::optional<GeoPoint> extractLocation(const nlohmann::json &location)
    {
        if (location.is_array())
        {
            return fromPair(location);
        }
        if (!location.is_object())
        {
            return std::nullopt;
        }

        auto coords = location.find("coordinates");
        if (coords != location.end())
        {
            return fromPair(*coords);
        }

        if (location.contains("latitude") || location.contains("longitude"))
        {
            return fromKeys(location, "latitude", "longitude");
        }
        return fromKeys(location, "lat", "lng");
    }

    std::optional<GeoPoint> extractLocation(const PoiRecord &record)
    {
        return extractLocation(record.location);
    }

    ExtractedCoordinates extractCoordinates(const std::vector<PoiRecord> &records)
    {
        ExtractedCoordinates result;
        result.coords.reserve(records.size());
        result.indices.reserve(records.size());

        for (size_t i = 0; i < records.size(); ++i)
        {
            auto point = extractLocation(records[i]);
            if (point)
            {
                result.coords.push_back(*point);
                result.indices.push_back(i);
            }
            else
            {
                result.excluded.push_back(i);
                spdlog::debug("CoordinateExtractor: record {} ('{}') has no valid location", i, records[i].name);
            }
        }

        if (result.empty() && !records.empty())
        {
            spdlog::warn("CoordinateExtractor: no valid coordinates found in {} records", records.size());
        }
        return result;
    }

} // namespace poi
