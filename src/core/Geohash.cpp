#include "Geohash.h"

#include <stdexcept>

namespace poi
{
    namespace geohash
    {
        namespace
        {
            const char BASE32[] = "0123456789bcdefghjkmnpqrstuvwxyz";

            int charIndex(char c)
            {
                for (int i = 0; i < 32; ++i)
                {
                    if (BASE32[i] == c)
                    {
                        return i;
                    }
                }
                return -1;
            }
        } // namespace

        std::string encode(double latitude, double longitude, int precision)
        {
            if (precision < MIN_PRECISION || precision > MAX_PRECISION)
            {
                throw std::invalid_argument("geohash: precision must be between 1 and 12, got " + std::to_string(precision));
            }

            double lat_range[2] = {-90.0, 90.0};
            double lng_range[2] = {-180.0, 180.0};
            bool even_bit = true; // bits alternate, longitude first
            int bit = 0;
            int ch = 0;

            std::string hash;
            hash.reserve(static_cast<size_t>(precision));
            while (static_cast<int>(hash.size()) < precision)
            {
                double *range = even_bit ? lng_range : lat_range;
                double value = even_bit ? longitude : latitude;
                double mid = (range[0] + range[1]) / 2.0;
                if (value > mid)
                {
                    ch = (ch << 1) | 1;
                    range[0] = mid;
                }
                else
                {
                    ch = ch << 1;
                    range[1] = mid;
                }
                even_bit = !even_bit;

                if (++bit == 5)
                {
                    hash.push_back(BASE32[ch]);
                    bit = 0;
                    ch = 0;
                }
            }
            return hash;
        }

        Cell decode(const std::string &hash)
        {
            if (hash.empty())
            {
                throw std::invalid_argument("geohash: empty hash");
            }

            Cell cell{-90.0, 90.0, -180.0, 180.0};
            bool even_bit = true;
            for (char c : hash)
            {
                int idx = charIndex(c);
                if (idx < 0)
                {
                    throw std::invalid_argument(std::string("geohash: invalid character '") + c + "'");
                }
                for (int mask = 16; mask > 0; mask >>= 1)
                {
                    double &lo = even_bit ? cell.min_longitude : cell.min_latitude;
                    double &hi = even_bit ? cell.max_longitude : cell.max_latitude;
                    double mid = (lo + hi) / 2.0;
                    if (idx & mask)
                    {
                        lo = mid;
                    }
                    else
                    {
                        hi = mid;
                    }
                    even_bit = !even_bit;
                }
            }
            return cell;
        }

    } // namespace geohash
} // namespace poi
