#ifndef ALGORITHM_PARAMETERS_H
#define ALGORITHM_PARAMETERS_H

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace poi
{

    using ParamValue = std::variant<int, double, bool>;

    /// @brief Parse "true"/"false", an integer, or a floating point number, in that order.
    /// @throws std::invalid_argument if the text is none of these.
    inline ParamValue parseParamValue(const std::string &text)
    {
        if (text == "true")
        {
            return true;
        }
        if (text == "false")
        {
            return false;
        }
        if (text.empty())
        {
            throw std::invalid_argument("empty value");
        }

        // Try int first (no decimal point or exponent)
        if (text.find_first_of(".eE") == std::string::npos)
        {
            try
            {
                size_t used = 0;
                int as_int = std::stoi(text, &used);
                if (used == text.size())
                {
                    return as_int;
                }
            }
            catch (const std::logic_error &)
            {
                // Not an int (or out of int range), read as double below
            }
        }

        size_t used = 0;
        double as_double = 0.0;
        try
        {
            as_double = std::stod(text, &used);
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument("Cannot parse: " + text);
        }
        if (used != text.size())
        {
            throw std::invalid_argument("Cannot parse: " + text);
        }
        return as_double;
    }

    /**
     * @class AlgorithmParameters
     * @brief Named tuning values for clustering and deduplication, usually
     * filled from `--param-name value` command line arguments.
     *
     * Numbers convert between int and double on read; booleans also accept 0/1.
     */
    class AlgorithmParameters
    {
    public:
        void set(const std::string &name, ParamValue value)
        {
            m_values[name] = value;
        }

        void setFromString(const std::string &name, const std::string &value_str)
        {
            set(name, parseParamValue(value_str));
        }

        bool has(const std::string &name) const
        {
            return m_values.find(name) != m_values.end();
        }

        size_t size() const
        {
            return m_values.size();
        }

        std::vector<std::string> names() const
        {
            std::vector<std::string> result;
            result.reserve(m_values.size());
            for (const auto &entry : m_values)
            {
                result.push_back(entry.first);
            }
            std::sort(result.begin(), result.end());
            return result;
        }

        template <typename T>
        T get(const std::string &name) const
        {
            static_assert(std::is_same_v<T, int> || std::is_same_v<T, double> || std::is_same_v<T, bool>,
                          "parameters are int, double or bool");

            auto it = m_values.find(name);
            if (it == m_values.end())
            {
                throw std::out_of_range("Parameter not found: " + name);
            }
            const ParamValue &value = it->second;

            if (auto *exact = std::get_if<T>(&value))
            {
                return *exact;
            }

            if constexpr (std::is_same_v<T, double>)
            {
                if (auto *i = std::get_if<int>(&value))
                {
                    return static_cast<double>(*i);
                }
            }
            else if constexpr (std::is_same_v<T, int>)
            {
                if (auto *d = std::get_if<double>(&value))
                {
                    return static_cast<int>(*d);
                }
            }
            else
            {
                if (auto *i = std::get_if<int>(&value); i && (*i == 0 || *i == 1))
                {
                    return *i == 1;
                }
            }

            throw std::bad_variant_access();
        }

        template <typename T>
        T getOr(const std::string &name, T fallback) const
        {
            return has(name) ? get<T>(name) : fallback;
        }

        /// @brief A count parameter, negative values read as 0. Empty when unset.
        std::optional<size_t> getCount(const std::string &name) const
        {
            if (!has(name))
            {
                return std::nullopt;
            }
            int value = get<int>(name);
            return static_cast<size_t>(value < 0 ? 0 : value);
        }

        size_t getCountOr(const std::string &name, size_t fallback) const
        {
            return getCount(name).value_or(fallback);
        }

    private:
        std::unordered_map<std::string, ParamValue> m_values;
    };

} // namespace poi

#endif // ALGORITHM_PARAMETERS_H
