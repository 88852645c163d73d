#ifndef CACHE_PARAMETERS_H
#define CACHE_PARAMETERS_H

#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include <stdexcept>

namespace core
{

    using ParamValue = std::variant<int, double, bool>;

    /// @brief Reads "true", "false", an integer or a floating point literal.
    /// @throws std::invalid_argument for anything else, trailing garbage included
    inline ParamValue parseParamValue(const std::string &text)
    {
        if (text == "true")
            return true;
        if (text == "false")
            return false;

        std::size_t consumed = 0;
        bool integral = text.find_first_of(".eE") == std::string::npos;
        try
        {
            if (integral)
            {
                int parsed = std::stoi(text, &consumed);
                if (consumed == text.size())
                    return parsed;
            }
            else
            {
                double parsed = std::stod(text, &consumed);
                if (consumed == text.size())
                    return parsed;
            }
        }
        catch (const std::logic_error &)
        {
        }
        throw std::invalid_argument("Cannot parse: " + text);
    }

    /**
     * @class CacheParameters
     * @brief Named cache tunables collected from the command line or a config file.
     *
     * Numeric values convert between int and double on read. Booleans never
     * convert.
     */
    class CacheParameters
    {
    public:
        void set(const std::string &name, ParamValue value)
        {
            m_values[name] = value;
        }

        void setFromString(const std::string &name, const std::string &text)
        {
            set(name, parseParamValue(text));
        }

        bool has(const std::string &name) const
        {
            return m_values.count(name) != 0;
        }

        bool empty() const
        {
            return m_values.empty();
        }

        std::vector<std::string> names() const
        {
            std::vector<std::string> result;
            for (const auto &entry : m_values)
                result.push_back(entry.first);
            return result;
        }

        template <typename T>
        T get(const std::string &name) const
        {
            auto it = m_values.find(name);
            if (it == m_values.end())
            {
                throw std::out_of_range("Parameter not found: " + name);
            }
            return std::visit([](const auto &stored) -> T
                              {
                using Stored = std::decay_t<decltype(stored)>;
                if constexpr (std::is_same_v<Stored, T>)
                    return stored;
                else if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<Stored, bool>)
                    return static_cast<T>(stored);
                else
                    throw std::bad_variant_access(); },
                              it->second);
        }

        /// @brief Value of name, or fallback when it was never set.
        template <typename T>
        T getOr(const std::string &name, T fallback) const
        {
            return has(name) ? get<T>(name) : fallback;
        }

    private:
        std::map<std::string, ParamValue> m_values;
    };

} // namespace core

#endif // CACHE_PARAMETERS_H
