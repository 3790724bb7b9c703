#include "safe_parse.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace alignkit::util
{

    namespace
    {

        constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

        std::string trim(const std::string& value)
        {
            const char* ws    = " \t\n\r\f\v";
            auto        first = value.find_first_not_of(ws);
            if (first == std::string::npos)
                return {};
            auto last = value.find_last_not_of(ws);
            return value.substr(first, last - first + 1);
        }

    } // namespace

    std::optional<double> safeFloat(const std::optional<std::string>& text, std::optional<double> defaultValue)
    {
        if (!text)
            return defaultValue;

        auto s = trim(*text);
        if (s.empty() || s.find_first_of("xX") != std::string::npos)
            return defaultValue;

        try
        {
            std::size_t idx   = 0;
            double      value = std::stod(s, &idx);
            if (idx != s.size())
                return defaultValue;
            return value;
        }
        catch (const std::invalid_argument&)
        {
            return defaultValue;
        }
        catch (const std::out_of_range&)
        {
            return defaultValue;
        }
    }

    std::optional<long long> safeInt(const std::optional<std::string>& text, std::optional<long long> defaultValue)
    {
        auto value = safeFloat(text);
        if (!value)
            return defaultValue;
        if (!std::isfinite(*value))
            return defaultValue;

        double truncated = std::trunc(*value);
        if (truncated < static_cast<double>(std::numeric_limits<long long>::min()) ||
            truncated >= static_cast<double>(std::numeric_limits<long long>::max()))
            return defaultValue;
        return static_cast<long long>(truncated);
    }

    std::string removeBom(const std::string& text)
    {
        if (text.compare(0, 3, kUtf8Bom) == 0)
            return text.substr(3);
        return text;
    }

} // namespace alignkit::util
