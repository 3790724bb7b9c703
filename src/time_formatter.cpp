#include "time_formatter.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace alignkit::util
{

    namespace
    {

        // In milliseconds. 1.001 * 1000 is 1000.9999999999999 in binary.
        constexpr double kMillisecondTolerance = 1e-6;

    } // namespace

    std::string formatSeconds(double seconds)
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << seconds;
        return oss.str();
    }

    std::string formatClock(double seconds, char decimalSeparator)
    {
        // Every field stays a double: hours are unbounded and would overflow an integer cast.
        const double totalMs = std::floor(seconds * 1000.0 + kMillisecondTolerance);

        const double withinHour   = std::fmod(totalMs, 3600000.0);
        const double hours        = std::round((totalMs - withinHour) / 3600000.0);
        const double minutes      = std::floor(withinHour / 60000.0);
        const double secs         = std::floor(std::fmod(withinHour, 60000.0) / 1000.0);
        const double milliseconds = std::fmod(withinHour, 1000.0);

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(0) << std::setfill('0') << std::setw(2) << hours << ':'
            << std::setw(2) << minutes << ':' << std::setw(2) << secs << decimalSeparator << std::setw(3)
            << milliseconds;
        return oss.str();
    }

    std::string formatSrtClock(double seconds)
    {
        return formatClock(seconds, ',');
    }

} // namespace alignkit::util
