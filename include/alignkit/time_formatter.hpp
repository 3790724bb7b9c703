#pragma once

#include <string>

namespace alignkit::util
{

    // 12.345678 -> "12.346"
    std::string formatSeconds(double seconds);

    /**
     * Formats seconds as HH:MM:SS<sep>mmm. Milliseconds are truncated, not
     * rounded: 83.456789 -> "00:01:23.456". Hours are not capped and print
     * with more than two digits past 99.
     */
    std::string formatClock(double seconds, char decimalSeparator = '.');

    // SubRip timestamp, HH:MM:SS,mmm
    std::string formatSrtClock(double seconds);

} // namespace alignkit::util
