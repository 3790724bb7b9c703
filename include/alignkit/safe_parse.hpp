#pragma once

#include <optional>
#include <string>

namespace alignkit::util
{

    /**
     * Parses the whole of text (surrounding whitespace allowed) as a decimal
     * floating point number. Returns defaultValue when text is absent, empty,
     * has trailing garbage or is out of range.
     */
    std::optional<double> safeFloat(const std::optional<std::string>& text,
                                    std::optional<double>             defaultValue = std::nullopt);

    // safeFloat truncated toward zero. Non-finite values yield defaultValue.
    std::optional<long long> safeInt(const std::optional<std::string>& text,
                                     std::optional<long long>          defaultValue = std::nullopt);

    // Strips a leading UTF-8 byte order mark, if any.
    std::string removeBom(const std::string& text);

} // namespace alignkit::util
