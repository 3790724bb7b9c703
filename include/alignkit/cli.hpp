#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "diagnostic_manager.hpp"

namespace alignkit::cli
{

    class CliError : public std::runtime_error
    {
      public:
        using std::runtime_error::runtime_error;
    };

    enum class InputFormat
    {
        AUTO,
        TXT,
        XML,
        STRING
    };

    enum class TimeFormat
    {
        SSMMM,
        HHMMSSMMM,
        SRT
    };

    struct CliOptions
    {
        std::optional<std::string> configPath;
        InputFormat                format{InputFormat::AUTO};
        bool                       tasks{false};
        bool                       json{false};
        std::vector<double>        times;
        TimeFormat                 timeFormat{TimeFormat::HHMMSSMMM};
        diag::LogConfig            logConfig{diag::Severity::WARN, true, std::nullopt, 0};
        bool                       showHelp{false};
    };

    // Throws CliError on unknown flags, missing values or malformed numbers.
    CliOptions parseArguments(const std::vector<std::string>& args);

    std::string usage();

    /**
     * Converts the configured input and/or formats the requested times,
     * writing results to out. Returns the process exit status: 0 on
     * success, 1 when the input is unreadable or the conversion failed.
     */
    int run(const CliOptions& opts, std::ostream& out, diag::DiagnosticManager& diagMgr);

} // namespace alignkit::cli
