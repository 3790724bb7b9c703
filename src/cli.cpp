#include "cli.hpp"

#include "config_codec.hpp"
#include "report.hpp"
#include "safe_parse.hpp"
#include "time_formatter.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <nlohmann/json.hpp>

namespace alignkit::cli
{

    namespace
    {

        const std::string kComponent = "alignkit-config";

        InputFormat parseInputFormat(const std::string& name)
        {
            if (name == "txt")
                return InputFormat::TXT;
            if (name == "xml")
                return InputFormat::XML;
            if (name == "string")
                return InputFormat::STRING;
            throw CliError("Unknown input format: " + name);
        }

        TimeFormat parseTimeFormat(const std::string& name)
        {
            if (name == "ssmmm")
                return TimeFormat::SSMMM;
            if (name == "hhmmssmmm")
                return TimeFormat::HHMMSSMMM;
            if (name == "srt")
                return TimeFormat::SRT;
            throw CliError("Unknown time format: " + name);
        }

        InputFormat resolveFormat(const CliOptions& opts)
        {
            if (opts.format != InputFormat::AUTO)
                return opts.format;
            auto ext = std::filesystem::path(*opts.configPath).extension().string();
            return (ext == ".xml" || ext == ".XML") ? InputFormat::XML : InputFormat::TXT;
        }

        std::optional<std::string> readFile(const std::string& path)
        {
            std::ifstream ifs(path, std::ios::in | std::ios::binary);
            if (!ifs)
                return std::nullopt;
            return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
        }

        nlohmann::json toJson(const config::ConfigMapping& mapping)
        {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, value] : mapping)
                obj[key] = value;
            return obj;
        }

        std::string formatTime(double seconds, TimeFormat fmt)
        {
            switch (fmt)
            {
            case TimeFormat::SSMMM: return util::formatSeconds(seconds);
            case TimeFormat::SRT: return util::formatSrtClock(seconds);
            case TimeFormat::HHMMSSMMM: break;
            }
            return util::formatClock(seconds);
        }

        int convert(const CliOptions& opts, std::ostream& out, diag::DiagnosticManager& diagMgr)
        {
            auto contents = readFile(*opts.configPath);
            if (!contents)
            {
                diagMgr.log(diag::Severity::ERROR, kComponent, "Cannot read config file " + *opts.configPath);
                return 1;
            }
            diagMgr.log(diag::Severity::INFO, kComponent, "Loaded config from " + *opts.configPath);

            config::ConfigCodec codec;
            config::Report      report;
            const auto          format = resolveFormat(opts);

            if (format == InputFormat::XML && opts.tasks)
            {
                auto tasks = codec.mappingsFromXmlTasks(*contents, report);
                if (opts.json)
                {
                    nlohmann::json arr = nlohmann::json::array();
                    for (const auto& task : tasks)
                        arr.push_back(toJson(task));
                    out << arr.dump(2) << '\n';
                }
                else
                {
                    for (const auto& task : tasks)
                        out << codec.stringFromMapping(task) << '\n';
                }
            }
            else
            {
                config::ConfigMapping mapping;
                if (format == InputFormat::XML)
                    mapping = codec.mappingFromXmlJob(*contents, report);
                else if (format == InputFormat::TXT)
                    mapping = codec.mappingFromString(codec.stringFromTextBlock(util::removeBom(*contents)), &report);
                else
                    mapping = codec.mappingFromString(util::removeBom(*contents), &report);

                if (opts.json)
                    out << toJson(mapping).dump(2) << '\n';
                else
                    out << codec.stringFromMapping(mapping) << '\n';
            }

            diag::logReport(diagMgr, kComponent, report);
            return report.passed() ? 0 : 1;
        }

    } // namespace

    CliOptions parseArguments(const std::vector<std::string>& args)
    {
        CliOptions opts;
        auto       value = [&args](std::size_t& i) -> const std::string&
        {
            if (i + 1 >= args.size())
                throw CliError("Missing value for " + args[i]);
            return args[++i];
        };

        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string& arg = args[i];
            if (arg == "--config")
            {
                opts.configPath = value(i);
            }
            else if (arg == "--format")
            {
                opts.format = parseInputFormat(value(i));
            }
            else if (arg == "--tasks")
            {
                opts.tasks = true;
            }
            else if (arg == "--json")
            {
                opts.json = true;
            }
            else if (arg == "--time")
            {
                const auto& raw     = value(i);
                auto        seconds = util::safeFloat(raw);
                if (!seconds || !std::isfinite(*seconds) || *seconds < 0.0)
                    throw CliError("Invalid time value: " + raw);
                opts.times.push_back(*seconds);
            }
            else if (arg == "--time-format")
            {
                opts.timeFormat = parseTimeFormat(value(i));
            }
            else if (arg == "--log-level")
            {
                const auto& level = value(i);
                if (level.size() != 1)
                    throw CliError("Invalid log level: " + level);
                opts.logConfig.minimumSeverity = diag::severityFromChar(level[0]);
            }
            else if (arg == "--log-file")
            {
                opts.logConfig.filePath    = value(i);
                opts.logConfig.logToStdout = false;
            }
            else if (arg == "--help" || arg == "-h")
            {
                opts.showHelp = true;
            }
            else
            {
                throw CliError("Unknown argument: " + arg);
            }
        }

        if (opts.tasks && opts.format != InputFormat::AUTO && opts.format != InputFormat::XML)
            throw CliError("--tasks requires XML input");
        if (!opts.showHelp && !opts.configPath && opts.times.empty())
            throw CliError("Nothing to do: pass --config and/or --time");
        return opts;
    }

    std::string usage()
    {
        std::ostringstream oss;
        oss << "Usage: alignkit-config [options]\n"
            << "  --config <path>          config file (.xml is read as XML, anything else as text)\n"
            << "  --format txt|xml|string  override the input format\n"
            << "  --tasks                  emit the task configurations of an XML config\n"
            << "  --json                   emit JSON instead of config strings\n"
            << "  --time <seconds>         format a time value (repeatable)\n"
            << "  --time-format ssmmm|hhmmssmmm|srt\n"
            << "  --log-level D|I|W|E|F    minimum diagnostics severity (default W)\n"
            << "  --log-file <path>        write diagnostics to a file instead of stdout\n";
        return oss.str();
    }

    int run(const CliOptions& opts, std::ostream& out, diag::DiagnosticManager& diagMgr)
    {
        if (opts.showHelp)
        {
            out << usage();
            return 0;
        }

        int status = 0;
        if (opts.configPath)
            status = convert(opts, out, diagMgr);

        for (double t : opts.times)
            out << formatTime(t, opts.timeFormat) << '\n';

        return status;
    }

} // namespace alignkit::cli
