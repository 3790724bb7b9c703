#include <gtest/gtest.h>

#include "cli.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using alignkit::cli::CliError;
using alignkit::cli::CliOptions;
using alignkit::cli::parseArguments;
using alignkit::cli::run;

namespace
{

    std::string samplePath(const std::string& name)
    {
        return (std::filesystem::path(__FILE__).parent_path() / "data" / name).string();
    }

    alignkit::diag::LogConfig quietLog()
    {
        alignkit::diag::LogConfig cfg;
        cfg.logToStdout = false;
        return cfg;
    }

    std::filesystem::path writeTempConfig(const std::string& name, const std::string& contents)
    {
        auto          path = std::filesystem::temp_directory_path() / name;
        std::ofstream ofs(path, std::ios::binary);
        ofs << contents;
        ofs.close();
        return path;
    }

} // namespace

TEST(Cli, ParsesOptions)
{
    auto opts = parseArguments({"--config", "job.xml", "--tasks", "--json", "--time", "1.5", "--time-format", "srt",
                                "--log-level", "D", "--log-file", "/tmp/x.log"});
    ASSERT_TRUE(opts.configPath.has_value());
    EXPECT_EQ(*opts.configPath, "job.xml");
    EXPECT_TRUE(opts.tasks);
    EXPECT_TRUE(opts.json);
    ASSERT_EQ(opts.times.size(), 1u);
    EXPECT_DOUBLE_EQ(opts.times[0], 1.5);
    EXPECT_EQ(opts.timeFormat, alignkit::cli::TimeFormat::SRT);
    EXPECT_EQ(opts.logConfig.minimumSeverity, alignkit::diag::Severity::DEBUG);
    EXPECT_FALSE(opts.logConfig.logToStdout);
}

TEST(Cli, RejectsBadCommandLines)
{
    EXPECT_THROW(parseArguments({"--bogus"}), CliError);
    EXPECT_THROW(parseArguments({"--config"}), CliError);
    EXPECT_THROW(parseArguments({"--time", "abc"}), CliError);
    EXPECT_THROW(parseArguments({"--time", "-1"}), CliError);
    EXPECT_THROW(parseArguments({"--time", "nan"}), CliError);
    EXPECT_THROW(parseArguments({"--time", "inf"}), CliError);
    EXPECT_THROW(parseArguments({"--format", "ini", "--config", "a"}), CliError);
    EXPECT_THROW(parseArguments({"--config", "a.txt", "--format", "txt", "--tasks"}), CliError);
    EXPECT_THROW(parseArguments({}), CliError);
}

TEST(Cli, ConvertsTextConfig)
{
    auto opts = parseArguments({"--config", samplePath("sample_job.txt")});
    alignkit::diag::DiagnosticManager diagMgr(quietLog());
    std::ostringstream                out;

    EXPECT_EQ(run(opts, out, diagMgr), 0);
    EXPECT_EQ(out.str(),
              "job_description=Sample text job|job_language=en|os_job_file_container=zip|os_job_file_name=output\n");
}

TEST(Cli, ConvertsXmlTasksToJson)
{
    auto opts = parseArguments({"--config", samplePath("sample_job.xml"), "--tasks", "--json"});
    alignkit::diag::DiagnosticManager diagMgr(quietLog());
    std::ostringstream                out;

    EXPECT_EQ(run(opts, out, diagMgr), 0);
    auto tasks = nlohmann::json::parse(out.str());
    ASSERT_TRUE(tasks.is_array());
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[1]["os_task_file_format"], "srt");
}

TEST(Cli, BrokenXmlFails)
{
    auto path = writeTempConfig("alignkit_cli_broken.xml", "<job><a>1</a>");
    auto opts = parseArguments({"--config", path.string()});
    alignkit::diag::DiagnosticManager diagMgr(quietLog());
    std::ostringstream                out;

    EXPECT_EQ(run(opts, out, diagMgr), 1);
    auto events = diagMgr.fetchRecent(10);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events[0].severity, alignkit::diag::Severity::ERROR);
    std::filesystem::remove(path);
}

TEST(Cli, StripsBomFromConfigString)
{
    auto path = writeTempConfig("alignkit_cli_bom.cfg", "\xEF\xBB\xBF" "a=1|b=2");
    auto opts = parseArguments({"--config", path.string(), "--format", "string"});
    alignkit::diag::DiagnosticManager diagMgr(quietLog());
    std::ostringstream                out;

    EXPECT_EQ(run(opts, out, diagMgr), 0);
    EXPECT_EQ(out.str(), "a=1|b=2\n");
    std::filesystem::remove(path);
}

TEST(Cli, MissingFileFails)
{
    auto opts = parseArguments({"--config", "/nonexistent/alignkit/job.txt"});
    alignkit::diag::DiagnosticManager diagMgr(quietLog());
    std::ostringstream                out;
    EXPECT_EQ(run(opts, out, diagMgr), 1);
}

TEST(Cli, FormatsTimes)
{
    auto opts = parseArguments({"--time", "3612.345", "--time", "83.456789", "--time-format", "srt"});
    alignkit::diag::DiagnosticManager diagMgr(quietLog());
    std::ostringstream                out;

    EXPECT_EQ(run(opts, out, diagMgr), 0);
    EXPECT_EQ(out.str(), "01:00:12,345\n00:01:23,456\n");
}
