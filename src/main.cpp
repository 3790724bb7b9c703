#include "cli.hpp"
#include "diagnostic_manager.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);

    alignkit::cli::CliOptions opts;
    try
    {
        opts = alignkit::cli::parseArguments(args);
    }
    catch (const alignkit::cli::CliError& ex)
    {
        std::cerr << ex.what() << "\n\n" << alignkit::cli::usage();
        return 2;
    }

    alignkit::diag::DiagnosticManager diagMgr(opts.logConfig);
    diagMgr.start();

    int status = alignkit::cli::run(opts, std::cout, diagMgr);

    diagMgr.stop();
    return status;
}
