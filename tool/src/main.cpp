#include <cstdlib>
#include <exception>
#include <iostream>

#include <spdlog/spdlog.h>

#include "qrseq/tool/commands.hpp"
#include "qrseq/tool/config.hpp"
#include "qrseq/tool/logging.hpp"
#include "qrseq/version.hpp"

int main(int argc, char *argv[])
{
    using qrseq::tool::Command;

    qrseq::tool::ToolConfig config;
    try
    {
        config = qrseq::tool::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << '\n'
                  << qrseq::tool::usage(argv[0]);
        return EXIT_FAILURE;
    }

    switch (config.command)
    {
    case Command::Help:
        std::cout << "qrseq " << qrseq::version() << "\n"
                  << qrseq::tool::usage(argv[0]);
        return EXIT_SUCCESS;
    case Command::Version:
        std::cout << qrseq::version() << '\n';
        return EXIT_SUCCESS;
    default:
        break;
    }

    try
    {
        qrseq::tool::configure_logging(config.log_path, config.verbose);
        spdlog::debug("qrseq {}", qrseq::version());

        switch (config.command)
        {
        case Command::Split:
            return qrseq::tool::run_split(config);
        case Command::Join:
            return qrseq::tool::run_join(config);
        case Command::Status:
            return qrseq::tool::run_status(config);
        default:
            return EXIT_FAILURE;
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "qrseq failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
