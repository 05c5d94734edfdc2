#include "qrseq/tool/config.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace qrseq::tool
{

    namespace
    {
        std::string require_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            return argv[index++];
        }

        FrameSize parse_frame_size(const std::string &value)
        {
            unsigned long parsed = 0;
            std::size_t consumed = 0;
            try
            {
                parsed = std::stoul(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error("Invalid frame size: " + value);
            }
            if (consumed != value.size())
            {
                throw std::runtime_error("Invalid frame size: " + value);
            }
            const auto size = parsed <= 0xFFFF ? frame_size_from_int(static_cast<std::uint16_t>(parsed)) : std::nullopt;
            if (!size)
            {
                throw std::runtime_error("Frame size must be one of 32, 64, 128, 256, 512, 1024 (got " + value + ")");
            }
            return *size;
        }
    } // namespace

    std::string usage(const std::string &program_name)
    {
        return "Usage:\n"
               "  " + program_name + " split --frame-size <N> [--input <FILE>] [--output <FILE>]\n"
               "  " + program_name + " join [--input <FILE>] [--output <FILE>] [--state <FILE>] [--shuffle]\n"
               "  " + program_name + " status --state <FILE>\n"
               "Common options: [--log <FILE>] [--verbose] [--help] [--version]\n";
    }

    ToolConfig parse_arguments(int argc, char *argv[])
    {
        ToolConfig config;
        if (argc < 2)
        {
            return config;
        }

        int index = 1;
        const std::string command = argv[index++];
        if (command == "split")
        {
            config.command = Command::Split;
        }
        else if (command == "join")
        {
            config.command = Command::Join;
        }
        else if (command == "status")
        {
            config.command = Command::Status;
        }
        else if (command == "--help" || command == "-h")
        {
            return config;
        }
        else if (command == "--version")
        {
            config.command = Command::Version;
            return config;
        }
        else
        {
            throw std::runtime_error("Unknown command: " + command);
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--input" || arg == "-i")
            {
                config.input = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--output" || arg == "-o")
            {
                config.output = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--state")
            {
                config.state_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--frame-size")
            {
                config.frame_size = parse_frame_size(require_value(index, argc, argv, arg));
                config.frame_size_given = true;
            }
            else if (arg == "--shuffle")
            {
                config.shuffle = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.command = Command::Help;
                return config;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.command == Command::Split && !config.frame_size_given)
        {
            throw std::runtime_error("split requires --frame-size");
        }
        if (config.command == Command::Status && !config.state_path)
        {
            throw std::runtime_error("status requires --state");
        }
        if (config.command == Command::Split && config.state_path)
        {
            throw std::runtime_error("--state is only valid for join and status");
        }

        return config;
    }

} // namespace qrseq::tool
