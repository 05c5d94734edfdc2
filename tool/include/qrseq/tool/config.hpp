#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "qrseq/frame.hpp"

namespace qrseq::tool
{

    enum class Command
    {
        Split,
        Join,
        Status,
        Help,
        Version
    };

    struct ToolConfig
    {
        Command command{Command::Help};
        std::optional<std::filesystem::path> input;
        std::optional<std::filesystem::path> output;
        std::optional<std::filesystem::path> state_path;
        std::optional<std::filesystem::path> log_path;
        FrameSize frame_size{FrameSize::Size256};
        bool frame_size_given{};
        bool shuffle{};
        bool verbose{};
    };

    std::string usage(const std::string &program_name);

    ToolConfig parse_arguments(int argc, char *argv[]);

} // namespace qrseq::tool
