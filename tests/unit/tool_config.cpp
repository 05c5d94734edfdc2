#include <cassert>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "qrseq/tool/config.hpp"

using namespace qrseq;
using namespace qrseq::tool;

void run_tool_config_tests();

namespace
{

    ToolConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "qrseq");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool rejects(std::vector<std::string> args)
    {
        try
        {
            (void)parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void test_split_arguments()
    {
        const auto config = parse({"split", "--frame-size", "512", "-i", "in.bin", "--output", "frames.txt", "--verbose"});
        assert(config.command == Command::Split);
        assert(config.frame_size == FrameSize::Size512);
        assert(config.input && config.input->string() == "in.bin");
        assert(config.output && config.output->string() == "frames.txt");
        assert(config.verbose);
        assert(!config.state_path);

        assert(rejects({"split"}));
        assert(rejects({"split", "--frame-size", "100"}));
        assert(rejects({"split", "--frame-size", "abc"}));
        assert(rejects({"split", "--frame-size", "64abc"}));
        assert(rejects({"split", "--frame-size", "64 "}));
        assert(rejects({"split", "--frame-size"}));
        assert(rejects({"split", "--frame-size", "64", "--state", "s.json"}));
    }

    void test_join_and_status_arguments()
    {
        const auto join = parse({"join", "--state", "progress.json", "--shuffle", "--log", "run.log"});
        assert(join.command == Command::Join);
        assert(join.shuffle);
        assert(join.state_path && join.state_path->string() == "progress.json");
        assert(join.log_path && join.log_path->string() == "run.log");
        assert(!join.input);

        const auto status = parse({"status", "--state", "progress.json"});
        assert(status.command == Command::Status);
        assert(rejects({"status"}));
    }

    void test_misc_arguments()
    {
        assert(parse({}).command == Command::Help);
        assert(parse({"--help"}).command == Command::Help);
        assert(parse({"join", "-h"}).command == Command::Help);
        assert(parse({"--version"}).command == Command::Version);
        assert(rejects({"scan"}));
        assert(rejects({"join", "--colour"}));
        assert(usage("qrseq").find("split --frame-size") != std::string::npos);
    }

} // namespace

void run_tool_config_tests()
{
    test_split_arguments();
    test_join_and_status_arguments();
    test_misc_arguments();
}
