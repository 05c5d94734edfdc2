#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "qrseq/carrier.hpp"
#include "qrseq/chunker.hpp"
#include "qrseq/snapshot.hpp"
#include "qrseq/tool/commands.hpp"
#include "qrseq/tool/config.hpp"

using namespace qrseq;
using namespace qrseq::tool;

void run_tool_command_tests();

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::vector<std::uint8_t> read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    void write_file(const std::filesystem::path &path, const std::vector<std::uint8_t> &data)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    std::vector<std::string> read_lines(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line))
        {
            lines.push_back(line);
        }
        return lines;
    }

    void write_lines(const std::filesystem::path &path, const std::vector<std::string> &lines)
    {
        std::ofstream out(path, std::ios::trunc);
        for (const auto &line : lines)
        {
            out << line << '\n';
        }
    }

    void test_split_then_resumed_join()
    {
        const auto root = std::filesystem::temp_directory_path() / "qrseq_tool_test";
        cleanup_path(root);
        std::filesystem::create_directories(root);

        std::vector<std::uint8_t> data(700);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            data[i] = static_cast<std::uint8_t>((i * 17 + 3) & 0xFF);
        }
        write_file(root / "input.bin", data);

        ToolConfig split_config;
        split_config.command = Command::Split;
        split_config.input = root / "input.bin";
        split_config.output = root / "frames.txt";
        split_config.frame_size = FrameSize::Size64;
        split_config.frame_size_given = true;
        assert(run_split(split_config) == EXIT_SUCCESS);

        const auto lines = read_lines(root / "frames.txt");
        // 700 bytes at 60 bytes per frame
        assert(lines.size() == 12);

        // first capture: five frames and one unreadable line
        std::vector<std::string> first(lines.begin(), lines.begin() + 5);
        first.insert(first.begin() + 2, "@@@@");
        write_lines(root / "first.txt", first);

        ToolConfig join_config;
        join_config.command = Command::Join;
        join_config.input = root / "first.txt";
        join_config.output = root / "output.bin";
        join_config.state_path = root / "state.json";
        assert(run_join(join_config) == EXIT_FAILURE);
        assert(std::filesystem::exists(root / "state.json"));
        assert(!std::filesystem::exists(root / "output.bin"));

        Sequence saved;
        assert(load_snapshot(root / "state.json", saved) == ErrorCode::Ok);
        assert(saved.received() == 5);
        assert(saved.total() == 12);

        ToolConfig status_config;
        status_config.command = Command::Status;
        status_config.state_path = root / "state.json";
        assert(run_status(status_config) == EXIT_SUCCESS);

        // second capture: the rest, with a repeat of an already stored frame
        std::vector<std::string> second(lines.begin() + 5, lines.end());
        second.push_back(lines[0]);
        write_lines(root / "second.txt", second);

        join_config.input = root / "second.txt";
        join_config.shuffle = true;
        assert(run_join(join_config) == EXIT_SUCCESS);
        assert(read_file(root / "output.bin") == data);
        assert(!std::filesystem::exists(root / "state.json"));

        cleanup_path(root);
    }

    void test_join_without_state_and_split_limits()
    {
        const auto root = std::filesystem::temp_directory_path() / "qrseq_tool_limits_test";
        cleanup_path(root);
        std::filesystem::create_directories(root);

        std::vector<std::uint8_t> data(200, 0x5A);
        Sequence source;
        assert(Sequence::from_data(data, FrameSize::Size64, source) == ErrorCode::Ok);
        std::vector<Frame> frames;
        assert(source.frames(frames) == ErrorCode::Ok);
        write_lines(root / "partial.txt", {carrier::to_carrier_text(frames[3])});

        ToolConfig join_config;
        join_config.command = Command::Join;
        join_config.input = root / "partial.txt";
        join_config.output = root / "output.bin";
        assert(run_join(join_config) == EXIT_FAILURE);
        assert(!std::filesystem::exists(root / "output.bin"));

        write_file(root / "large.bin", std::vector<std::uint8_t>(max_input_size(FrameSize::Size32) + 1, 0x01));
        ToolConfig split_config;
        split_config.command = Command::Split;
        split_config.input = root / "large.bin";
        split_config.output = root / "frames.txt";
        split_config.frame_size = FrameSize::Size32;
        split_config.frame_size_given = true;
        assert(run_split(split_config) == EXIT_FAILURE);

        ToolConfig status_config;
        status_config.command = Command::Status;
        status_config.state_path = root / "missing.json";
        assert(run_status(status_config) == EXIT_FAILURE);

        cleanup_path(root);
    }

} // namespace

void run_tool_command_tests()
{
    test_split_then_resumed_join();
    test_join_without_state_and_split_limits();
}
