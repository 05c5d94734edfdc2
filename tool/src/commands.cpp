#include "qrseq/tool/commands.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "qrseq/carrier.hpp"
#include "qrseq/chunker.hpp"
#include "qrseq/sequence.hpp"
#include "qrseq/snapshot.hpp"

namespace qrseq::tool
{

    namespace
    {
        std::vector<std::uint8_t> read_bytes(std::istream &in)
        {
            return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        std::vector<std::uint8_t> read_input(const std::optional<std::filesystem::path> &path)
        {
            if (!path)
            {
                return read_bytes(std::cin);
            }
            std::ifstream file(*path, std::ios::binary);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open input " + path->string());
            }
            return read_bytes(file);
        }

        std::vector<std::string> read_lines(const std::optional<std::filesystem::path> &path)
        {
            std::ifstream file;
            if (path)
            {
                file.open(*path);
                if (!file.is_open())
                {
                    throw std::runtime_error("Cannot open input " + path->string());
                }
            }
            std::istream &in = path ? static_cast<std::istream &>(file) : std::cin;

            std::vector<std::string> lines;
            std::string line;
            while (std::getline(in, line))
            {
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }
                if (!line.empty())
                {
                    lines.push_back(std::move(line));
                }
            }
            return lines;
        }

        void write_output(const std::optional<std::filesystem::path> &path, const std::vector<std::uint8_t> &data)
        {
            if (!path)
            {
                std::cout.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                std::cout.flush();
                return;
            }
            std::ofstream file(*path, std::ios::binary | std::ios::trunc);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot write output " + path->string());
            }
            file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        }

        std::string describe_missing(const Sequence &sequence)
        {
            std::string text;
            for (const auto index : sequence.missing())
            {
                if (!text.empty())
                {
                    text += ',';
                }
                text += std::to_string(index);
            }
            return text;
        }
    } // namespace

    int run_split(const ToolConfig &config)
    {
        const auto data = read_input(config.input);

        Sequence sequence;
        if (const auto result = Sequence::from_data(data, config.frame_size, sequence); result != ErrorCode::Ok)
        {
            spdlog::error("Cannot split {} bytes at frame size {}: {} (limit {} bytes)", data.size(),
                          to_int(config.frame_size), to_string(result), max_input_size(config.frame_size));
            return EXIT_FAILURE;
        }

        std::vector<std::string> texts;
        if (const auto result = carrier::carrier_texts(sequence, texts); result != ErrorCode::Ok)
        {
            spdlog::error("Cannot emit frames: {}", to_string(result));
            return EXIT_FAILURE;
        }

        std::ofstream file;
        if (config.output)
        {
            file.open(*config.output, std::ios::trunc);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot write output " + config.output->string());
            }
        }
        std::ostream &out = config.output ? static_cast<std::ostream &>(file) : std::cout;
        for (const auto &text : texts)
        {
            out << text << '\n';
        }
        out.flush();

        spdlog::info("Split {} bytes into {} frames of size {}", data.size(), texts.size(), to_int(config.frame_size));
        return EXIT_SUCCESS;
    }

    int run_join(const ToolConfig &config)
    {
        Sequence sequence;
        if (config.state_path && std::filesystem::exists(*config.state_path))
        {
            if (const auto result = load_snapshot(*config.state_path, sequence); result != ErrorCode::Ok)
            {
                spdlog::error("Cannot resume from {}: {}", config.state_path->string(), to_string(result));
                return EXIT_FAILURE;
            }
            spdlog::info("Resumed {} of {} frames from {}", sequence.received(), sequence.total(),
                         config.state_path->string());
        }

        auto lines = read_lines(config.input);
        if (config.shuffle)
        {
            std::mt19937 rng{std::random_device{}()};
            std::shuffle(lines.begin(), lines.end(), rng);
        }

        std::size_t rejected = 0;
        for (std::size_t i = 0; i < lines.size() && !sequence.is_complete(); ++i)
        {
            if (const auto result = carrier::absorb_text(sequence, lines[i]); result != ErrorCode::Ok)
            {
                ++rejected;
                spdlog::warn("Frame on line {} rejected: {}", i + 1, to_string(result));
                continue;
            }
            spdlog::info("Progress: {:.2f}%", sequence.progress() * 100.0f);
        }

        if (!sequence.is_complete())
        {
            spdlog::error("Sequence incomplete: {} of {} frames, missing [{}], {} rejected", sequence.received(),
                          sequence.total(), describe_missing(sequence), rejected);
            if (config.state_path)
            {
                save_snapshot(sequence, *config.state_path);
                spdlog::info("Saved progress to {}", config.state_path->string());
            }
            return EXIT_FAILURE;
        }

        std::vector<std::uint8_t> data;
        if (const auto result = sequence.reconstruct(data); result != ErrorCode::Ok)
        {
            spdlog::error("Reconstruction failed: {}", to_string(result));
            return EXIT_FAILURE;
        }
        write_output(config.output, data);
        if (config.state_path)
        {
            std::error_code ec;
            std::filesystem::remove(*config.state_path, ec);
        }
        spdlog::info("Reconstructed {} bytes from {} frames", data.size(), sequence.total());
        return EXIT_SUCCESS;
    }

    int run_status(const ToolConfig &config)
    {
        Sequence sequence;
        if (const auto result = load_snapshot(*config.state_path, sequence); result != ErrorCode::Ok)
        {
            spdlog::error("Cannot read {}: {}", config.state_path->string(), to_string(result));
            return EXIT_FAILURE;
        }

        nlohmann::json report{
            {"state", to_string(sequence.state())},
            {"received", sequence.received()},
            {"total", sequence.total()},
            {"progress", sequence.progress()},
            {"missing", sequence.missing()},
        };
        std::cout << report.dump(2) << '\n';
        return EXIT_SUCCESS;
    }

} // namespace qrseq::tool
