#include "qrseq/snapshot.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "qrseq/carrier.hpp"

namespace qrseq
{

    nlohmann::json to_json(const Sequence &sequence)
    {
        const auto frame_size = sequence.frame_size();
        nlohmann::json frames = nlohmann::json::array();
        for (const auto &frame : sequence.received_frames())
        {
            frames.push_back(carrier::to_carrier_text(frame));
        }
        return {
            {"version", kSnapshotVersion},
            {"state", to_string(sequence.state())},
            {"frame_size", frame_size ? to_int(*frame_size) : 0},
            {"total", sequence.total()},
            {"received", sequence.received()},
            {"frames", std::move(frames)},
        };
    }

    ErrorCode sequence_from_json(const nlohmann::json &json, Sequence &sequence)
    {
        Sequence restored;
        try
        {
            if (json.at("version").get<int>() != kSnapshotVersion)
            {
                return ErrorCode::InvalidSnapshot;
            }
            const auto frame_size = json.value("frame_size", 0);
            const auto total = json.value("total", 0);
            for (const auto &entry : json.at("frames"))
            {
                Frame frame{};
                if (const auto result = carrier::from_carrier_text(entry.get<std::string>(), frame);
                    result != ErrorCode::Ok)
                {
                    return result;
                }
                if (to_int(frame.header.frame_size) != frame_size || frame.header.total != total)
                {
                    return ErrorCode::InvalidSnapshot;
                }
                if (const auto result = restored.absorb(frame); result != ErrorCode::Ok)
                {
                    return result;
                }
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::warn("Malformed snapshot: {}", ex.what());
            return ErrorCode::InvalidSnapshot;
        }
        sequence = std::move(restored);
        return ErrorCode::Ok;
    }

    void save_snapshot(const Sequence &sequence, const std::filesystem::path &path)
    {
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Cannot write snapshot to " + path.string());
        }
        out << to_json(sequence).dump(2);
        out.flush();
        if (!out.good())
        {
            throw std::runtime_error("Failed to write snapshot to " + path.string());
        }
    }

    ErrorCode load_snapshot(const std::filesystem::path &path, Sequence &sequence)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            return ErrorCode::InvalidSnapshot;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded())
        {
            spdlog::warn("Snapshot {} is not valid JSON", path.string());
            return ErrorCode::InvalidSnapshot;
        }
        return sequence_from_json(json, sequence);
    }

} // namespace qrseq
