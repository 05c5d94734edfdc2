#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "qrseq/carrier.hpp"
#include "qrseq/chunker.hpp"
#include "qrseq/snapshot.hpp"

using namespace qrseq;

void run_snapshot_tests();

namespace
{

    std::vector<std::uint8_t> make_payload(std::size_t size)
    {
        std::vector<std::uint8_t> data(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<std::uint8_t>(255 - (i % 251));
        }
        return data;
    }

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void test_snapshot_json_layout()
    {
        const auto data = make_payload(200);
        std::vector<Frame> frames;
        assert(split(data, FrameSize::Size64, frames) == ErrorCode::Ok);

        Sequence sequence;
        assert(sequence.absorb(frames[2]) == ErrorCode::Ok);
        assert(sequence.absorb(frames[0]) == ErrorCode::Ok);

        const auto json = to_json(sequence);
        assert(json.at("version") == kSnapshotVersion);
        assert(json.at("state") == "partial");
        assert(json.at("frame_size") == 64);
        assert(json.at("total") == 4);
        assert(json.at("received") == 2);
        assert(json.at("frames").size() == 2);
        assert(json.at("frames").at(0) == carrier::to_carrier_text(frames[0]));
        assert(json.at("frames").at(1) == carrier::to_carrier_text(frames[2]));

        const auto empty = to_json(Sequence{});
        assert(empty.at("state") == "empty");
        assert(empty.at("frame_size") == 0);
        assert(empty.at("frames").empty());

        Sequence restored;
        assert(sequence_from_json(empty, restored) == ErrorCode::Ok);
        assert(restored.state() == SequenceState::Empty);
    }

    void test_snapshot_resume()
    {
        const auto path = std::filesystem::temp_directory_path() / "qrseq_snapshot_test.json";
        cleanup_path(path);

        const auto data = make_payload(1500);
        std::vector<Frame> frames;
        assert(split(data, FrameSize::Size128, frames) == ErrorCode::Ok);
        assert(frames.size() == 13);

        Sequence first_run;
        for (std::size_t i = 0; i < frames.size(); i += 2)
        {
            assert(first_run.absorb(frames[i]) == ErrorCode::Ok);
        }
        save_snapshot(first_run, path);
        assert(std::filesystem::exists(path));

        Sequence second_run;
        assert(load_snapshot(path, second_run) == ErrorCode::Ok);
        assert(second_run.received() == first_run.received());
        assert(second_run.total() == 13);
        assert(second_run.missing() == first_run.missing());
        assert(second_run.progress() == first_run.progress());

        for (std::size_t i = 1; i < frames.size(); i += 2)
        {
            assert(second_run.absorb(frames[i]) == ErrorCode::Ok);
        }
        std::vector<std::uint8_t> restored;
        assert(second_run.reconstruct(restored) == ErrorCode::Ok);
        assert(restored == data);

        cleanup_path(path);
    }

    void test_snapshot_rejection()
    {
        Sequence sequence;
        const auto path = std::filesystem::temp_directory_path() / "qrseq_snapshot_bad.json";
        cleanup_path(path);
        assert(load_snapshot(path, sequence) == ErrorCode::InvalidSnapshot);

        {
            std::ofstream out(path);
            out << "{ not json";
        }
        assert(load_snapshot(path, sequence) == ErrorCode::InvalidSnapshot);
        cleanup_path(path);

        nlohmann::json wrong_version{{"version", 99}, {"frame_size", 0}, {"total", 0}, {"frames", nlohmann::json::array()}};
        assert(sequence_from_json(wrong_version, sequence) == ErrorCode::InvalidSnapshot);

        nlohmann::json missing_frames{{"version", kSnapshotVersion}};
        assert(sequence_from_json(missing_frames, sequence) == ErrorCode::InvalidSnapshot);

        nlohmann::json bad_text{{"version", kSnapshotVersion}, {"frame_size", 64}, {"total", 4}, {"frames", nlohmann::json::array({"@@@@"})}};
        assert(sequence_from_json(bad_text, sequence) == ErrorCode::CarrierDecodeError);

        std::vector<Frame> frames;
        assert(split(make_payload(200), FrameSize::Size64, frames) == ErrorCode::Ok);
        nlohmann::json mismatched{{"version", kSnapshotVersion},
                                  {"frame_size", 128},
                                  {"total", 4},
                                  {"frames", nlohmann::json::array({carrier::to_carrier_text(frames[0])})}};
        assert(sequence_from_json(mismatched, sequence) == ErrorCode::InvalidSnapshot);

        assert(sequence.state() == SequenceState::Empty);
    }

    void test_snapshot_write_failure()
    {
        std::vector<Frame> frames;
        assert(split(make_payload(300), FrameSize::Size64, frames) == ErrorCode::Ok);
        Sequence sequence;
        assert(sequence.absorb(frames[1]) == ErrorCode::Ok);

        // a device that always reports a full disk
        const std::filesystem::path full_device{"/dev/full"};
        if (!std::filesystem::exists(full_device))
        {
            return;
        }
        bool caught = false;
        try
        {
            save_snapshot(sequence, full_device);
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
    }

} // namespace

void run_snapshot_tests()
{
    test_snapshot_json_layout();
    test_snapshot_resume();
    test_snapshot_rejection();
    test_snapshot_write_failure();
}
