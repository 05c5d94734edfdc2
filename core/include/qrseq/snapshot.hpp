/**
 * qrseq - JSON persistence of a partially assembled sequence.
 */
#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "qrseq/error_codes.hpp"
#include "qrseq/sequence.hpp"

namespace qrseq
{

    inline constexpr int kSnapshotVersion = 1;

    nlohmann::json to_json(const Sequence &sequence);

    // Rebuilds the sequence by absorbing the stored frames into an empty one.
    ErrorCode sequence_from_json(const nlohmann::json &json, Sequence &sequence);

    void save_snapshot(const Sequence &sequence, const std::filesystem::path &path);

    ErrorCode load_snapshot(const std::filesystem::path &path, Sequence &sequence);

} // namespace qrseq
