/**
 * qrseq - Reassembly of a frame sequence.
 *
 * A Sequence starts Empty and learns its frame size and frame count from the
 * first absorbed frame. Frames may arrive in any order and any number of
 * times; once every slot is filled the sequence is Complete and ignores
 * further frames.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "qrseq/error_codes.hpp"
#include "qrseq/frame.hpp"

namespace qrseq
{

    enum class SequenceState : std::uint8_t
    {
        Empty,
        Partial,
        Complete
    };

    std::string_view to_string(SequenceState state) noexcept;

    class Sequence
    {
    public:
        Sequence() = default;

        // Pre-filled sequence, complete on success.
        static ErrorCode from_data(std::span<const std::uint8_t> data, FrameSize frame_size, Sequence &sequence);

        // Duplicates and frames offered to a complete sequence are accepted
        // without effect.
        ErrorCode absorb(const Frame &frame);

        // Decodes a wire frame and absorbs it; nothing is absorbed if decoding fails.
        ErrorCode absorb_bytes(std::span<const std::uint8_t> bytes);

        SequenceState state() const noexcept;
        bool is_complete() const noexcept;
        float progress() const noexcept;

        std::optional<FrameSize> frame_size() const noexcept;
        std::size_t total() const noexcept;
        std::size_t received() const noexcept;

        // Indices of the slots that are still empty.
        std::vector<std::uint8_t> missing() const;

        // Filled slots in index order, whatever the state.
        std::vector<Frame> received_frames() const;

        ErrorCode frames(std::vector<Frame> &frames) const;

        ErrorCode reconstruct(std::vector<std::uint8_t> &data) const;

    private:
        struct Empty
        {
        };

        struct Partial
        {
            FrameSize frame_size;
            std::uint8_t total;
            std::vector<std::optional<std::vector<std::uint8_t>>> slots;
            std::size_t received;
        };

        struct Complete
        {
            FrameSize frame_size;
            std::uint8_t total;
            std::vector<std::vector<std::uint8_t>> slots;
        };

        static ErrorCode validate(const Frame &frame);
        void complete_from(Partial &partial);

        std::variant<Empty, Partial, Complete> state_;
    };

    // Sequence guarded by a mutex for several capture threads feeding one
    // reassembly.
    class SharedSequence
    {
    public:
        SharedSequence() = default;

        ErrorCode absorb(const Frame &frame);
        ErrorCode absorb_bytes(std::span<const std::uint8_t> bytes);

        bool is_complete() const;
        float progress() const;
        ErrorCode reconstruct(std::vector<std::uint8_t> &data) const;

        // Copy of the current state.
        Sequence snapshot() const;

    private:
        mutable std::mutex mutex_;
        Sequence sequence_;
    };

} // namespace qrseq
