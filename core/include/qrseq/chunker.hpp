/**
 * qrseq - Splits a byte buffer into frames of one frame size.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "qrseq/error_codes.hpp"
#include "qrseq/frame.hpp"

namespace qrseq
{

    // Largest buffer that fits in kMaxFrames frames of the given size.
    constexpr std::size_t max_input_size(FrameSize frame_size) noexcept
    {
        return payload_capacity(frame_size) * kMaxFrames;
    }

    ErrorCode split(std::span<const std::uint8_t> data, FrameSize frame_size, std::vector<Frame> &frames);

} // namespace qrseq
