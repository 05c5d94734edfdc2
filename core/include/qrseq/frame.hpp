/**
 * qrseq - Frame wire format.
 *
 * Every frame starts with a 4 byte header followed by the payload:
 *
 *   offset 0  u8      index       slot of the frame inside its sequence
 *   offset 1  u8      total       number of frames in the sequence
 *   offset 2  u16 LE  frame size  allocated wire size, header included
 *   offset 4  ...     payload     frame size - 4 bytes, fewer for the last frame
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "qrseq/error_codes.hpp"

namespace qrseq
{

    enum class FrameSize : std::uint16_t
    {
        Size32 = 32,
        Size64 = 64,
        Size128 = 128,
        Size256 = 256,
        Size512 = 512,
        Size1024 = 1024
    };

    inline constexpr std::size_t kHeaderSize = 4;
    inline constexpr std::size_t kMaxFrames = 255;

    inline constexpr std::array<FrameSize, 6> kFrameSizes{
        FrameSize::Size32, FrameSize::Size64, FrameSize::Size128,
        FrameSize::Size256, FrameSize::Size512, FrameSize::Size1024,
    };

    constexpr std::uint16_t to_int(FrameSize size) noexcept
    {
        return static_cast<std::uint16_t>(size);
    }

    bool is_valid_frame_size(std::uint16_t value) noexcept;

    std::optional<FrameSize> frame_size_from_int(std::uint16_t value) noexcept;

    constexpr std::size_t payload_capacity(FrameSize size) noexcept
    {
        return static_cast<std::size_t>(to_int(size)) - kHeaderSize;
    }

    struct FrameHeader
    {
        std::uint8_t index{};
        std::uint8_t total{};
        FrameSize frame_size{FrameSize::Size32};

        bool operator==(const FrameHeader &) const = default;
    };

    struct Frame
    {
        FrameHeader header{};
        std::vector<std::uint8_t> payload{};

        bool operator==(const Frame &) const = default;
    };

    std::array<std::uint8_t, kHeaderSize> encode_header(std::uint8_t index, std::uint8_t total, FrameSize frame_size);

    ErrorCode decode_header(std::span<const std::uint8_t> bytes, FrameHeader &header);

    // Tolerates a truncated last frame and drops anything past frame_size.
    std::span<const std::uint8_t> slice_frame_payload(std::span<const std::uint8_t> bytes, FrameSize frame_size);

    std::vector<std::uint8_t> encode_frame(const Frame &frame);

    ErrorCode decode_frame(std::span<const std::uint8_t> bytes, Frame &frame);

} // namespace qrseq
