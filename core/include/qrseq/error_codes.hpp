/**
 * qrseq - Error codes reported by the framing and reassembly layers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace qrseq
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        MalformedHeader = 1,
        InvalidFrameSize = 2,
        InvalidSequenceMetadata = 3,
        OversizedInput = 4,
        SequenceIncomplete = 5,
        CarrierDecodeError = 6,
        InvalidRenderOptions = 7,
        InvalidSnapshot = 8
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    std::optional<ErrorCode> error_code_from_int(std::uint16_t value) noexcept;

} // namespace qrseq
