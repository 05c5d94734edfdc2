#include "qrseq/error_codes.hpp"

#include <array>

namespace qrseq
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 9> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::MalformedHeader, "malformed_header"},
            {ErrorCode::InvalidFrameSize, "invalid_frame_size"},
            {ErrorCode::InvalidSequenceMetadata, "invalid_sequence_metadata"},
            {ErrorCode::OversizedInput, "oversized_input"},
            {ErrorCode::SequenceIncomplete, "sequence_incomplete"},
            {ErrorCode::CarrierDecodeError, "carrier_decode_error"},
            {ErrorCode::InvalidRenderOptions, "invalid_render_options"},
            {ErrorCode::InvalidSnapshot, "invalid_snapshot"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::optional<ErrorCode> error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace qrseq
