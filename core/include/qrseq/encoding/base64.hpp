#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qrseq::encoding
{

    // Standard alphabet, '=' padded.
    std::string encode_base64(std::span<const std::uint8_t> data);

    // Line breaks are skipped. Any other character outside the alphabet, a
    // misplaced '=' or a length that is not a multiple of four yields nullopt.
    std::optional<std::vector<std::uint8_t>> decode_base64(std::string_view input);

} // namespace qrseq::encoding
