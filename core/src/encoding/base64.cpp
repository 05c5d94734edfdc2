#include "qrseq/encoding/base64.hpp"

#include <array>
#include <cstddef>

namespace qrseq::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        constexpr std::int8_t kInvalid = -1;
        constexpr std::int8_t kPadding = -2;
        constexpr std::int8_t kLineBreak = -3;

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(kInvalid);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            table[static_cast<unsigned char>('=')] = kPadding;
            table[static_cast<unsigned char>('\r')] = kLineBreak;
            table[static_cast<unsigned char>('\n')] = kLineBreak;
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base64(std::span<const std::uint8_t> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t offset = 0;
        for (; offset + 3 <= data.size(); offset += 3)
        {
            const std::uint32_t group = (static_cast<std::uint32_t>(data[offset]) << 16) |
                                        (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
                                        static_cast<std::uint32_t>(data[offset + 2]);
            output.push_back(kAlphabet[(group >> 18) & 0x3Fu]);
            output.push_back(kAlphabet[(group >> 12) & 0x3Fu]);
            output.push_back(kAlphabet[(group >> 6) & 0x3Fu]);
            output.push_back(kAlphabet[group & 0x3Fu]);
        }

        const auto remaining = data.size() - offset;
        if (remaining == 0)
        {
            return output;
        }

        std::uint32_t tail = static_cast<std::uint32_t>(data[offset]) << 16;
        if (remaining == 2)
        {
            tail |= static_cast<std::uint32_t>(data[offset + 1]) << 8;
        }
        output.push_back(kAlphabet[(tail >> 18) & 0x3Fu]);
        output.push_back(kAlphabet[(tail >> 12) & 0x3Fu]);
        output.push_back(remaining == 2 ? kAlphabet[(tail >> 6) & 0x3Fu] : '=');
        output.push_back('=');
        return output;
    }

    std::optional<std::vector<std::uint8_t>> decode_base64(std::string_view input)
    {
        std::vector<std::uint8_t> output;
        output.reserve((input.size() * 3) / 4);

        std::uint32_t accumulator = 0;
        int bits_collected = 0;
        std::size_t symbols = 0;
        std::size_t padding = 0;
        for (const char ch : input)
        {
            const int value = kDecodeTable[static_cast<unsigned char>(ch)];
            if (value == kLineBreak)
            {
                continue;
            }
            if (value == kInvalid)
            {
                return std::nullopt;
            }
            ++symbols;
            if (value == kPadding)
            {
                ++padding;
                continue;
            }
            if (padding > 0)
            {
                // data after padding
                return std::nullopt;
            }
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits_collected += 6;
            if (bits_collected >= 8)
            {
                bits_collected -= 8;
                output.push_back(static_cast<std::uint8_t>((accumulator >> bits_collected) & 0xFFu));
            }
        }

        if (symbols % 4 != 0 || padding > 2)
        {
            return std::nullopt;
        }
        // "xx==" and "xxx=" are the only padded quartets; "x===" cannot occur.
        if (padding > 0 && (symbols - padding) % 4 != 4 - padding)
        {
            return std::nullopt;
        }

        return output;
    }

} // namespace qrseq::encoding
