#include "qrseq/frame.hpp"

#include <algorithm>

namespace qrseq
{

    namespace
    {
        std::uint16_t read_u16_le(std::span<const std::uint8_t> buffer)
        {
            return static_cast<std::uint16_t>(static_cast<std::uint16_t>(buffer[0]) |
                                              (static_cast<std::uint16_t>(buffer[1]) << 8));
        }

        void write_u16_le(std::uint16_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>(value & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
        }
    } // namespace

    bool is_valid_frame_size(std::uint16_t value) noexcept
    {
        return frame_size_from_int(value).has_value();
    }

    std::optional<FrameSize> frame_size_from_int(std::uint16_t value) noexcept
    {
        for (const auto size : kFrameSizes)
        {
            if (to_int(size) == value)
            {
                return size;
            }
        }
        return std::nullopt;
    }

    std::array<std::uint8_t, kHeaderSize> encode_header(std::uint8_t index, std::uint8_t total, FrameSize frame_size)
    {
        std::array<std::uint8_t, kHeaderSize> header{};
        header[0] = index;
        header[1] = total;
        write_u16_le(to_int(frame_size), std::span<std::uint8_t>(header).subspan<2, 2>());
        return header;
    }

    ErrorCode decode_header(std::span<const std::uint8_t> bytes, FrameHeader &header)
    {
        if (bytes.size() < kHeaderSize)
        {
            return ErrorCode::MalformedHeader;
        }
        const auto size = frame_size_from_int(read_u16_le(bytes.subspan(2, 2)));
        if (!size)
        {
            return ErrorCode::InvalidFrameSize;
        }
        header.index = bytes[0];
        header.total = bytes[1];
        header.frame_size = *size;
        return ErrorCode::Ok;
    }

    std::span<const std::uint8_t> slice_frame_payload(std::span<const std::uint8_t> bytes, FrameSize frame_size)
    {
        if (bytes.size() <= kHeaderSize)
        {
            return {};
        }
        const auto end = std::min<std::size_t>(bytes.size(), to_int(frame_size));
        return bytes.subspan(kHeaderSize, end - kHeaderSize);
    }

    std::vector<std::uint8_t> encode_frame(const Frame &frame)
    {
        const auto header = encode_header(frame.header.index, frame.header.total, frame.header.frame_size);
        std::vector<std::uint8_t> bytes;
        bytes.reserve(kHeaderSize + frame.payload.size());
        bytes.insert(bytes.end(), header.begin(), header.end());
        bytes.insert(bytes.end(), frame.payload.begin(), frame.payload.end());
        return bytes;
    }

    ErrorCode decode_frame(std::span<const std::uint8_t> bytes, Frame &frame)
    {
        FrameHeader header{};
        if (const auto result = decode_header(bytes, header); result != ErrorCode::Ok)
        {
            return result;
        }
        const auto payload = slice_frame_payload(bytes, header.frame_size);
        frame.header = header;
        frame.payload.assign(payload.begin(), payload.end());
        return ErrorCode::Ok;
    }

} // namespace qrseq
