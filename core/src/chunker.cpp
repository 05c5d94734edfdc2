#include "qrseq/chunker.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace qrseq
{

    ErrorCode split(std::span<const std::uint8_t> data, FrameSize frame_size, std::vector<Frame> &frames)
    {
        if (!is_valid_frame_size(to_int(frame_size)))
        {
            return ErrorCode::InvalidFrameSize;
        }
        if (data.empty())
        {
            // total == 0 is not representable on the wire
            return ErrorCode::InvalidSequenceMetadata;
        }
        if (data.size() > max_input_size(frame_size))
        {
            spdlog::warn("Input of {} bytes exceeds the {} byte limit for frame size {}", data.size(),
                         max_input_size(frame_size), to_int(frame_size));
            return ErrorCode::OversizedInput;
        }

        const auto capacity = payload_capacity(frame_size);
        const auto total = (data.size() + capacity - 1) / capacity;

        std::vector<Frame> result;
        result.reserve(total);
        for (std::size_t i = 0; i < total; ++i)
        {
            const auto offset = i * capacity;
            const auto length = std::min(capacity, data.size() - offset);
            const auto chunk = data.subspan(offset, length);

            Frame frame{};
            frame.header = FrameHeader{
                .index = static_cast<std::uint8_t>(i),
                .total = static_cast<std::uint8_t>(total),
                .frame_size = frame_size,
            };
            frame.payload.assign(chunk.begin(), chunk.end());
            result.push_back(std::move(frame));
        }

        spdlog::debug("Split {} bytes into {} frames of size {}", data.size(), total, to_int(frame_size));
        frames = std::move(result);
        return ErrorCode::Ok;
    }

} // namespace qrseq
