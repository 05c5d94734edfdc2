#include "qrseq/sequence.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "qrseq/chunker.hpp"

namespace qrseq
{

    std::string_view to_string(SequenceState state) noexcept
    {
        switch (state)
        {
        case SequenceState::Empty:
            return "empty";
        case SequenceState::Partial:
            return "partial";
        case SequenceState::Complete:
            return "complete";
        }
        return "unknown";
    }

    ErrorCode Sequence::from_data(std::span<const std::uint8_t> data, FrameSize frame_size, Sequence &sequence)
    {
        std::vector<Frame> frames;
        if (const auto result = split(data, frame_size, frames); result != ErrorCode::Ok)
        {
            return result;
        }

        Complete complete{};
        complete.frame_size = frame_size;
        complete.total = static_cast<std::uint8_t>(frames.size());
        complete.slots.reserve(frames.size());
        for (auto &frame : frames)
        {
            complete.slots.push_back(std::move(frame.payload));
        }
        sequence.state_ = std::move(complete);
        return ErrorCode::Ok;
    }

    ErrorCode Sequence::validate(const Frame &frame)
    {
        const auto &header = frame.header;
        if (!is_valid_frame_size(to_int(header.frame_size)))
        {
            return ErrorCode::InvalidFrameSize;
        }
        if (header.total == 0 || header.index >= header.total)
        {
            return ErrorCode::InvalidSequenceMetadata;
        }
        if (frame.payload.size() > payload_capacity(header.frame_size))
        {
            return ErrorCode::InvalidFrameSize;
        }
        return ErrorCode::Ok;
    }

    ErrorCode Sequence::absorb(const Frame &frame)
    {
        const auto &header = frame.header;
        if (std::holds_alternative<Complete>(state_))
        {
            spdlog::debug("Sequence complete, ignoring frame {}/{}", header.index, header.total);
            return ErrorCode::Ok;
        }

        if (const auto result = validate(frame); result != ErrorCode::Ok)
        {
            spdlog::warn("Rejected frame {}/{} (size {}): {}", header.index, header.total, to_int(header.frame_size),
                         to_string(result));
            return result;
        }

        if (std::holds_alternative<Empty>(state_))
        {
            Partial partial{};
            partial.frame_size = header.frame_size;
            partial.total = header.total;
            partial.slots.resize(header.total);
            state_ = std::move(partial);
            spdlog::debug("Sequence started: {} frames of size {}", header.total, to_int(header.frame_size));
        }

        auto &partial = std::get<Partial>(state_);
        if (header.frame_size != partial.frame_size || header.total != partial.total)
        {
            spdlog::warn("Frame {}/{} (size {}) conflicts with sequence of {} frames of size {}", header.index,
                         header.total, to_int(header.frame_size), partial.total, to_int(partial.frame_size));
            return ErrorCode::InvalidSequenceMetadata;
        }

        auto &slot = partial.slots[header.index];
        if (slot)
        {
            spdlog::debug("Duplicate frame {}/{}", header.index, header.total);
            return ErrorCode::Ok;
        }
        slot = frame.payload;
        ++partial.received;
        spdlog::debug("Absorbed frame {}/{} ({} received)", header.index, header.total, partial.received);

        if (partial.received == partial.total)
        {
            complete_from(partial);
        }
        return ErrorCode::Ok;
    }

    ErrorCode Sequence::absorb_bytes(std::span<const std::uint8_t> bytes)
    {
        if (is_complete())
        {
            return ErrorCode::Ok;
        }
        Frame frame{};
        if (const auto result = decode_frame(bytes, frame); result != ErrorCode::Ok)
        {
            spdlog::warn("Dropping undecodable frame of {} bytes: {}", bytes.size(), to_string(result));
            return result;
        }
        return absorb(frame);
    }

    void Sequence::complete_from(Partial &partial)
    {
        Complete complete{};
        complete.frame_size = partial.frame_size;
        complete.total = partial.total;
        complete.slots.reserve(partial.slots.size());
        for (auto &slot : partial.slots)
        {
            complete.slots.push_back(std::move(*slot));
        }
        state_ = std::move(complete);
        spdlog::debug("Sequence complete");
    }

    SequenceState Sequence::state() const noexcept
    {
        if (std::holds_alternative<Partial>(state_))
        {
            return SequenceState::Partial;
        }
        if (std::holds_alternative<Complete>(state_))
        {
            return SequenceState::Complete;
        }
        return SequenceState::Empty;
    }

    bool Sequence::is_complete() const noexcept
    {
        return std::holds_alternative<Complete>(state_);
    }

    float Sequence::progress() const noexcept
    {
        if (const auto *partial = std::get_if<Partial>(&state_))
        {
            return static_cast<float>(partial->received) / static_cast<float>(partial->total);
        }
        return is_complete() ? 1.0f : 0.0f;
    }

    std::optional<FrameSize> Sequence::frame_size() const noexcept
    {
        if (const auto *partial = std::get_if<Partial>(&state_))
        {
            return partial->frame_size;
        }
        if (const auto *complete = std::get_if<Complete>(&state_))
        {
            return complete->frame_size;
        }
        return std::nullopt;
    }

    std::size_t Sequence::total() const noexcept
    {
        if (const auto *partial = std::get_if<Partial>(&state_))
        {
            return partial->total;
        }
        if (const auto *complete = std::get_if<Complete>(&state_))
        {
            return complete->total;
        }
        return 0;
    }

    std::size_t Sequence::received() const noexcept
    {
        if (const auto *partial = std::get_if<Partial>(&state_))
        {
            return partial->received;
        }
        return total();
    }

    std::vector<std::uint8_t> Sequence::missing() const
    {
        std::vector<std::uint8_t> indices;
        if (const auto *partial = std::get_if<Partial>(&state_))
        {
            for (std::size_t i = 0; i < partial->slots.size(); ++i)
            {
                if (!partial->slots[i])
                {
                    indices.push_back(static_cast<std::uint8_t>(i));
                }
            }
        }
        return indices;
    }

    std::vector<Frame> Sequence::received_frames() const
    {
        std::vector<Frame> result;
        const auto size = frame_size();
        if (!size)
        {
            return result;
        }
        const auto count = static_cast<std::uint8_t>(total());
        const auto make_frame = [&](std::size_t index, const std::vector<std::uint8_t> &payload)
        {
            return Frame{
                .header = FrameHeader{.index = static_cast<std::uint8_t>(index), .total = count, .frame_size = *size},
                .payload = payload,
            };
        };

        if (const auto *partial = std::get_if<Partial>(&state_))
        {
            for (std::size_t i = 0; i < partial->slots.size(); ++i)
            {
                if (partial->slots[i])
                {
                    result.push_back(make_frame(i, *partial->slots[i]));
                }
            }
        }
        else if (const auto *complete = std::get_if<Complete>(&state_))
        {
            result.reserve(complete->slots.size());
            for (std::size_t i = 0; i < complete->slots.size(); ++i)
            {
                result.push_back(make_frame(i, complete->slots[i]));
            }
        }
        return result;
    }

    ErrorCode Sequence::frames(std::vector<Frame> &frames) const
    {
        if (!is_complete())
        {
            return ErrorCode::SequenceIncomplete;
        }
        frames = received_frames();
        return ErrorCode::Ok;
    }

    ErrorCode Sequence::reconstruct(std::vector<std::uint8_t> &data) const
    {
        const auto *complete = std::get_if<Complete>(&state_);
        if (complete == nullptr)
        {
            return ErrorCode::SequenceIncomplete;
        }

        std::size_t size = 0;
        for (const auto &slot : complete->slots)
        {
            size += slot.size();
        }
        std::vector<std::uint8_t> result;
        result.reserve(size);
        for (const auto &slot : complete->slots)
        {
            result.insert(result.end(), slot.begin(), slot.end());
        }
        data = std::move(result);
        return ErrorCode::Ok;
    }

    ErrorCode SharedSequence::absorb(const Frame &frame)
    {
        std::lock_guard lock(mutex_);
        return sequence_.absorb(frame);
    }

    ErrorCode SharedSequence::absorb_bytes(std::span<const std::uint8_t> bytes)
    {
        std::lock_guard lock(mutex_);
        return sequence_.absorb_bytes(bytes);
    }

    bool SharedSequence::is_complete() const
    {
        std::lock_guard lock(mutex_);
        return sequence_.is_complete();
    }

    float SharedSequence::progress() const
    {
        std::lock_guard lock(mutex_);
        return sequence_.progress();
    }

    ErrorCode SharedSequence::reconstruct(std::vector<std::uint8_t> &data) const
    {
        std::lock_guard lock(mutex_);
        return sequence_.reconstruct(data);
    }

    Sequence SharedSequence::snapshot() const
    {
        std::lock_guard lock(mutex_);
        return sequence_;
    }

} // namespace qrseq
