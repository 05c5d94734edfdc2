#include "qrseq/carrier.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "qrseq/encoding/base64.hpp"

namespace qrseq::carrier
{

    std::string to_carrier_text(const Frame &frame)
    {
        return encoding::encode_base64(encode_frame(frame));
    }

    ErrorCode from_carrier_text(std::string_view text, Frame &frame)
    {
        const auto bytes = encoding::decode_base64(text);
        if (!bytes || bytes->empty())
        {
            return ErrorCode::CarrierDecodeError;
        }
        return decode_frame(*bytes, frame);
    }

    bool valid_render_options(const RenderOptions &options) noexcept
    {
        return options.block_size >= 1 && options.padding >= 0;
    }

    ErrorCode render_frame(const Frame &frame, const QrEncoder &encoder, const RenderOptions &options, Image &image)
    {
        if (!valid_render_options(options))
        {
            return ErrorCode::InvalidRenderOptions;
        }
        image = encoder(to_carrier_text(frame), options);
        return ErrorCode::Ok;
    }

    ErrorCode render_sequence(const Sequence &sequence, const QrEncoder &encoder, const RenderOptions &options,
                              std::vector<Image> &images)
    {
        std::vector<Frame> frames;
        if (const auto result = sequence.frames(frames); result != ErrorCode::Ok)
        {
            return result;
        }
        if (!valid_render_options(options))
        {
            return ErrorCode::InvalidRenderOptions;
        }

        std::vector<Image> rendered;
        rendered.reserve(frames.size());
        for (const auto &frame : frames)
        {
            rendered.push_back(encoder(to_carrier_text(frame), options));
        }
        images = std::move(rendered);
        return ErrorCode::Ok;
    }

    ErrorCode carrier_texts(const Sequence &sequence, std::vector<std::string> &texts)
    {
        std::vector<Frame> frames;
        if (const auto result = sequence.frames(frames); result != ErrorCode::Ok)
        {
            return result;
        }
        std::vector<std::string> result;
        result.reserve(frames.size());
        for (const auto &frame : frames)
        {
            result.push_back(to_carrier_text(frame));
        }
        texts = std::move(result);
        return ErrorCode::Ok;
    }

    ErrorCode decode_image(const Image &image, const QrDecoder &decoder, Frame &frame)
    {
        std::string text;
        try
        {
            text = decoder(image);
        }
        catch (const std::exception &ex)
        {
            spdlog::debug("QR decode failed on {}x{} image: {}", image.width, image.height, ex.what());
            return ErrorCode::CarrierDecodeError;
        }
        catch (...)
        {
            spdlog::debug("QR decode failed on {}x{} image with a non-standard exception", image.width, image.height);
            return ErrorCode::CarrierDecodeError;
        }
        return from_carrier_text(text, frame);
    }

    ErrorCode absorb_image(Sequence &sequence, const Image &image, const QrDecoder &decoder)
    {
        if (sequence.is_complete())
        {
            return ErrorCode::Ok;
        }
        Frame frame{};
        if (const auto result = decode_image(image, decoder, frame); result != ErrorCode::Ok)
        {
            return result;
        }
        return sequence.absorb(frame);
    }

    ErrorCode absorb_text(Sequence &sequence, std::string_view text)
    {
        if (sequence.is_complete())
        {
            return ErrorCode::Ok;
        }
        Frame frame{};
        if (const auto result = from_carrier_text(text, frame); result != ErrorCode::Ok)
        {
            spdlog::warn("Dropping carrier text of {} characters: {}", text.size(), to_string(result));
            return result;
        }
        return sequence.absorb(frame);
    }

} // namespace qrseq::carrier
