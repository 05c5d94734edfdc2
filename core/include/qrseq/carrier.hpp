/**
 * qrseq - Bridge between frames and the QR carrier.
 *
 * A frame travels as the base64 text of its wire bytes. Rendering that text to
 * an image and reading it back are left to an injected encoder and decoder.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "qrseq/error_codes.hpp"
#include "qrseq/frame.hpp"
#include "qrseq/sequence.hpp"

namespace qrseq::carrier
{

    struct Image
    {
        std::uint32_t width{};
        std::uint32_t height{};
        // 8 bit luminance, row-major.
        std::vector<std::uint8_t> pixels{};
    };

    struct RenderOptions
    {
        int block_size{3};
        int padding{3};
        std::uint8_t foreground{0x00};
        std::uint8_t background{0xFF};
    };

    // Failures are reported by throwing.
    using QrEncoder = std::function<Image(std::string_view text, const RenderOptions &options)>;
    using QrDecoder = std::function<std::string(const Image &image)>;

    std::string to_carrier_text(const Frame &frame);

    ErrorCode from_carrier_text(std::string_view text, Frame &frame);

    bool valid_render_options(const RenderOptions &options) noexcept;

    ErrorCode render_frame(const Frame &frame, const QrEncoder &encoder, const RenderOptions &options, Image &image);

    // One image per frame, in index order. Exceptions thrown by the encoder
    // reach the caller untouched.
    ErrorCode render_sequence(const Sequence &sequence, const QrEncoder &encoder, const RenderOptions &options,
                              std::vector<Image> &images);

    ErrorCode carrier_texts(const Sequence &sequence, std::vector<std::string> &texts);

    ErrorCode decode_image(const Image &image, const QrDecoder &decoder, Frame &frame);

    // The decoder is not consulted once the sequence is complete.
    ErrorCode absorb_image(Sequence &sequence, const Image &image, const QrDecoder &decoder);

    ErrorCode absorb_text(Sequence &sequence, std::string_view text);

} // namespace qrseq::carrier
