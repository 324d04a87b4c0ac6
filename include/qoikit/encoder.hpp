#ifndef QOIKIT_ENCODER_HPP_
#define QOIKIT_ENCODER_HPP_

#include <qoikit/qoikit_export.h>
#include <qoikit/header.hpp>
#include <qoikit/image.hpp>
#include <qoikit/opcodes.hpp>
#include <qoikit/stream.hpp>
#include <qoikit/types.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace qoikit {

// ============================================================================
// Incremental Encoder
// ============================================================================

/**
 * Push-style encoder writing to a byte sink.
 *
 * Usage: begin() once with the header, push() exactly width * height pixels
 * in scan order, then finish() to flush the open run and append the end
 * marker. The produced bytes are identical to encode() for the same image.
 * After finish() (or any failure) the encoder may be reused with begin().
 */
class QOIKIT_EXPORT stream_encoder {
public:
    explicit stream_encoder(byte_sink& sink) noexcept : sink_(sink) {}

    stream_encoder(const stream_encoder&) = delete;
    stream_encoder& operator=(const stream_encoder&) = delete;

    /**
     * Reset the engine and write the header.
     * @param hdr Header of the image about to be pushed
     */
    [[nodiscard]] codec_result begin(const header& hdr);

    /**
     * Encode one pixel.
     * Fails with invalid_state before begin() or past width * height pixels.
     */
    [[nodiscard]] codec_result push(const color& px);

    /**
     * Encode a contiguous block of pixels.
     */
    [[nodiscard]] codec_result push(std::span<const color> pixels);

    /**
     * Flush the open run and write the end marker.
     * Fails with invalid_state if fewer than width * height pixels were pushed.
     */
    [[nodiscard]] codec_result finish();

    [[nodiscard]] bool active() const noexcept { return active_; }
    [[nodiscard]] const header& info() const noexcept { return header_; }
    [[nodiscard]] std::uint64_t pixels_pushed() const noexcept { return pushed_; }

    // Engine state, exposed for inspection
    [[nodiscard]] const color_cache& cache() const noexcept { return state_.cache; }
    [[nodiscard]] std::uint32_t open_run() const noexcept { return state_.run; }

private:
    codec_result write(std::span<const std::uint8_t> bytes);

    byte_sink& sink_;
    engine_state state_;
    header header_;
    std::uint64_t pushed_ = 0;
    bool active_ = false;
};

// ============================================================================
// Whole-Image Encoding
// ============================================================================

/**
 * Build the header written for an image.
 * The channel tag is rgba if any pixel is not fully opaque, rgb otherwise.
 */
[[nodiscard]] QOIKIT_EXPORT header make_header(image_view img) noexcept;

/**
 * Encode an image to a byte sink.
 * @param img Source pixels; pixels.size() must equal width * height
 * @param sink Destination
 * @return invalid_data for an inconsistent view, io_error if the sink fails
 */
[[nodiscard]] QOIKIT_EXPORT codec_result encode(image_view img, byte_sink& sink);

/**
 * Encode an image to a byte buffer.
 * @param img Source pixels
 * @param out Receives the complete stream; untouched on failure
 */
[[nodiscard]] QOIKIT_EXPORT codec_result encode(image_view img, std::vector<std::uint8_t>& out);

} // namespace qoikit

#endif // QOIKIT_ENCODER_HPP_
