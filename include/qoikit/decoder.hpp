#ifndef QOIKIT_DECODER_HPP_
#define QOIKIT_DECODER_HPP_

#include <qoikit/qoikit_export.h>
#include <qoikit/header.hpp>
#include <qoikit/image.hpp>
#include <qoikit/opcodes.hpp>
#include <qoikit/stream.hpp>
#include <qoikit/types.hpp>

#include <cstdint>
#include <span>
#include <string>

namespace qoikit {

// ============================================================================
// Incremental Decoder
// ============================================================================

/**
 * Pull-style decoder reading from a byte source.
 *
 * Usage: read_header() once, then fetch() runs until done(). Each fetch
 * consumes exactly one opcode; the end marker and anything after it are
 * never read.
 */
class QOIKIT_EXPORT stream_decoder {
public:
    explicit stream_decoder(byte_source& src, const decode_options& options = {}) noexcept
        : src_(src), options_(options) {}

    stream_decoder(const stream_decoder&) = delete;
    stream_decoder& operator=(const stream_decoder&) = delete;

    /**
     * Read and validate the header, then reset the engine.
     * Fails with invalid_data for a malformed header, end_of_stream if the
     * source runs dry, and out_of_memory or dimensions_exceeded if the
     * declared size breaks the configured limits.
     */
    [[nodiscard]] codec_result read_header();

    /**
     * Decode the next opcode.
     * @param run Receives the produced color and its repeat count
     * @return invalid_data if the run would overshoot width * height,
     *         end_of_stream if the opcode is incomplete, invalid_state when
     *         called before read_header(), after done() or after a failure.
     *         Every other failure is terminal until read_header() is called again.
     */
    [[nodiscard]] codec_result fetch(pixel_run& run);

    [[nodiscard]] const header& info() const noexcept { return header_; }
    [[nodiscard]] std::uint64_t remaining() const noexcept { return remaining_; }
    [[nodiscard]] bool done() const noexcept { return header_read_ && remaining_ == 0; }

    // Engine state, exposed for inspection
    [[nodiscard]] const color_cache& cache() const noexcept { return state_.cache; }

private:
    codec_result fail(codec_error error, std::string message);
    codec_result short_read(const char* what);

    byte_source& src_;
    decode_options options_;
    engine_state state_;
    header header_;
    std::uint64_t remaining_ = 0;
    bool header_read_ = false;
};

// ============================================================================
// Whole-Image Decoding
// ============================================================================

/**
 * Check if data looks like a complete QOI container.
 * Validates the header and that the buffer length fits the size range the
 * declared dimensions allow; does not decode any pixels.
 */
[[nodiscard]] QOIKIT_EXPORT bool is_valid_container(std::span<const std::uint8_t> data) noexcept;

/**
 * Decode a complete QOI buffer.
 * @param data Header, opcodes and end marker
 * @param img Receives the image; untouched on failure
 * @param options Decode limits
 */
[[nodiscard]] QOIKIT_EXPORT codec_result decode(std::span<const std::uint8_t> data,
                                                 image& img,
                                                 const decode_options& options = {});

/**
 * Decode a QOI stream from a byte source.
 * Reads the header and exactly the opcodes needed for width * height pixels.
 */
[[nodiscard]] QOIKIT_EXPORT codec_result decode(byte_source& src,
                                                 image& img,
                                                 const decode_options& options = {});

} // namespace qoikit

#endif // QOIKIT_DECODER_HPP_
