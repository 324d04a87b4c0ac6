#include <qoikit/decoder.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <ios>
#include <string>
#include <utility>

namespace qoikit {

// ============================================================================
// Incremental Decoder
// ============================================================================

codec_result stream_decoder::fail(codec_error error, std::string message) {
    // The source position is unknown after a failure; only read_header() recovers
    header_read_ = false;
    remaining_ = 0;
    return codec_result::failure(error, std::move(message));
}

codec_result stream_decoder::short_read(const char* what) {
    if (!src_.good()) {
        return fail(codec_error::io_error, "QOI source read failed");
    }
    return fail(codec_error::end_of_stream, what);
}

codec_result stream_decoder::read_header() {
    header_read_ = false;
    remaining_ = 0;

    std::array<std::uint8_t, QOI_HEADER_SIZE> block{};
    if (!read_exact(src_, block)) {
        return short_read("QOI header truncated");
    }

    header hdr;
    auto result = decode_header(block, hdr);
    if (!result) {
        return codec_result::failure(codec_error::invalid_data, std::move(result.message));
    }

    result = validate_dimensions(hdr, options_);
    if (!result) return result;

    header_ = hdr;
    remaining_ = hdr.pixel_count();
    state_.reset();
    header_read_ = true;

    return codec_result::success();
}

codec_result stream_decoder::fetch(pixel_run& run) {
    if (!header_read_) {
        return codec_result::failure(codec_error::invalid_state, "QOI header not read or decoder failed");
    }
    if (remaining_ == 0) {
        return codec_result::failure(codec_error::invalid_state, "QOI image already complete");
    }

    std::array<std::uint8_t, QOI_MAX_OP_SIZE> op{};
    if (!read_exact(src_, std::span<std::uint8_t>(op.data(), 1))) {
        return short_read("QOI opcode truncated");
    }

    const std::size_t size = opcode_size(classify_opcode(op[0]));
    if (size > 1 && !read_exact(src_, std::span<std::uint8_t>(op.data() + 1, size - 1))) {
        return short_read("QOI opcode payload truncated");
    }

    const pixel_run produced = decode_opcode(state_, std::span<const std::uint8_t>(op.data(), size));

    if (produced.count == 0) {
        return fail(codec_error::invalid_data, "QOI opcode incomplete");
    }
    // Runs may not extend past the declared pixel count
    if (produced.count > remaining_) {
        return fail(codec_error::invalid_data, "QOI run exceeds pixel count");
    }

    remaining_ -= produced.count;
    run = produced;
    return codec_result::success();
}

// ============================================================================
// Whole-Image Decoding
// ============================================================================

bool is_valid_container(std::span<const std::uint8_t> data) noexcept {
    header hdr;
    if (parse_header(data, hdr) != codec_error::none) {
        return false;
    }
    return container_size_fits(hdr, data.size());
}

codec_result decode(byte_source& src, image& img, const decode_options& options) {
    try {
        stream_decoder decoder(src, options);

        auto result = decoder.read_header();
        if (!result) return result;

        const header& hdr = decoder.info();

        image decoded;
        if (!decoded.set_size(hdr.width, hdr.height, hdr.colorspace)) {
            return codec_result::failure(codec_error::out_of_memory, "Failed to allocate image");
        }

        auto pixels = decoded.mutable_pixels();
        std::size_t dst_pos = 0;

        while (!decoder.done()) {
            pixel_run run;
            result = decoder.fetch(run);
            if (!result) return result;

            std::fill_n(pixels.begin() + static_cast<std::ptrdiff_t>(dst_pos), run.count, run.value);
            dst_pos += run.count;
        }

        img = std::move(decoded);
        return codec_result::success();

    } catch (const std::ios_base::failure& e) {
        return codec_result::failure(codec_error::io_error, e.what());
    }
}

codec_result decode(std::span<const std::uint8_t> data, image& img, const decode_options& options) {
    header hdr;
    auto result = decode_header(data, hdr);
    if (!result) {
        return codec_result::failure(codec_error::invalid_data, std::move(result.message));
    }

    result = validate_dimensions(hdr, options);
    if (!result) return result;

    if (!container_size_fits(hdr, data.size())) {
        return codec_result::failure(codec_error::invalid_data,
            "QOI data length does not match image dimensions");
    }

    // Opcodes must end before the end marker
    memory_source src(data.first(data.size() - QOI_END_MARKER_SIZE));
    return decode(src, img, options);
}

} // namespace qoikit
