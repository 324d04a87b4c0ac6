#pragma once

#include <qoikit/header.hpp>
#include <qoikit/opcodes.hpp>
#include <qoikit/types.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace qoikit {

// Validate dimensions against limits, returning failure result if exceeded.
// Runs before any pixel storage is allocated.
inline codec_result validate_dimensions(const header& hdr, const decode_options& options) {
    if ((options.max_width > 0 && hdr.width > options.max_width) ||
        (options.max_height > 0 && hdr.height > options.max_height)) {
        return codec_result::failure(codec_error::dimensions_exceeded,
            "Image dimensions exceed limits");
    }

    const std::uint64_t total_pixels = hdr.pixel_count();
    if (options.max_pixels > 0 && total_pixels > options.max_pixels) {
        return codec_result::failure(codec_error::out_of_memory, "QOI image too large");
    }

    // Prevent overflow of the pixel buffer size on narrow size_t targets
    if (total_pixels > std::numeric_limits<std::size_t>::max() / sizeof(color) ||
        total_pixels > std::vector<color>().max_size()) {
        return codec_result::failure(codec_error::out_of_memory, "QOI image not addressable");
    }

    return codec_result::success();
}

// Smallest and largest container a header allows: every pixel in a maximal
// run at one end, every pixel an RGBA literal at the other.
inline bool container_size_fits(const header& hdr, std::size_t size) noexcept {
    constexpr std::uint64_t framing = QOI_HEADER_SIZE + QOI_END_MARKER_SIZE;
    constexpr std::uint64_t max_u64 = std::numeric_limits<std::uint64_t>::max();

    const std::uint64_t pixels = hdr.pixel_count();
    const std::uint64_t min_size = framing + (pixels + QOI_MAX_RUN - 1) / QOI_MAX_RUN;
    const std::uint64_t max_size = pixels > (max_u64 - framing) / QOI_MAX_OP_SIZE
                                       ? max_u64
                                       : framing + pixels * QOI_MAX_OP_SIZE;

    const auto actual = static_cast<std::uint64_t>(size);
    return actual >= min_size && actual <= max_size;
}

} // namespace qoikit
