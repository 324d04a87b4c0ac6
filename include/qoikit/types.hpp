#ifndef QOIKIT_TYPES_HPP_
#define QOIKIT_TYPES_HPP_

#include <qoikit/qoikit_export.h>

#include <cstdint>
#include <string>
#include <utility>

namespace qoikit {

// ============================================================================
// Pixels
// ============================================================================

/**
 * One RGBA pixel, 8 bits per channel.
 * Alpha defaults to fully opaque.
 */
struct color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    friend constexpr bool operator==(const color&, const color&) noexcept = default;
};

static_assert(sizeof(color) == 4, "color must be tightly packed RGBA");

// ============================================================================
// Header Tags
// ============================================================================

enum class channel_format : std::uint8_t {
    rgb = 3,    // source had no meaningful alpha
    rgba = 4    // source carries alpha
};

enum class colorspace : std::uint8_t {
    srgb = 0,   // gamma-corrected color, linear alpha
    linear = 1  // every channel linear
};

// ============================================================================
// Errors
// ============================================================================

enum class codec_error {
    none,
    invalid_magic,
    invalid_tag,
    invalid_data,
    end_of_stream,
    out_of_memory,
    dimensions_exceeded,
    io_error,
    invalid_state
};

[[nodiscard]] QOIKIT_EXPORT const char* to_string(codec_error err) noexcept;

// ============================================================================
// Codec Result
// ============================================================================

struct codec_result {
    bool ok = false;
    codec_error error = codec_error::none;
    std::string message;

    [[nodiscard]] static codec_result success() {
        return {true, codec_error::none, {}};
    }

    [[nodiscard]] static codec_result failure(codec_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed dimensions (0 = no per-axis limit)
    std::uint32_t max_width = 0;
    std::uint32_t max_height = 0;

    // Upper bound on width * height, checked before the pixel buffer is allocated
    std::uint64_t max_pixels = 400000000ULL;
};

} // namespace qoikit

#endif // QOIKIT_TYPES_HPP_
