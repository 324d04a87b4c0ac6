#ifndef QOIKIT_OPCODES_HPP_
#define QOIKIT_OPCODES_HPP_

#include <qoikit/qoikit_export.h>
#include <qoikit/color_cache.hpp>
#include <qoikit/header.hpp>
#include <qoikit/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace qoikit {

// ============================================================================
// Opcode Tags
// ============================================================================

inline constexpr std::uint8_t QOI_OP_INDEX = 0x00;  // 00xxxxxx
inline constexpr std::uint8_t QOI_OP_DIFF = 0x40;   // 01xxxxxx
inline constexpr std::uint8_t QOI_OP_LUMA = 0x80;   // 10xxxxxx
inline constexpr std::uint8_t QOI_OP_RUN = 0xC0;    // 11xxxxxx
inline constexpr std::uint8_t QOI_OP_RGB = 0xFE;    // 11111110
inline constexpr std::uint8_t QOI_OP_RGBA = 0xFF;   // 11111111

inline constexpr std::uint8_t QOI_MASK_2 = 0xC0;  // Top 2 bits mask

enum class opcode : std::uint8_t {
    index,
    diff,
    luma,
    run,
    rgb,
    rgba
};

/**
 * Classify an opcode by its first byte.
 * The full-byte RGB/RGBA tags are matched before the two-bit prefixes they
 * would otherwise fall under (11xxxxxx); every byte value maps to one opcode.
 */
[[nodiscard]] constexpr opcode classify_opcode(std::uint8_t first) noexcept {
    if (first == QOI_OP_RGB) {
        return opcode::rgb;
    }
    if (first == QOI_OP_RGBA) {
        return opcode::rgba;
    }
    switch (first & QOI_MASK_2) {
        case QOI_OP_INDEX: return opcode::index;
        case QOI_OP_DIFF:  return opcode::diff;
        case QOI_OP_LUMA:  return opcode::luma;
        case QOI_OP_RUN:   return opcode::run;
    }
    return opcode::run;
}

/**
 * Total encoded size of an opcode, tag byte included.
 */
[[nodiscard]] constexpr std::size_t opcode_size(opcode op) noexcept {
    switch (op) {
        case opcode::index: return 1;
        case opcode::diff:  return 1;
        case opcode::luma:  return 2;
        case opcode::run:   return 1;
        case opcode::rgb:   return 4;
        case opcode::rgba:  return 5;
    }
    return 1;
}

// ============================================================================
// Engine State
// ============================================================================

/**
 * Mutable state of one encode or decode operation.
 * Encoder and decoder update it in lockstep for the same pixel sequence.
 */
struct engine_state {
    color_cache cache;
    color previous{0, 0, 0, 255};
    std::uint32_t run = 0;  // encoder only: pixels in the open run

    void reset() noexcept {
        cache.reset();
        previous = color{0, 0, 0, 255};
        run = 0;
    }
};

/**
 * A color repeated count times, as produced by one decoded opcode.
 */
struct pixel_run {
    color value;
    std::uint32_t count = 0;
};

// Worst case for one pixel: flushing an open run, then an RGBA literal
inline constexpr std::size_t QOI_MAX_PUSH_SIZE = 1 + QOI_MAX_OP_SIZE;

using op_buffer = std::array<std::uint8_t, QOI_MAX_PUSH_SIZE>;

// ============================================================================
// Encode Direction
// ============================================================================

/**
 * Feed one pixel to the encoder state.
 * Extends the open run when the pixel repeats the previous one (emitting a
 * run opcode once it reaches QOI_MAX_RUN); otherwise flushes any open run and
 * emits the first applicable of index, diff, luma, rgb and rgba.
 * @param state Encoder state
 * @param px Next pixel in scan order
 * @param out Receives the emitted bytes
 * @return Number of bytes written to out (0 to QOI_MAX_PUSH_SIZE)
 */
QOIKIT_EXPORT std::size_t encode_pixel(engine_state& state, const color& px, op_buffer& out) noexcept;

/**
 * Emit the open run, if any.
 * @return Number of bytes written to out (0 or 1)
 */
QOIKIT_EXPORT std::size_t flush_run(engine_state& state, op_buffer& out) noexcept;

// ============================================================================
// Decode Direction
// ============================================================================

/**
 * Apply one complete opcode to the decoder state.
 * @param state Decoder state; previous and cache are updated
 * @param op Exactly opcode_size(classify_opcode(op[0])) bytes
 * @return The produced color and how many pixels it covers (1 to QOI_MAX_RUN),
 *         or a count of 0 with the state untouched if op is too short
 */
[[nodiscard]] QOIKIT_EXPORT pixel_run decode_opcode(engine_state& state, std::span<const std::uint8_t> op) noexcept;

} // namespace qoikit

#endif // QOIKIT_OPCODES_HPP_
