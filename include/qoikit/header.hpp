#ifndef QOIKIT_HEADER_HPP_
#define QOIKIT_HEADER_HPP_

#include <qoikit/qoikit_export.h>
#include <qoikit/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace qoikit {

// ============================================================================
// Container Layout
// ============================================================================

inline constexpr std::array<std::uint8_t, 4> QOI_MAGIC = {'q', 'o', 'i', 'f'};
inline constexpr std::size_t QOI_HEADER_SIZE = 14;

// Seven zero bytes followed by 0x01; no opcode sequence can end in it mid-image
inline constexpr std::array<std::uint8_t, 8> QOI_END_MARKER = {0, 0, 0, 0, 0, 0, 0, 1};
inline constexpr std::size_t QOI_END_MARKER_SIZE = QOI_END_MARKER.size();

// Longest run a single opcode can carry
inline constexpr std::uint32_t QOI_MAX_RUN = 62;

// Largest opcode (tag byte + RGBA)
inline constexpr std::size_t QOI_MAX_OP_SIZE = 5;

// ============================================================================
// Header
// ============================================================================

struct header {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    channel_format channels = channel_format::rgba;
    qoikit::colorspace colorspace = qoikit::colorspace::srgb;

    [[nodiscard]] constexpr std::uint64_t pixel_count() const noexcept {
        return static_cast<std::uint64_t>(width) * static_cast<std::uint64_t>(height);
    }

    friend constexpr bool operator==(const header&, const header&) noexcept = default;
};

/**
 * Serialize a header into its fixed 14-byte block.
 * @param hdr Header to serialize
 * @return Magic, big-endian dimensions, channel tag, colorspace tag
 */
[[nodiscard]] QOIKIT_EXPORT std::array<std::uint8_t, QOI_HEADER_SIZE> encode_header(const header& hdr) noexcept;

/**
 * Parse the fixed 14-byte header block.
 * @param data At least QOI_HEADER_SIZE bytes; extra bytes are ignored
 * @param hdr Receives the parsed header on success
 * @return invalid_magic, invalid_tag or end_of_stream on failure
 */
[[nodiscard]] QOIKIT_EXPORT codec_result decode_header(std::span<const std::uint8_t> data, header& hdr);

/**
 * Non-allocating variant of decode_header.
 * @return codec_error::none on success
 */
[[nodiscard]] QOIKIT_EXPORT codec_error parse_header(std::span<const std::uint8_t> data, header& hdr) noexcept;

} // namespace qoikit

#endif // QOIKIT_HEADER_HPP_
