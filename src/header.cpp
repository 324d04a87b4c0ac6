#include <qoikit/header.hpp>
#include "byte_io.hpp"

#include <algorithm>
#include <string>

namespace qoikit {

namespace {

constexpr std::size_t WIDTH_OFFSET = 4;
constexpr std::size_t HEIGHT_OFFSET = 8;
constexpr std::size_t CHANNELS_OFFSET = 12;
constexpr std::size_t COLORSPACE_OFFSET = 13;

} // namespace

std::array<std::uint8_t, QOI_HEADER_SIZE> encode_header(const header& hdr) noexcept {
    std::array<std::uint8_t, QOI_HEADER_SIZE> block{};
    std::copy(QOI_MAGIC.begin(), QOI_MAGIC.end(), block.begin());
    write_be32(block.data() + WIDTH_OFFSET, hdr.width);
    write_be32(block.data() + HEIGHT_OFFSET, hdr.height);
    block[CHANNELS_OFFSET] = static_cast<std::uint8_t>(hdr.channels);
    block[COLORSPACE_OFFSET] = static_cast<std::uint8_t>(hdr.colorspace);
    return block;
}

codec_error parse_header(std::span<const std::uint8_t> data, header& hdr) noexcept {
    if (data.size() < QOI_HEADER_SIZE) {
        return codec_error::end_of_stream;
    }

    if (!std::equal(QOI_MAGIC.begin(), QOI_MAGIC.end(), data.begin())) {
        return codec_error::invalid_magic;
    }

    header parsed;
    parsed.width = read_be32(data.data() + WIDTH_OFFSET);
    parsed.height = read_be32(data.data() + HEIGHT_OFFSET);

    switch (data[CHANNELS_OFFSET]) {
        case 3: parsed.channels = channel_format::rgb; break;
        case 4: parsed.channels = channel_format::rgba; break;
        default: return codec_error::invalid_tag;
    }

    switch (data[COLORSPACE_OFFSET]) {
        case 0: parsed.colorspace = qoikit::colorspace::srgb; break;
        case 1: parsed.colorspace = qoikit::colorspace::linear; break;
        default: return codec_error::invalid_tag;
    }

    hdr = parsed;
    return codec_error::none;
}

codec_result decode_header(std::span<const std::uint8_t> data, header& hdr) {
    switch (parse_header(data, hdr)) {
        case codec_error::none:
            return codec_result::success();
        case codec_error::end_of_stream:
            return codec_result::failure(codec_error::end_of_stream, "QOI header truncated");
        case codec_error::invalid_magic:
            return codec_result::failure(codec_error::invalid_magic, "Invalid QOI magic");
        default:
            break;
    }

    const auto channels = data[CHANNELS_OFFSET];
    if (channels != 3 && channels != 4) {
        return codec_result::failure(codec_error::invalid_tag,
            "Invalid QOI channel count: " + std::to_string(channels));
    }
    return codec_result::failure(codec_error::invalid_tag,
        "Invalid QOI colorspace: " + std::to_string(data[COLORSPACE_OFFSET]));
}

} // namespace qoikit
