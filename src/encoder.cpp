#include <qoikit/encoder.hpp>

#include <algorithm>
#include <new>
#include <string>
#include <utility>

namespace qoikit {

codec_result stream_encoder::write(std::span<const std::uint8_t> bytes) {
    if (!sink_.write(bytes)) {
        active_ = false;
        return codec_result::failure(codec_error::io_error, "QOI sink rejected write");
    }
    return codec_result::success();
}

codec_result stream_encoder::begin(const header& hdr) {
    state_.reset();
    header_ = hdr;
    pushed_ = 0;
    active_ = true;

    const auto block = encode_header(hdr);
    return write(block);
}

codec_result stream_encoder::push(const color& px) {
    if (!active_) {
        return codec_result::failure(codec_error::invalid_state, "QOI encoder not started");
    }
    if (pushed_ >= header_.pixel_count()) {
        return codec_result::failure(codec_error::invalid_state,
            "QOI encoder received more pixels than the header declares");
    }

    op_buffer buffer;
    const std::size_t written = encode_pixel(state_, px, buffer);
    ++pushed_;

    if (written == 0) {
        return codec_result::success();
    }
    return write(std::span<const std::uint8_t>(buffer.data(), written));
}

codec_result stream_encoder::push(std::span<const color> pixels) {
    for (const auto& px : pixels) {
        auto result = push(px);
        if (!result) return result;
    }
    return codec_result::success();
}

codec_result stream_encoder::finish() {
    if (!active_) {
        return codec_result::failure(codec_error::invalid_state, "QOI encoder not started");
    }
    if (pushed_ != header_.pixel_count()) {
        active_ = false;
        return codec_result::failure(codec_error::invalid_state,
            "QOI encoder finished after " + std::to_string(pushed_) + " of " +
            std::to_string(header_.pixel_count()) + " pixels");
    }

    op_buffer buffer;
    const std::size_t written = flush_run(state_, buffer);
    if (written > 0) {
        auto result = write(std::span<const std::uint8_t>(buffer.data(), written));
        if (!result) return result;
    }

    auto result = write(QOI_END_MARKER);
    if (!result) return result;

    active_ = false;
    if (!sink_.flush()) {
        return codec_result::failure(codec_error::io_error, "QOI sink flush failed");
    }
    return codec_result::success();
}

header make_header(image_view img) noexcept {
    const bool has_alpha = std::any_of(img.pixels.begin(), img.pixels.end(),
                                       [](const color& px) { return px.a != 255; });

    header hdr;
    hdr.width = img.width;
    hdr.height = img.height;
    hdr.channels = has_alpha ? channel_format::rgba : channel_format::rgb;
    hdr.colorspace = img.colorspace;
    return hdr;
}

codec_result encode(image_view img, byte_sink& sink) {
    if (!img.is_consistent()) {
        return codec_result::failure(codec_error::invalid_data,
            "Pixel count does not match image dimensions");
    }

    stream_encoder encoder(sink);

    auto result = encoder.begin(make_header(img));
    if (!result) return result;

    result = encoder.push(img.pixels);
    if (!result) return result;

    return encoder.finish();
}

codec_result encode(image_view img, std::vector<std::uint8_t>& out) {
    if (!img.is_consistent()) {
        return codec_result::failure(codec_error::invalid_data,
            "Pixel count does not match image dimensions");
    }

    std::vector<std::uint8_t> buffer;
    try {
        buffer.reserve(QOI_HEADER_SIZE + img.pixels.size() + QOI_END_MARKER_SIZE);
    } catch (const std::bad_alloc&) {
        return codec_result::failure(codec_error::out_of_memory, "Failed to allocate QOI buffer");
    }

    memory_sink sink(buffer);
    auto result = encode(img, sink);
    if (!result) {
        if (result.error == codec_error::io_error) {
            return codec_result::failure(codec_error::out_of_memory, "Failed to grow QOI buffer");
        }
        return result;
    }

    out = std::move(buffer);
    return codec_result::success();
}

} // namespace qoikit
