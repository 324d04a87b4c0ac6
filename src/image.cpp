#include <qoikit/image.hpp>

#include <limits>
#include <new>
#include <utility>

namespace qoikit {

bool image::set_size(std::uint32_t width, std::uint32_t height, qoikit::colorspace space) {
    const auto count = static_cast<std::uint64_t>(width) * static_cast<std::uint64_t>(height);

    // Check the pixel count is addressable before touching the allocator
    if (count > std::numeric_limits<std::size_t>::max() / sizeof(color)) {
        return false;
    }
    if (count > pixels_.max_size()) {
        return false;
    }

    // Additional sanity check - limit to reasonable maximum (4GB of pixels)
    constexpr std::uint64_t MAX_BUFFER_SIZE = 4ULL * 1024ULL * 1024ULL * 1024ULL;
    if (count * sizeof(color) > MAX_BUFFER_SIZE) {
        return false;
    }

    std::vector<color> pixels;
    try {
        pixels.assign(static_cast<std::size_t>(count), color{0, 0, 0, 0});
    } catch (const std::bad_alloc&) {
        return false;
    }

    pixels_ = std::move(pixels);
    width_ = width;
    height_ = height;
    colorspace_ = space;

    return true;
}

} // namespace qoikit
