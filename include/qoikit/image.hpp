#ifndef QOIKIT_IMAGE_HPP_
#define QOIKIT_IMAGE_HPP_

#include <qoikit/qoikit_export.h>
#include <qoikit/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace qoikit {

// ============================================================================
// Image View
// ============================================================================

/**
 * Borrowed, read-only view of an RGBA pixel grid.
 * The viewed pixels must outlive the view.
 */
struct image_view {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    qoikit::colorspace colorspace = qoikit::colorspace::srgb;
    std::span<const color> pixels;

    /**
     * Number of pixels implied by the dimensions.
     * Computed in 64 bits so it cannot wrap.
     */
    [[nodiscard]] constexpr std::uint64_t pixel_count() const noexcept {
        return static_cast<std::uint64_t>(width) * static_cast<std::uint64_t>(height);
    }

    /**
     * True when the pixel span holds exactly width * height pixels.
     */
    [[nodiscard]] constexpr bool is_consistent() const noexcept {
        return static_cast<std::uint64_t>(pixels.size()) == pixel_count();
    }
};

// ============================================================================
// Image
// ============================================================================

/**
 * Owning RGBA image. Pixels are stored row-major, top to bottom.
 */
class QOIKIT_EXPORT image {
public:
    image() = default;
    ~image() = default;

    image(const image&) = default;
    image& operator=(const image&) = default;
    image(image&&) noexcept = default;
    image& operator=(image&&) noexcept = default;

    /**
     * Resize the image and reset every pixel to transparent black.
     * Rejects dimensions whose pixel buffer cannot be addressed or allocated.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @param space Colorspace tag carried by the image
     * @return true if allocation succeeded; the image is unchanged otherwise
     */
    bool set_size(std::uint32_t width, std::uint32_t height, qoikit::colorspace space);

    void set_colorspace(qoikit::colorspace space) noexcept { colorspace_ = space; }

    // Accessors (read-only)
    [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
    [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
    [[nodiscard]] qoikit::colorspace colorspace() const noexcept { return colorspace_; }
    [[nodiscard]] std::span<const color> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::size_t pixel_count() const noexcept { return pixels_.size(); }

    // Mutable access
    [[nodiscard]] std::span<color> mutable_pixels() noexcept { return pixels_; }

    [[nodiscard]] color& at(std::uint32_t x, std::uint32_t y) noexcept {
        return pixels_[static_cast<std::size_t>(y) * width_ + x];
    }
    [[nodiscard]] const color& at(std::uint32_t x, std::uint32_t y) const noexcept {
        return pixels_[static_cast<std::size_t>(y) * width_ + x];
    }

    [[nodiscard]] image_view view() const noexcept {
        return {width_, height_, colorspace_, pixels_};
    }

    friend bool operator==(const image&, const image&) = default;

private:
    std::vector<color> pixels_;
    std::uint32_t width_ = 0;
    std::uint32_t height_ = 0;
    qoikit::colorspace colorspace_ = qoikit::colorspace::srgb;
};

} // namespace qoikit

#endif // QOIKIT_IMAGE_HPP_
