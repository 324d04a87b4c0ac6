#ifndef QOIKIT_COLOR_CACHE_HPP_
#define QOIKIT_COLOR_CACHE_HPP_

#include <qoikit/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace qoikit {

inline constexpr std::size_t QOI_CACHE_SIZE = 64;

/**
 * Cache slot of a color. Part of the wire format: encoder and decoder
 * must agree on it exactly.
 */
[[nodiscard]] constexpr std::uint8_t color_hash(const color& c) noexcept {
    return static_cast<std::uint8_t>((static_cast<unsigned>(c.r) * 3 + static_cast<unsigned>(c.g) * 5 +
                                      static_cast<unsigned>(c.b) * 7 + static_cast<unsigned>(c.a) * 11) %
                                     QOI_CACHE_SIZE);
}

/**
 * Direct-mapped table of recently seen colors.
 * Every slot starts as (0,0,0,0); a colliding color overwrites the slot.
 */
class color_cache {
public:
    [[nodiscard]] const color& lookup(std::uint8_t index) const noexcept {
        return slots_[index % QOI_CACHE_SIZE];
    }

    void store(const color& c) noexcept { slots_[color_hash(c)] = c; }

    [[nodiscard]] bool contains(const color& c) const noexcept { return slots_[color_hash(c)] == c; }

    void reset() noexcept { slots_.fill(color{0, 0, 0, 0}); }

    [[nodiscard]] std::span<const color, QOI_CACHE_SIZE> slots() const noexcept { return slots_; }

    friend bool operator==(const color_cache&, const color_cache&) = default;

private:
    std::array<color, QOI_CACHE_SIZE> slots_ = make_empty();

    static constexpr std::array<color, QOI_CACHE_SIZE> make_empty() noexcept {
        std::array<color, QOI_CACHE_SIZE> empty{};
        empty.fill(color{0, 0, 0, 0});
        return empty;
    }
};

} // namespace qoikit

#endif // QOIKIT_COLOR_CACHE_HPP_
