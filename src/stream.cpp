#include <qoikit/stream.hpp>

#include <algorithm>
#include <cstring>
#include <istream>
#include <new>
#include <ostream>

namespace qoikit {

bool read_exact(byte_source& src, std::span<std::uint8_t> dest) {
    std::size_t filled = 0;
    while (filled < dest.size()) {
        const std::size_t n = src.read(dest.subspan(filled));
        if (n == 0) {
            return false;
        }
        filled += std::min(n, dest.size() - filled);
    }
    return true;
}

std::size_t memory_source::read(std::span<std::uint8_t> dest) {
    const std::size_t count = std::min(dest.size(), remaining());
    if (count > 0) {
        std::memcpy(dest.data(), data_.data() + position_, count);
        position_ += count;
    }
    return count;
}

bool memory_sink::write(std::span<const std::uint8_t> data) {
    try {
        target_->insert(target_->end(), data.begin(), data.end());
    } catch (const std::bad_alloc&) {
        return false;
    }
    return true;
}

std::size_t istream_source::read(std::span<std::uint8_t> dest) {
    if (dest.empty() || !in_.good()) {
        return 0;
    }
    in_.read(reinterpret_cast<char*>(dest.data()), static_cast<std::streamsize>(dest.size()));
    return static_cast<std::size_t>(in_.gcount());
}

bool istream_source::good() const noexcept {
    return !in_.bad();
}

bool ostream_sink::write(std::span<const std::uint8_t> data) {
    out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return out_.good();
}

bool ostream_sink::flush() {
    out_.flush();
    return out_.good();
}

} // namespace qoikit
