#pragma once

#include <qoikit/qoikit.hpp>

#include <openssl/md5.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace qoikit_test {

inline std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

inline std::filesystem::path data_path(const char* filename) {
    return std::filesystem::path(TEST_DATA_DIR) / filename;
}

inline std::string md5_to_string(const unsigned char* digest) {
    std::string result;
    result.reserve(32);
    for (int i = 0; i < MD5_DIGEST_LENGTH; i++) {
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        result += buf;
    }
    return result;
}

inline std::string compute_md5(std::span<const std::uint8_t> bytes) {
    MD5_CTX ctx;
    MD5_Init(&ctx);
    MD5_Update(&ctx, bytes.data(), bytes.size());

    unsigned char digest[MD5_DIGEST_LENGTH];
    MD5_Final(digest, &ctx);

    return md5_to_string(digest);
}

inline std::span<const std::uint8_t> as_bytes(std::span<const qoikit::color> pixels) {
    return {reinterpret_cast<const std::uint8_t*>(pixels.data()), pixels.size() * sizeof(qoikit::color)};
}

inline std::vector<qoikit::color> pixels_from_bytes(std::span<const std::uint8_t> bytes) {
    std::vector<qoikit::color> pixels(bytes.size() / 4);
    for (std::size_t i = 0; i < pixels.size(); ++i) {
        pixels[i] = {bytes[i * 4 + 0], bytes[i * 4 + 1], bytes[i * 4 + 2], bytes[i * 4 + 3]};
    }
    return pixels;
}

// Bytes between the header and the end marker
inline std::vector<std::uint8_t> opcode_bytes(const std::vector<std::uint8_t>& encoded) {
    if (encoded.size() < qoikit::QOI_HEADER_SIZE + qoikit::QOI_END_MARKER_SIZE) {
        return {};
    }
    return {encoded.begin() + qoikit::QOI_HEADER_SIZE, encoded.end() - qoikit::QOI_END_MARKER_SIZE};
}

enum class content {
    noise,         // every channel random
    smooth,        // small deltas, mostly diff/luma opcodes
    palette,       // few colors, cache hits and runs
    mixed_alpha    // smooth color with occasional alpha changes
};

// Deterministic synthetic image for a given seed
inline qoikit::image make_image(std::uint32_t width, std::uint32_t height, content kind, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> step(-3, 3);
    std::uniform_int_distribution<int> pick(0, 7);

    qoikit::image img;
    img.set_size(width, height, (seed & 1) ? qoikit::colorspace::linear : qoikit::colorspace::srgb);

    std::vector<qoikit::color> palette(8);
    for (auto& c : palette) {
        c = {static_cast<std::uint8_t>(byte(rng)), static_cast<std::uint8_t>(byte(rng)),
             static_cast<std::uint8_t>(byte(rng)), static_cast<std::uint8_t>(pick(rng) == 0 ? 128 : 255)};
    }

    qoikit::color current{};
    for (auto& px : img.mutable_pixels()) {
        switch (kind) {
            case content::noise:
                current = {static_cast<std::uint8_t>(byte(rng)), static_cast<std::uint8_t>(byte(rng)),
                           static_cast<std::uint8_t>(byte(rng)), static_cast<std::uint8_t>(byte(rng))};
                break;
            case content::smooth:
                current.r = static_cast<std::uint8_t>(current.r + step(rng) * 4);
                current.g = static_cast<std::uint8_t>(current.g + step(rng));
                current.b = static_cast<std::uint8_t>(current.b + step(rng) * 2);
                break;
            case content::palette:
                if (pick(rng) < 3) {
                    current = palette[static_cast<std::size_t>(pick(rng))];
                }
                break;
            case content::mixed_alpha:
                current.r = static_cast<std::uint8_t>(current.r + step(rng));
                current.g = static_cast<std::uint8_t>(current.g + step(rng) * 9);
                current.b = static_cast<std::uint8_t>(current.b + step(rng));
                if (pick(rng) == 0) {
                    current.a = static_cast<std::uint8_t>(byte(rng));
                }
                break;
        }
        px = current;
    }

    return img;
}

// Source that hands out at most one byte per read
class trickle_source : public qoikit::byte_source {
public:
    explicit trickle_source(std::span<const std::uint8_t> data) : data_(data) {}

    std::size_t read(std::span<std::uint8_t> dest) override {
        if (dest.empty() || position_ >= data_.size()) {
            return 0;
        }
        dest[0] = data_[position_++];
        return 1;
    }

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t position_ = 0;
};

// Source that fails after delivering a fixed number of bytes
class failing_source : public qoikit::byte_source {
public:
    failing_source(std::span<const std::uint8_t> data, std::size_t fail_at) : data_(data), fail_at_(fail_at) {}

    std::size_t read(std::span<std::uint8_t> dest) override {
        if (position_ >= fail_at_ || position_ >= data_.size()) {
            failed_ = position_ >= fail_at_;
            return 0;
        }
        dest[0] = data_[position_++];
        return 1;
    }

    [[nodiscard]] bool good() const noexcept override { return !failed_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t fail_at_;
    std::size_t position_ = 0;
    bool failed_ = false;
};

// Sink that rejects every write after a byte budget is spent
class limited_sink : public qoikit::byte_sink {
public:
    explicit limited_sink(std::size_t budget) : budget_(budget) {}

    bool write(std::span<const std::uint8_t> data) override {
        if (data.size() > budget_) {
            budget_ = 0;
            return false;
        }
        budget_ -= data.size();
        written_.insert(written_.end(), data.begin(), data.end());
        return true;
    }

    [[nodiscard]] const std::vector<std::uint8_t>& written() const noexcept { return written_; }

private:
    std::size_t budget_;
    std::vector<std::uint8_t> written_;
};

} // namespace qoikit_test
