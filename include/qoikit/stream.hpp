#ifndef QOIKIT_STREAM_HPP_
#define QOIKIT_STREAM_HPP_

#include <qoikit/qoikit_export.h>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <vector>

namespace qoikit {

// ============================================================================
// Byte Source Interface
// ============================================================================

/**
 * Abstract source of encoded bytes.
 * Implement this interface to decode from files, sockets or any other
 * sequential input. The decoder never seeks and never reads ahead of the
 * opcode it is currently completing.
 */
class QOIKIT_EXPORT byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * Read up to dest.size() bytes. May block.
     * @param dest Destination buffer
     * @return Number of bytes read; 0 means no more data
     */
    virtual std::size_t read(std::span<std::uint8_t> dest) = 0;

    /**
     * Whether a short read was a clean end of data (true) or an I/O failure (false).
     */
    [[nodiscard]] virtual bool good() const noexcept { return true; }
};

/**
 * Read exactly dest.size() bytes, retrying partial reads.
 * @return true if the buffer was filled
 */
[[nodiscard]] QOIKIT_EXPORT bool read_exact(byte_source& src, std::span<std::uint8_t> dest);

// ============================================================================
// Byte Sink Interface
// ============================================================================

/**
 * Abstract destination for encoded bytes.
 */
class QOIKIT_EXPORT byte_sink {
public:
    virtual ~byte_sink() = default;

    /**
     * Append bytes. May block.
     * @param data Bytes to append
     * @return true if every byte was accepted
     */
    virtual bool write(std::span<const std::uint8_t> data) = 0;

    /**
     * Push buffered bytes to the underlying device.
     * Called once after the end marker has been written.
     */
    virtual bool flush() { return true; }
};

// ============================================================================
// Memory Implementations
// ============================================================================

/**
 * Source reading from a caller-owned byte buffer.
 */
class QOIKIT_EXPORT memory_source : public byte_source {
public:
    explicit memory_source(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    std::size_t read(std::span<std::uint8_t> dest) override;

    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - position_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t position_ = 0;
};

/**
 * Sink appending to a byte vector.
 */
class QOIKIT_EXPORT memory_sink : public byte_sink {
public:
    memory_sink() = default;
    explicit memory_sink(std::vector<std::uint8_t>& target) noexcept : target_(&target) {}

    memory_sink(const memory_sink&) = delete;
    memory_sink& operator=(const memory_sink&) = delete;

    bool write(std::span<const std::uint8_t> data) override;

    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return *target_; }

private:
    std::vector<std::uint8_t> owned_;
    std::vector<std::uint8_t>* target_ = &owned_;
};

// ============================================================================
// Standard Stream Adapters
// ============================================================================

/**
 * Source reading from a std::istream opened in binary mode.
 */
class QOIKIT_EXPORT istream_source : public byte_source {
public:
    explicit istream_source(std::istream& in) noexcept : in_(in) {}

    std::size_t read(std::span<std::uint8_t> dest) override;
    [[nodiscard]] bool good() const noexcept override;

private:
    std::istream& in_;
};

/**
 * Sink writing to a std::ostream opened in binary mode.
 */
class QOIKIT_EXPORT ostream_sink : public byte_sink {
public:
    explicit ostream_sink(std::ostream& out) noexcept : out_(out) {}

    bool write(std::span<const std::uint8_t> data) override;
    bool flush() override;

private:
    std::ostream& out_;
};

} // namespace qoikit

#endif // QOIKIT_STREAM_HPP_
