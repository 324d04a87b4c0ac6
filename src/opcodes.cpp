#include <qoikit/opcodes.hpp>

namespace qoikit {

namespace {

// Signed fields are stored with a bias: a Bits-wide field holds
// [-2^(Bits-1), 2^(Bits-1) - 1] as value + 2^(Bits-1).
template <int Bits>
constexpr int field_bias = 1 << (Bits - 1);

template <int Bits>
constexpr std::uint8_t field_mask = static_cast<std::uint8_t>((1 << Bits) - 1);

template <int Bits>
constexpr bool fits_field(int value) noexcept {
    return value >= -field_bias<Bits> && value < field_bias<Bits>;
}

template <int Bits>
constexpr std::uint8_t pack_field(int value) noexcept {
    return static_cast<std::uint8_t>(value + field_bias<Bits>) & field_mask<Bits>;
}

template <int Bits>
constexpr int unpack_field(std::uint8_t bits) noexcept {
    return static_cast<int>(bits & field_mask<Bits>) - field_bias<Bits>;
}

static_assert(pack_field<2>(-2) == 0 && pack_field<2>(1) == 3);
static_assert(unpack_field<4>(0) == -8 && unpack_field<4>(15) == 7);
static_assert(unpack_field<6>(pack_field<6>(-32)) == -32);

// Channel difference taken modulo 256, reinterpreted as signed
constexpr int wrapping_delta(std::uint8_t now, std::uint8_t before) noexcept {
    return static_cast<std::int8_t>(static_cast<std::uint8_t>(now - before));
}

constexpr std::uint8_t wrapping_add(std::uint8_t channel, int delta) noexcept {
    return static_cast<std::uint8_t>(channel + delta);
}

static_assert(wrapping_delta(0, 255) == 1);
static_assert(wrapping_add(255, 1) == 0);

std::size_t emit_run(engine_state& state, std::uint8_t* out) noexcept {
    out[0] = static_cast<std::uint8_t>(QOI_OP_RUN | (state.run - 1));
    state.run = 0;
    return 1;
}

// Opcode for a pixel that differs from the previous one
std::size_t emit_pixel(engine_state& state, const color& px, std::uint8_t* out) noexcept {
    const std::uint8_t hash = color_hash(px);
    if (state.cache.lookup(hash) == px) {
        out[0] = static_cast<std::uint8_t>(QOI_OP_INDEX | hash);
        return 1;
    }

    state.cache.store(px);

    const color& prev = state.previous;
    if (px.a != prev.a) {
        out[0] = QOI_OP_RGBA;
        out[1] = px.r;
        out[2] = px.g;
        out[3] = px.b;
        out[4] = px.a;
        return 5;
    }

    const int dr = wrapping_delta(px.r, prev.r);
    const int dg = wrapping_delta(px.g, prev.g);
    const int db = wrapping_delta(px.b, prev.b);

    if (fits_field<2>(dr) && fits_field<2>(dg) && fits_field<2>(db)) {
        out[0] = static_cast<std::uint8_t>(QOI_OP_DIFF | (pack_field<2>(dr) << 4) |
                                           (pack_field<2>(dg) << 2) | pack_field<2>(db));
        return 1;
    }

    // Relative deltas wrap like the channels they are added back to
    const int dr_dg = static_cast<std::int8_t>(static_cast<std::uint8_t>(dr - dg));
    const int db_dg = static_cast<std::int8_t>(static_cast<std::uint8_t>(db - dg));

    if (fits_field<6>(dg) && fits_field<4>(dr_dg) && fits_field<4>(db_dg)) {
        out[0] = static_cast<std::uint8_t>(QOI_OP_LUMA | pack_field<6>(dg));
        out[1] = static_cast<std::uint8_t>((pack_field<4>(dr_dg) << 4) | pack_field<4>(db_dg));
        return 2;
    }

    out[0] = QOI_OP_RGB;
    out[1] = px.r;
    out[2] = px.g;
    out[3] = px.b;
    return 4;
}

} // namespace

std::size_t encode_pixel(engine_state& state, const color& px, op_buffer& out) noexcept {
    std::size_t written = 0;

    if (px == state.previous) {
        ++state.run;
        if (state.run == QOI_MAX_RUN) {
            written += emit_run(state, out.data());
        }
        return written;
    }

    if (state.run > 0) {
        written += emit_run(state, out.data());
    }

    written += emit_pixel(state, px, out.data() + written);
    state.previous = px;
    return written;
}

std::size_t flush_run(engine_state& state, op_buffer& out) noexcept {
    if (state.run == 0) {
        return 0;
    }
    return emit_run(state, out.data());
}

pixel_run decode_opcode(engine_state& state, std::span<const std::uint8_t> op) noexcept {
    if (op.empty()) {
        return {state.previous, 0};
    }

    const opcode kind = classify_opcode(op[0]);
    if (op.size() < opcode_size(kind)) {
        return {state.previous, 0};
    }

    color px = state.previous;

    switch (kind) {
        case opcode::rgb:
            px.r = op[1];
            px.g = op[2];
            px.b = op[3];
            break;

        case opcode::rgba:
            px.r = op[1];
            px.g = op[2];
            px.b = op[3];
            px.a = op[4];
            break;

        case opcode::index:
            px = state.cache.lookup(static_cast<std::uint8_t>(op[0] & 0x3F));
            break;

        case opcode::diff:
            px.r = wrapping_add(px.r, unpack_field<2>(static_cast<std::uint8_t>(op[0] >> 4)));
            px.g = wrapping_add(px.g, unpack_field<2>(static_cast<std::uint8_t>(op[0] >> 2)));
            px.b = wrapping_add(px.b, unpack_field<2>(op[0]));
            break;

        case opcode::luma: {
            const int dg = unpack_field<6>(op[0]);
            const int dr_dg = unpack_field<4>(static_cast<std::uint8_t>(op[1] >> 4));
            const int db_dg = unpack_field<4>(op[1]);
            px.r = wrapping_add(px.r, dg + dr_dg);
            px.g = wrapping_add(px.g, dg);
            px.b = wrapping_add(px.b, dg + db_dg);
            break;
        }

        case opcode::run:
            // Repeats the current color; the cache is left alone
            return {px, static_cast<std::uint32_t>(op[0] & 0x3F) + 1};
    }

    state.cache.store(px);
    state.previous = px;
    return {px, 1};
}

} // namespace qoikit
