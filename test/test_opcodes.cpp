#include <doctest/doctest.h>
#include <qoikit/qoikit.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace {

// Encode one pixel from a chosen previous pixel and return the emitted bytes
std::vector<std::uint8_t> emit(qoikit::engine_state& state, const qoikit::color& px) {
    qoikit::op_buffer buffer{};
    const std::size_t n = qoikit::encode_pixel(state, px, buffer);
    return {buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n)};
}

qoikit::engine_state state_after(const qoikit::color& previous) {
    qoikit::engine_state state;
    state.previous = previous;
    return state;
}

qoikit::pixel_run apply(qoikit::engine_state& state, std::vector<std::uint8_t> op) {
    return qoikit::decode_opcode(state, op);
}

} // namespace

TEST_CASE("Opcodes: classification") {
    for (int value = 0; value < 256; ++value) {
        const auto byte = static_cast<std::uint8_t>(value);
        const auto op = qoikit::classify_opcode(byte);

        if (byte == 0xFE) {
            CHECK(op == qoikit::opcode::rgb);
        } else if (byte == 0xFF) {
            CHECK(op == qoikit::opcode::rgba);
        } else if (byte < 0x40) {
            CHECK(op == qoikit::opcode::index);
        } else if (byte < 0x80) {
            CHECK(op == qoikit::opcode::diff);
        } else if (byte < 0xC0) {
            CHECK(op == qoikit::opcode::luma);
        } else {
            CHECK(op == qoikit::opcode::run);
        }
    }

    CHECK(qoikit::opcode_size(qoikit::opcode::luma) == 2);
    CHECK(qoikit::opcode_size(qoikit::opcode::rgb) == 4);
    CHECK(qoikit::opcode_size(qoikit::opcode::rgba) == 5);
}

TEST_CASE("Opcodes: encoder priority") {
    const qoikit::color prev{10, 10, 10, 255};

    SUBCASE("Run beats cache hit") {
        auto state = state_after(prev);
        state.cache.store(prev);
        CHECK(emit(state, prev).empty());
        CHECK(state.run == 1);
    }

    SUBCASE("Cache hit beats small delta") {
        const qoikit::color px{11, 10, 10, 255};
        auto state = state_after(prev);
        state.cache.store(px);
        REQUIRE(qoikit::color_hash(px) == 14);
        CHECK(emit(state, px) == std::vector<std::uint8_t>{0x0E});
    }

    SUBCASE("Small delta beats luma") {
        // dr=1 dg=-1 db=0 also fits the luma ranges
        auto state = state_after(prev);
        CHECK(emit(state, {11, 9, 10, 255}) == std::vector<std::uint8_t>{0x76});
    }

    SUBCASE("Luma beats rgb") {
        // dg=5, dr-dg=5, db-dg=-3
        auto state = state_after(prev);
        CHECK(emit(state, {20, 15, 12, 255}) == std::vector<std::uint8_t>{0xA5, 0xD5});
    }

    SUBCASE("Rgb when deltas are too wide") {
        auto state = state_after(prev);
        CHECK(emit(state, {100, 10, 10, 255}) == std::vector<std::uint8_t>{0xFE, 100, 10, 10});
    }

    SUBCASE("Rgba whenever alpha changes") {
        auto state = state_after(prev);
        CHECK(emit(state, {10, 10, 11, 254}) == std::vector<std::uint8_t>{0xFF, 10, 10, 11, 254});
    }

    SUBCASE("Deltas wrap around") {
        auto state = state_after({255, 255, 255, 255});
        CHECK(emit(state, {0, 0, 0, 255}) == std::vector<std::uint8_t>{0x7F});
    }

    SUBCASE("Luma edges") {
        auto state = state_after({0, 0, 0, 255});
        // dg=-32, dr-dg=-8, db-dg=7
        CHECK(emit(state, {216, 224, 231, 255}) == std::vector<std::uint8_t>{0x80, 0x0F});

        state = state_after({0, 0, 0, 255});
        // dg=32 is one past the luma range
        CHECK(emit(state, {32, 32, 32, 255}) == std::vector<std::uint8_t>{0xFE, 32, 32, 32});
    }
}

TEST_CASE("Opcodes: cache updates on encode") {
    qoikit::engine_state state;
    const qoikit::color a{40, 50, 60, 255};
    const qoikit::color b{41, 50, 60, 255};

    emit(state, a);
    CHECK(state.cache.contains(a));

    emit(state, b);
    CHECK(state.cache.contains(b));

    const auto before = state.cache;
    CHECK(emit(state, a) == std::vector<std::uint8_t>{qoikit::color_hash(a)});
    CHECK(state.cache == before);

    // Run pixels never touch the cache
    emit(state, a);
    emit(state, a);
    CHECK(state.run == 2);
    CHECK(state.cache == before);
}

TEST_CASE("Opcodes: run coalescing") {
    qoikit::engine_state state;
    const qoikit::color black{0, 0, 0, 255};

    std::vector<std::uint8_t> out;
    for (int i = 0; i < 63; ++i) {
        auto bytes = emit(state, black);
        out.insert(out.end(), bytes.begin(), bytes.end());
    }

    // The 62nd pixel closes a full run; the 63rd opens a new one
    CHECK(out == std::vector<std::uint8_t>{0xFD});
    CHECK(state.run == 1);

    qoikit::op_buffer buffer{};
    REQUIRE(qoikit::flush_run(state, buffer) == 1);
    CHECK(buffer[0] == 0xC0);
    CHECK(state.run == 0);
    CHECK(qoikit::flush_run(state, buffer) == 0);

    SUBCASE("Color change flushes the run first") {
        auto s = state_after({5, 5, 5, 255});
        emit(s, {5, 5, 5, 255});
        emit(s, {5, 5, 5, 255});
        CHECK(emit(s, {6, 5, 5, 255}) == std::vector<std::uint8_t>{0xC1, 0x7A});
    }
}

TEST_CASE("Opcodes: decode") {
    SUBCASE("Rgb keeps alpha") {
        auto state = state_after({1, 2, 3, 77});
        auto run = apply(state, {0xFE, 9, 8, 7});
        CHECK(run.value == qoikit::color{9, 8, 7, 77});
        CHECK(run.count == 1);
        CHECK(state.previous == run.value);
        CHECK(state.cache.contains(run.value));
    }

    SUBCASE("Rgba") {
        qoikit::engine_state state;
        auto run = apply(state, {0xFF, 9, 8, 7, 6});
        CHECK(run.value == qoikit::color{9, 8, 7, 6});
    }

    SUBCASE("Index") {
        qoikit::engine_state state;
        const qoikit::color c{1, 0, 255, 255};
        state.cache.store(c);
        auto run = apply(state, {49});
        CHECK(run.value == c);
        CHECK(state.previous == c);
    }

    SUBCASE("Diff wraps") {
        auto state = state_after({255, 255, 255, 255});
        auto run = apply(state, {0x7F});
        CHECK(run.value == qoikit::color{0, 0, 0, 255});
    }

    SUBCASE("Luma") {
        auto state = state_after({10, 10, 10, 255});
        auto run = apply(state, {0xA5, 0xD5});
        CHECK(run.value == qoikit::color{20, 15, 12, 255});
    }

    SUBCASE("Run repeats without touching the cache") {
        auto state = state_after({3, 3, 3, 255});
        const auto before = state.cache;

        auto run = apply(state, {0xFD});
        CHECK(run.value == qoikit::color{3, 3, 3, 255});
        CHECK(run.count == 62);
        CHECK(state.cache == before);

        CHECK(apply(state, {0xC0}).count == 1);
    }

    SUBCASE("Incomplete opcode produces nothing") {
        qoikit::engine_state state;
        CHECK(apply(state, {0xFF, 1, 2}).count == 0);
        CHECK(apply(state, {}).count == 0);
        CHECK(state.cache == qoikit::color_cache{});
    }
}
