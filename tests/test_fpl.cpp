/**
 * @file test_fpl.cpp
 * @brief Unit tests for float-point lossless decoding.
 */

#include <catch2/catch_test_macros.hpp>
#include <lercdec/fpl.hpp>

#include <cstring>
#include <vector>

using namespace lercdec;

static void put_plane(std::vector<std::uint8_t>& out, std::uint8_t byte_index, std::uint8_t level,
                      const std::vector<std::uint8_t>& payload) {
    out.push_back(byte_index);
    out.push_back(level);
    auto n = static_cast<std::uint32_t>(payload.size());
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>(n >> (8 * i)));
    }
    out.insert(out.end(), payload.begin(), payload.end());
}

static float float_at(const std::vector<std::uint8_t>& bytes, std::size_t i) {
    float f = 0.0F;
    std::memcpy(&f, bytes.data() + i * 4, 4);
    return f;
}

// ============================================================================
// Helpers
// ============================================================================

TEST_CASE("FPL restore_sequence", "[fpl]") {
    SECTION("level 1 is a prefix sum") {
        std::uint8_t data[] = {1, 2, 3, 4, 5};
        fpl_restore_sequence(data, 5, 1);
        REQUIRE(data[0] == 1);
        REQUIRE(data[1] == 3);
        REQUIRE(data[2] == 6);
        REQUIRE(data[3] == 10);
        REQUIRE(data[4] == 15);
    }

    SECTION("level 0 leaves data alone") {
        std::uint8_t data[] = {9, 8, 7};
        fpl_restore_sequence(data, 3, 0);
        REQUIRE(data[0] == 9);
        REQUIRE(data[2] == 7);
    }

    SECTION("sums wrap at 8 bits") {
        std::uint8_t data[] = {0xFF, 0x02};
        fpl_restore_sequence(data, 2, 1);
        REQUIRE(data[1] == 0x01);
    }
}

TEST_CASE("FPL float bit order", "[fpl]") {
    REQUIRE(fpl_undo_move_bits_to_front(0x7F400000U) == 0x3FC00000U);
    REQUIRE(fpl_undo_move_bits_to_front(0x80800000U) == 0xC0000000U);
    REQUIRE(fpl_add_float(0x01000000U, 0x7F000000U) == 0x80000000U);
    REQUIRE(fpl_add_double(0x0000000000000001ULL, 0x3FF0000000000000ULL) ==
            0x3FF0000000000001ULL);
}

TEST_CASE("FPL PackBits", "[fpl]") {
    std::vector<std::uint8_t> out;

    SECTION("literal run") {
        std::uint8_t data[] = {0x02, 0xAA, 0xBB, 0xCC};
        REQUIRE(fpl_decode_packbits(data, sizeof(data), 3, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0xAA, 0xBB, 0xCC});
    }

    SECTION("repeat run") {
        std::uint8_t data[] = {0x81, 0x42};
        REQUIRE(fpl_decode_packbits(data, sizeof(data), 3, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0x42, 0x42, 0x42});
    }

    SECTION("size mismatch") {
        std::uint8_t data[] = {0x81, 0x42};
        REQUIRE(fpl_decode_packbits(data, sizeof(data), 4, out) == Error::InvalidFpl);
    }

    SECTION("truncated literal") {
        std::uint8_t data[] = {0x03, 0xAA};
        REQUIRE(fpl_decode_packbits(data, sizeof(data), 4, out) == Error::Underflow);
    }
}

// ============================================================================
// Streams
// ============================================================================

TEST_CASE("FPL stream without predictor", "[fpl]") {
    // 1.5f and -2.0f, stored exponent|sign|mantissa
    std::vector<std::uint8_t> stream = {0};
    put_plane(stream, 0, 0, {1, 0x00, 0x02, 0x00, 0x00, 0x00});
    put_plane(stream, 1, 0, {2, 0x00, 0x00});
    put_plane(stream, 2, 0, {2, 0x40, 0x80});
    put_plane(stream, 3, 0, {3, 0x01, 0x7F, 0x80});

    ByteReader reader(stream.data(), stream.size());
    std::vector<std::uint8_t> out;
    REQUIRE(fpl_decode(reader, false, 2, 1, 1, out) == Error::Ok);
    REQUIRE(reader.remaining() == 0);
    REQUIRE(out.size() == 8);
    REQUIRE(float_at(out, 0) == 1.5F);
    REQUIRE(float_at(out, 1) == -2.0F);
}

TEST_CASE("FPL stream with delta predictor", "[fpl]") {
    std::vector<std::uint8_t> stream = {1};
    put_plane(stream, 0, 0, {2, 0x00, 0x00});
    put_plane(stream, 1, 0, {2, 0x00, 0x00});
    put_plane(stream, 2, 0, {2, 0x00, 0x00});
    put_plane(stream, 3, 1, {2, 0x7F, 0x82});

    ByteReader reader(stream.data(), stream.size());
    std::vector<std::uint8_t> out;
    REQUIRE(fpl_decode(reader, false, 2, 1, 1, out) == Error::Ok);
    REQUIRE(float_at(out, 0) == 1.0F);
    REQUIRE(float_at(out, 1) == 2.0F);
}

TEST_CASE("FPL stream errors", "[fpl]") {
    std::vector<std::uint8_t> out;

    SECTION("unknown predictor") {
        std::vector<std::uint8_t> stream = {3};
        ByteReader reader(stream.data(), stream.size());
        REQUIRE(fpl_decode(reader, false, 1, 1, 1, out) == Error::InvalidFpl);
    }

    SECTION("unknown plane mode") {
        std::vector<std::uint8_t> stream = {0};
        put_plane(stream, 0, 0, {7, 0x00});
        ByteReader reader(stream.data(), stream.size());
        REQUIRE(fpl_decode(reader, false, 1, 1, 1, out) == Error::InvalidFpl);
    }

    SECTION("byte index out of range") {
        std::vector<std::uint8_t> stream = {0};
        put_plane(stream, 4, 0, {2, 0x00});
        ByteReader reader(stream.data(), stream.size());
        REQUIRE(fpl_decode(reader, false, 1, 1, 1, out) == Error::InvalidFpl);
    }

    SECTION("truncated plane") {
        std::vector<std::uint8_t> stream = {0};
        put_plane(stream, 0, 0, {2, 0x00, 0x00});
        stream.pop_back();
        ByteReader reader(stream.data(), stream.size());
        REQUIRE(fpl_decode(reader, false, 2, 1, 1, out) == Error::Underflow);
    }
}
