/**
 * @file test_bit_stuffer.cpp
 * @brief Unit tests for the bit-stuffed block decoder.
 */

#include <catch2/catch_test_macros.hpp>
#include <lercdec/bit_stuffer.hpp>

#include "blob_builder.hpp"

#include <vector>

using namespace lercdec;
using lercdec::test::BlobBuilder;

static Error decode_block(BitStuffer& stuffer, const std::vector<std::uint8_t>& block,
                          std::size_t max_count, int version, std::size_t* consumed = nullptr) {
    ByteReader reader(block.data(), block.size());
    Error status = stuffer.decode(reader, max_count, version);
    if (consumed != nullptr) {
        *consumed = reader.position();
    }
    return status;
}

TEST_CASE("BitStuffer decode_uint", "[bitstuffer]") {
    std::uint8_t data[] = {0x78, 0x56, 0x34, 0x12};
    std::uint32_t value = 0;

    SECTION("four bytes") {
        ByteReader reader(data, 4);
        REQUIRE(BitStuffer::decode_uint(reader, 4, value) == Error::Ok);
        REQUIRE(value == 0x12345678U);
    }

    SECTION("two bytes") {
        ByteReader reader(data, 4);
        REQUIRE(BitStuffer::decode_uint(reader, 2, value) == Error::Ok);
        REQUIRE(value == 0x5678U);
    }

    SECTION("one byte") {
        ByteReader reader(data, 4);
        REQUIRE(BitStuffer::decode_uint(reader, 1, value) == Error::Ok);
        REQUIRE(value == 0x78U);
    }

    SECTION("unsupported width") {
        ByteReader reader(data, 4);
        REQUIRE(BitStuffer::decode_uint(reader, 3, value) == Error::InvalidBitStuffing);
    }
}

TEST_CASE("BitStuffer tail bytes", "[bitstuffer]") {
    REQUIRE(BitStuffer::num_tail_bytes_not_needed(3, 2) == 3);
    REQUIRE(BitStuffer::num_tail_bytes_not_needed(16, 2) == 0);
    REQUIRE(BitStuffer::num_tail_bytes_not_needed(5, 5) == 0);
    REQUIRE(BitStuffer::num_tail_bytes_not_needed(3, 5) == 1);
}

TEST_CASE("BitStuffer plain mode", "[bitstuffer]") {
    BitStuffer stuffer;
    std::size_t consumed = 0;

    SECTION("v3 packing is LSB-first") {
        std::vector<std::uint8_t> block = {0x82, 0x03, 0x39};
        REQUIRE(decode_block(stuffer, block, 3, 3, &consumed) == Error::Ok);
        REQUIRE(stuffer.values() == std::vector<std::uint32_t>{1, 2, 3});
        REQUIRE(consumed == 3);
    }

    SECTION("pre-v3 packing is MSB-first") {
        std::vector<std::uint8_t> block = {0x82, 0x03, 0x6C};
        REQUIRE(decode_block(stuffer, block, 3, 2, &consumed) == Error::Ok);
        REQUIRE(stuffer.values() == std::vector<std::uint32_t>{1, 2, 3});
        REQUIRE(consumed == 3);
    }

    SECTION("zero bit width yields zeros") {
        std::vector<std::uint8_t> block = {0x80, 0x05};
        REQUIRE(decode_block(stuffer, block, 8, 3, &consumed) == Error::Ok);
        REQUIRE(stuffer.values() == std::vector<std::uint32_t>(5, 0));
        REQUIRE(consumed == 2);
    }

    SECTION("two-byte count") {
        std::vector<std::uint8_t> block = {0x40, 0x00, 0x01};
        REQUIRE(decode_block(stuffer, block, 256, 3) == Error::Ok);
        REQUIRE(stuffer.values().size() == 256);
    }

    SECTION("count above maximum") {
        std::vector<std::uint8_t> block = {0x82, 0x03, 0x39};
        REQUIRE(decode_block(stuffer, block, 2, 3) == Error::InvalidBitStuffing);
    }

    SECTION("truncated payload") {
        std::vector<std::uint8_t> block = {0x85, 0x10, 0x00};
        REQUIRE(decode_block(stuffer, block, 16, 3) == Error::Underflow);
    }

    SECTION("invalid count width") {
        std::vector<std::uint8_t> block = {0xC2, 0x03, 0x39};
        REQUIRE(decode_block(stuffer, block, 3, 3) == Error::InvalidBitStuffing);
    }
}

TEST_CASE("BitStuffer LUT mode", "[bitstuffer]") {
    BitStuffer stuffer;

    // Table {7, 9} after the implicit 0, indices {0, 1, 1, 0, 2}
    std::vector<std::uint8_t> block = {0xA4, 0x05, 0x03, 0x97, 0x14, 0x02};

    SECTION("values are looked up") {
        std::size_t consumed = 0;
        REQUIRE(decode_block(stuffer, block, 5, 3, &consumed) == Error::Ok);
        REQUIRE(stuffer.values() == std::vector<std::uint32_t>{0, 7, 7, 0, 9});
        REQUIRE(consumed == block.size());
    }

    SECTION("empty table is rejected") {
        block[2] = 0x01;
        REQUIRE(decode_block(stuffer, block, 5, 3) == Error::InvalidBitStuffing);
    }
}

TEST_CASE("BitStuffer multi-word blocks", "[bitstuffer]") {
    std::vector<std::uint32_t> values;
    for (std::uint32_t i = 0; i < 37; ++i) {
        values.push_back((i * 2654435761U) & 0x7FFU);
    }

    BitStuffer stuffer;

    SECTION("v3") {
        auto block = BlobBuilder::stuff(values, 11, 3);
        REQUIRE(decode_block(stuffer, block, values.size(), 3) == Error::Ok);
        REQUIRE(stuffer.values() == values);
    }

    SECTION("pre-v3") {
        auto block = BlobBuilder::stuff(values, 11, 2);
        REQUIRE(decode_block(stuffer, block, values.size(), 2) == Error::Ok);
        REQUIRE(stuffer.values() == values);
    }
}
