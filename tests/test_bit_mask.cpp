/**
 * @file test_bit_mask.cpp
 * @brief Unit tests for BitMask.
 */

#include <catch2/catch_test_macros.hpp>
#include <lercdec/bit_mask.hpp>

using namespace lercdec;

TEST_CASE("BitMask construction", "[bitmask]") {
    BitMask mask;

    SECTION("default is empty") {
        REQUIRE(mask.width() == 0);
        REQUIRE(mask.height() == 0);
        REQUIRE(mask.size() == 0);
    }

    SECTION("with_size starts all invalid") {
        REQUIRE(BitMask::with_size(5, 3, mask) == Error::Ok);
        REQUIRE(mask.width() == 5);
        REQUIRE(mask.height() == 3);
        REQUIRE(mask.num_pixels() == 15);
        REQUIRE(mask.size() == 2);
        REQUIRE(mask.count_valid_bits() == 0);
    }

    SECTION("rejects non-positive sizes") {
        REQUIRE(BitMask::with_size(0, 3, mask) == Error::InvalidDimensions);
        REQUIRE(mask.set_size(4, -1) == Error::InvalidDimensions);
    }
}

TEST_CASE("BitMask bit order", "[bitmask]") {
    BitMask mask;
    REQUIRE(BitMask::with_size(4, 4, mask) == Error::Ok);

    SECTION("pixel 0 is the high bit of byte 0") {
        mask.set_valid(0);
        REQUIRE(mask.bits()[0] == 0x80);
        mask.set_valid(9);
        REQUIRE(mask.bits()[1] == 0x40);
    }

    SECTION("row/col addressing") {
        mask.set_valid_at(2, 3);
        REQUIRE(mask.is_valid(11));
        REQUIRE(mask.is_valid_at(2, 3));
        mask.set_invalid_at(2, 3);
        REQUIRE_FALSE(mask.is_valid(11));
    }
}

TEST_CASE("BitMask out-of-range indices", "[bitmask]") {
    BitMask mask;
    REQUIRE(BitMask::with_size(3, 2, mask) == Error::Ok);
    mask.set_all_valid();

    REQUIRE_FALSE(mask.is_valid(-1));
    REQUIRE_FALSE(mask.is_valid(8));
    mask.set_valid(100);
    mask.set_invalid(-5);
    REQUIRE(mask.count_valid_bits() == 6);
    REQUIRE(mask.size() == 1);

    SECTION("row and column") {
        mask.set_all_invalid();
        mask.set_valid_at(0, 3);
        mask.set_valid_at(-1, 0);
        mask.set_valid_at(2, 0);
        REQUIRE(mask.count_valid_bits() == 0);

        mask.set_all_valid();
        REQUIRE_FALSE(mask.is_valid_at(0, 3));
        REQUIRE_FALSE(mask.is_valid_at(2, 0));
        REQUIRE_FALSE(mask.is_valid_at(0, -1));
        REQUIRE_FALSE(mask.is_valid_at(2147483647, 2147483647));
        mask.set_invalid_at(0, 3);
        REQUIRE(mask.is_valid_at(1, 0));
    }
}

TEST_CASE("BitMask rejects pixel counts beyond int", "[bitmask]") {
    BitMask mask;
    REQUIRE(BitMask::with_size(65536, 65536, mask) == Error::InvalidDimensions);
    REQUIRE(mask.num_pixels() == 0);
}

TEST_CASE("BitMask counting", "[bitmask]") {
    BitMask mask;
    REQUIRE(BitMask::with_size(3, 3, mask) == Error::Ok);

    SECTION("padding bits are not counted") {
        mask.set_all_valid();
        REQUIRE(mask.count_valid_bits() == 9);
    }

    SECTION("mixed") {
        mask.set_valid(0);
        mask.set_valid(4);
        mask.set_valid(8);
        REQUIRE(mask.count_valid_bits() == 3);

        std::vector<bool> v = mask.to_bool_vec();
        REQUIRE(v.size() == 9);
        REQUIRE(v[0]);
        REQUIRE_FALSE(v[1]);
        REQUIRE(v[4]);
        REQUIRE(v[8]);
    }
}

TEST_CASE("BitMask resize", "[bitmask]") {
    BitMask mask;
    REQUIRE(BitMask::with_size(8, 2, mask) == Error::Ok);
    mask.set_valid(3);

    SECTION("same dimensions keep the bits") {
        REQUIRE(mask.set_size(8, 2) == Error::Ok);
        REQUIRE(mask.is_valid(3));
    }

    SECTION("new dimensions reset") {
        REQUIRE(mask.set_size(4, 4) == Error::Ok);
        REQUIRE(mask.count_valid_bits() == 0);
    }
}

TEST_CASE("BitMask copy_from", "[bitmask]") {
    BitMask mask;
    REQUIRE(BitMask::with_size(10, 1, mask) == Error::Ok);

    std::uint8_t src[] = {0xF0, 0xC0};
    REQUIRE(mask.copy_from(src, 2) == Error::Ok);
    REQUIRE(mask.count_valid_bits() == 6);

    REQUIRE(mask.copy_from(src, 1) == Error::Underflow);
}
