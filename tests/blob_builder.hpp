/**
 * @file blob_builder.hpp
 * @brief Test helper that assembles Lerc2 blobs byte by byte.
 *
 * Writes the header for the requested version, lets the test append the
 * mask and pixel sections, then patches blob size and checksum.
 */

#ifndef LERCDEC_TESTS_BLOB_BUILDER_HPP
#define LERCDEC_TESTS_BLOB_BUILDER_HPP

#include <lercdec/lerc2.hpp>

#include <cstring>
#include <vector>

namespace lercdec::test {

struct BlobSpec {
    int version = 3;
    int n_rows = 1;
    int n_cols = 1;
    int n_depth = 1;
    int num_valid_pixel = -1; ///< -1 for all pixels
    int micro_block_size = 8;
    DataType dt = DataType::Byte;
    int n_blobs_more = 0;
    std::uint8_t pass_no_data_values = 0;
    std::uint8_t is_int = 0;
    double max_z_error = 0.5;
    double z_min = 0.0;
    double z_max = 0.0;
    double no_data_val = 0.0;
    double no_data_val_orig = 0.0;
};

class BlobBuilder {
public:
    explicit BlobBuilder(const BlobSpec& spec) : spec_(spec) {
        write_header();
    }

    template <typename T> BlobBuilder& value(T v) {
        std::uint8_t raw[sizeof(T)];
        std::memcpy(raw, &v, sizeof(T));
        buf_.insert(buf_.end(), raw, raw + sizeof(T));
        return *this;
    }

    BlobBuilder& u8(std::uint8_t v) {
        return value(v);
    }

    BlobBuilder& i32(std::int32_t v) {
        return value(v);
    }

    BlobBuilder& bytes(const std::vector<std::uint8_t>& data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
        return *this;
    }

    /// Mask section without payload
    BlobBuilder& no_mask() {
        return i32(0);
    }

    /// Mask section with the given validity, stored as one literal RLE run
    BlobBuilder& mask(const std::vector<bool>& valid) {
        std::vector<std::uint8_t> bits((valid.size() + 7) / 8, 0);
        for (std::size_t k = 0; k < valid.size(); ++k) {
            if (valid[k]) {
                bits[k >> 3] = static_cast<std::uint8_t>(bits[k >> 3] | (0x80U >> (k & 7)));
            }
        }
        std::vector<std::uint8_t> rle = rle_literal(bits);
        i32(static_cast<std::int32_t>(rle.size()));
        return bytes(rle);
    }

    /// Patch blob size and checksum and return the finished blob
    std::vector<std::uint8_t> finish() {
        auto blob_size = static_cast<std::int32_t>(buf_.size());
        std::memcpy(buf_.data() + blob_size_offset(), &blob_size, 4);

        if (spec_.version >= 3) {
            std::uint32_t checksum =
                Lerc2Decoder::compute_checksum_fletcher32(buf_.data() + 14, buf_.size() - 14);
            std::memcpy(buf_.data() + 10, &checksum, 4);
        }
        return buf_;
    }

    static std::vector<std::uint8_t> rle_literal(const std::vector<std::uint8_t>& data) {
        std::vector<std::uint8_t> out;
        auto count = static_cast<std::int16_t>(data.size());
        out.push_back(static_cast<std::uint8_t>(count & 0xFF));
        out.push_back(static_cast<std::uint8_t>((count >> 8) & 0xFF));
        out.insert(out.end(), data.begin(), data.end());
        out.push_back(0x00);
        out.push_back(0x80);
        return out;
    }

    /**
     * @brief Tile control byte.
     *
     * @param mode 0 raw, 1 bit-stuffed, 2 zero, 3 constant
     * @param j0 First column of the tile
     * @param bits67 Offset type reduction code
     */
    static std::uint8_t tile_flag(int mode, int j0, int version, int bits67 = 0,
                                  bool diff = false) {
        const int pattern = version >= 5 ? 14 : 15;
        int flag = mode | (((j0 >> 3) & pattern) << 2) | (bits67 << 6);
        if (diff) {
            flag |= 4;
        }
        return static_cast<std::uint8_t>(flag);
    }

    /**
     * @brief Bit-stuffed block in the layout used by the given codec version.
     *
     * The element count is written with the narrowest field that fits.
     */
    static std::vector<std::uint8_t> stuff(const std::vector<std::uint32_t>& values, int num_bits,
                                           int version) {
        std::vector<std::uint8_t> out;
        const auto n = static_cast<std::uint32_t>(values.size());

        int bits67 = n < 256 ? 2 : (n < 65536 ? 1 : 0);
        out.push_back(static_cast<std::uint8_t>((bits67 << 6) | num_bits));
        const int count_bytes = bits67 == 0 ? 4 : 3 - bits67;
        for (int i = 0; i < count_bytes; ++i) {
            out.push_back(static_cast<std::uint8_t>((n >> (8 * i)) & 0xFF));
        }

        if (num_bits == 0) {
            return out;
        }

        const std::size_t total_bits = static_cast<std::size_t>(n) * num_bits;
        std::vector<std::uint32_t> words((total_bits + 31) / 32, 0);
        std::size_t bit = 0;
        for (std::uint32_t v : values) {
            for (int b = 0; b < num_bits; ++b, ++bit) {
                std::uint32_t one = version >= 3 ? (v >> b) & 1U : (v >> (num_bits - 1 - b)) & 1U;
                std::size_t pos = bit & 31;
                if (version >= 3) {
                    words[bit >> 5] |= one << pos;
                } else {
                    words[bit >> 5] |= one << (31 - pos);
                }
            }
        }

        const std::size_t used_tail = ((total_bits & 31) + 7) / 8;
        const std::size_t tail_not_needed = (total_bits & 31) == 0 ? 0 : 4 - used_tail;
        if (version < 3) {
            for (std::size_t i = 0; i < tail_not_needed; ++i) {
                words.back() >>= 8;
            }
        }

        const std::size_t num_bytes = words.size() * 4 - tail_not_needed;
        for (std::size_t i = 0; i < num_bytes; ++i) {
            out.push_back(static_cast<std::uint8_t>(words[i >> 2] >> (8 * (i & 3))));
        }
        return out;
    }

private:
    std::size_t ints_offset() const {
        return spec_.version >= 3 ? 14 : 10;
    }

    std::size_t blob_size_offset() const {
        return ints_offset() + 4 * (spec_.version >= 4 ? 5 : 4);
    }

    void write_header() {
        const char key[] = "Lerc2 ";
        buf_.insert(buf_.end(), key, key + 6);
        i32(spec_.version);
        if (spec_.version >= 3) {
            value<std::uint32_t>(0);
        }

        const int n_pixels = spec_.n_rows * spec_.n_cols;
        i32(spec_.n_rows);
        i32(spec_.n_cols);
        if (spec_.version >= 4) {
            i32(spec_.n_depth);
        }
        i32(spec_.num_valid_pixel < 0 ? n_pixels : spec_.num_valid_pixel);
        i32(spec_.micro_block_size);
        i32(0);
        i32(static_cast<int>(spec_.dt));
        if (spec_.version >= 6) {
            i32(spec_.n_blobs_more);
            u8(spec_.pass_no_data_values);
            u8(spec_.is_int);
            u8(0);
            u8(0);
        }

        value(spec_.max_z_error);
        value(spec_.z_min);
        value(spec_.z_max);
        if (spec_.version >= 6) {
            value(spec_.no_data_val);
            value(spec_.no_data_val_orig);
        }
    }

    BlobSpec spec_;
    std::vector<std::uint8_t> buf_;
};

} // namespace lercdec::test

#endif // LERCDEC_TESTS_BLOB_BUILDER_HPP
