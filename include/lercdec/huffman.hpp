/**
 * @file huffman.hpp
 * @brief Canonical Huffman decoding for lossless 8-bit rasters and FPL planes.
 *
 * The code table is sent as four int32 values (version, size, i0, i1),
 * the code lengths of symbols [i0, i1) as a bit-stuffed block, then the
 * codes themselves packed MSB-first into little-endian 32-bit words.
 * Symbol indices wrap around at size, so a range may start near the end
 * of the table and continue at its beginning.
 *
 * Decoding uses a lookup table of up to MAX_NUM_BITS_LUT bits and falls
 * back to a binary tree for longer codes.
 */

#ifndef LERCDEC_HUFFMAN_HPP
#define LERCDEC_HUFFMAN_HPP

#include "byte_reader.hpp"
#include "config.hpp"
#include "error.hpp"

#include <utility>
#include <vector>

namespace lercdec {

class Huffman {
public:
    Huffman() = default;

    /**
     * @brief Read the code table.
     *
     * @param reader Reader positioned at the table; advanced past it
     * @param lerc2_version Codec version, selects the bit-stuffer packing
     * @return Error::Ok, Error::Underflow, Error::InvalidHuffman or a bit-stuffer error
     */
    Error read_code_table(ByteReader& reader, int lerc2_version);

    /**
     * @brief Build the decode lookup table and tree from the code table.
     *
     * @param[out] num_bits_lut Width of the lookup table in bits
     * @return Error::Ok or Error::InvalidHuffman
     */
    Error build_tree_from_codes(int& num_bits_lut);

    /**
     * @brief Decode one symbol.
     *
     * The stream is a sequence of little-endian 32-bit words read MSB-first.
     * A lookup may peek at the word after the current one.
     *
     * @param data Start of the coded stream
     * @param size Bytes available at data
     * @param[in,out] pos Byte offset of the current word
     * @param[in,out] bit_pos Bit offset within the current word (0-31)
     * @param[out] value Decoded symbol
     * @return Error::Ok, Error::Underflow or Error::InvalidHuffman
     */
    Error decode_one_value(const std::uint8_t* data, std::size_t size, std::size_t& pos,
                           int& bit_pos, int& value) const noexcept;

    /// (code length, code) per symbol
    [[nodiscard]] const std::vector<std::pair<std::uint16_t, std::uint32_t>>&
    code_table() const noexcept {
        return code_table_;
    }

    void clear();

private:
    struct Node {
        std::int16_t value = -1;
        int child0 = -1;
        int child1 = -1;
    };

    static inline int get_index_wrap_around(int i, int size) noexcept {
        return (i < size) ? i : i - size;
    }

    Error bit_unstuff_codes(ByteReader& reader, int i0, int i1);
    Error get_range(int& i0, int& i1, int& max_len) const noexcept;

    std::vector<std::pair<std::uint16_t, std::uint32_t>> code_table_;
    std::vector<std::pair<std::int16_t, std::int16_t>> decode_lut_;
    int num_bits_lut_ = 0;
    int num_bits_to_skip_in_tree_ = 0;
    std::vector<Node> tree_; ///< tree_[0] is the root when a tree is needed
};

} // namespace lercdec

#endif // LERCDEC_HUFFMAN_HPP
