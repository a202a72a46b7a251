/**
 * @file bit_stuffer.hpp
 * @brief Unpacking of bit-stuffed unsigned integer arrays.
 *
 * Block layout:
 * - control byte: bits 6-7 select the width of the element count field
 *   (0 -> 4 bytes, 1 -> 2 bytes, 2 -> 1 byte), bit 5 flags dictionary
 *   (LUT) mode, bits 0-4 hold the bit width
 * - element count, little-endian
 * - plain mode: the packed values, or nothing when the bit width is 0
 *   (all values are zero)
 * - LUT mode: one byte holding the dictionary size, the packed dictionary
 *   values without the implicit leading 0, then the packed indices
 *
 * Two physical packings exist. Lerc2 v3 and later store values LSB-first
 * in little-endian 32-bit words and only the needed tail bytes. Older
 * streams store them MSB-first, with the partial last word shifted down
 * by the unused tail bytes before it was written.
 */

#ifndef LERCDEC_BIT_STUFFER_HPP
#define LERCDEC_BIT_STUFFER_HPP

#include "byte_reader.hpp"
#include "config.hpp"
#include "error.hpp"

#include <vector>

namespace lercdec {

/**
 * @brief Reusable bit-stuffed block decoder.
 *
 * Owns its scratch buffers, which are cleared and resized on every call.
 * One instance per decoding context; not safe for concurrent use.
 */
class BitStuffer {
public:
    BitStuffer() = default;

    /**
     * @brief Decode one bit-stuffed block.
     *
     * @param reader Reader positioned at the control byte; advanced past the block
     * @param max_element_count Upper bound on the element count
     * @param lerc2_version Codec version of the enclosing blob (selects the packing)
     * @return Error::Ok (results in values()), Error::Underflow on truncation,
     *         Error::InvalidBitStuffing on malformed blocks
     */
    Error decode(ByteReader& reader, std::size_t max_element_count, int lerc2_version);

    /// Values produced by the last successful decode()
    [[nodiscard]] const std::vector<std::uint32_t>& values() const noexcept {
        return values_;
    }

    /**
     * @brief Read a little-endian count field of 1, 2 or 4 bytes.
     *
     * @param reader Byte source
     * @param num_bytes Field width
     * @param[out] value Decoded count
     * @return Error::Ok, Error::Underflow, or Error::InvalidBitStuffing for other widths
     */
    static Error decode_uint(ByteReader& reader, int num_bytes, std::uint32_t& value) noexcept;

    /**
     * @brief Bytes of the last 32-bit word that carry no payload.
     */
    static unsigned num_tail_bytes_not_needed(std::uint32_t num_elements, int num_bits) noexcept {
        unsigned tail_bits =
            static_cast<unsigned>((static_cast<std::uint64_t>(num_elements) *
                                   static_cast<std::uint64_t>(num_bits)) & 31U);
        if (tail_bits == 0) {
            return 0;
        }
        return 4U - ((tail_bits + 7U) >> 3);
    }

private:
    using UnstuffFn = Error (BitStuffer::*)(ByteReader&, std::vector<std::uint32_t>&,
                                            std::uint32_t, int);

    /// Packing per layout, indexed by (lerc2_version >= 3)
    static const UnstuffFn LAYOUTS[2];

    Error unstuff(ByteReader& reader, std::vector<std::uint32_t>& out, std::uint32_t num_elements,
                  int num_bits, int lerc2_version);

    Error bit_unstuff(ByteReader& reader, std::vector<std::uint32_t>& out,
                      std::uint32_t num_elements, int num_bits);

    Error bit_unstuff_before_v3(ByteReader& reader, std::vector<std::uint32_t>& out,
                                std::uint32_t num_elements, int num_bits);

    Error load_words(ByteReader& reader, std::uint32_t num_elements, int num_bits,
                     std::size_t num_bytes);

    std::vector<std::uint32_t> lut_;
    std::vector<std::uint32_t> words_;
    std::vector<std::uint32_t> values_;
};

} // namespace lercdec

#endif // LERCDEC_BIT_STUFFER_HPP
