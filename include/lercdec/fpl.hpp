/**
 * @file fpl.hpp
 * @brief Float-point lossless (FPL) decoding, Lerc2 v6.
 *
 * An FPL stream holds one predictor code followed by one record per byte
 * plane of the float (4 planes) or double (8 planes) samples:
 * byte index, delta level, payload size (uint32) and payload. The payload
 * starts with a mode byte: 0 Huffman, 1 constant run, 2 raw bytes,
 * 3 PackBits.
 *
 * After the planes are reassembled, the predictor is undone with
 * sign/exponent-aware addition and, for floats, the encoder's bit
 * reordering (sign moved below the exponent) is reverted.
 */

#ifndef LERCDEC_FPL_HPP
#define LERCDEC_FPL_HPP

#include "byte_reader.hpp"
#include "config.hpp"
#include "error.hpp"

#include <vector>

namespace lercdec {

enum class FplPredictor : std::uint8_t {
    None = 0,
    Delta1 = 1,
    RowsCols = 2
};

/// Byte-plane payload encodings
enum class FplPlaneMode : std::uint8_t {
    Huffman = 0,
    ConstRun = 1,
    Raw = 2,
    PackBits = 3
};

/**
 * @brief Decode one FPL stream.
 *
 * Single-depth rasters are decoded as a width x height slice, deeper ones
 * as a depth x (width * height) slice.
 *
 * @param reader Reader positioned at the predictor code; advanced past the stream
 * @param is_double Double (8 planes) or float (4 planes) samples
 * @param width Columns
 * @param height Rows
 * @param depth Values per pixel
 * @param[out] output Little-endian sample bytes, width * height * depth samples
 * @return Error::Ok, Error::Underflow, Error::InvalidFpl or a Huffman error
 */
Error fpl_decode(ByteReader& reader, bool is_double, int width, int height, int depth,
                 std::vector<std::uint8_t>& output);

/**
 * @brief Decode a PackBits byte run.
 *
 * A header byte b <= 127 copies the next b + 1 bytes, b > 127 repeats the
 * next byte b - 126 times.
 *
 * @return Error::Ok, Error::Underflow, or Error::InvalidFpl when the
 *         decoded size differs from expected
 */
Error fpl_decode_packbits(const std::uint8_t* data, std::size_t size, std::size_t expected,
                          std::vector<std::uint8_t>& output);

/**
 * @brief Undo the byte-plane delta encoding of the given level.
 */
inline void fpl_restore_sequence(std::uint8_t* data, std::size_t size, int level) noexcept {
    for (int l = level; l > 0; --l) {
        for (std::size_t i = static_cast<std::size_t>(l); i < size; ++i) {
            data[i] = static_cast<std::uint8_t>(data[i] + data[i - 1]);
        }
    }
}

/**
 * @brief Restore IEEE bit order from exponent|sign|mantissa order.
 */
inline std::uint32_t fpl_undo_move_bits_to_front(std::uint32_t a) noexcept {
    std::uint32_t ret = a & 0x007FFFFFU;
    std::uint32_t exponent = (a >> 24) & 0xFFU;
    std::uint32_t sign = (a >> 23) & 0x01U;
    return ret | (exponent << 23) | (sign << 31);
}

/// Add mantissas and the upper 9 bits separately, each wrapping in its field
inline std::uint32_t fpl_add_float(std::uint32_t a, std::uint32_t b) noexcept {
    std::uint32_t ret = (a + b) & 0x007FFFFFU;
    std::uint32_t ae = (a >> 23) & 0x1FFU;
    std::uint32_t be = (b >> 23) & 0x1FFU;
    return ret | (((ae + be) & 0x1FFU) << 23);
}

/// Add mantissas and the upper 12 bits separately, each wrapping in its field
inline std::uint64_t fpl_add_double(std::uint64_t a, std::uint64_t b) noexcept {
    constexpr std::uint64_t mant_mask = 0x000FFFFFFFFFFFFFULL;
    std::uint64_t ret = ((a & mant_mask) + (b & mant_mask)) & mant_mask;
    std::uint64_t ae = (a >> 52) & 0xFFFU;
    std::uint64_t be = (b >> 52) & 0xFFFU;
    return ret | (((ae + be) & 0xFFFU) << 52);
}

} // namespace lercdec

#endif // LERCDEC_FPL_HPP
