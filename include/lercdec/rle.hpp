/**
 * @file rle.hpp
 * @brief Run-length decoding of compressed mask payloads.
 *
 * Stream layout: a sequence of little-endian int16 counts. A positive
 * count is followed by that many literal bytes, a zero or negative count
 * by one byte repeated |count| times. The count -32768 ends the stream.
 */

#ifndef LERCDEC_RLE_HPP
#define LERCDEC_RLE_HPP

#include "config.hpp"
#include "error.hpp"

#include <vector>

namespace lercdec {

/**
 * @brief Decode a run-length stream into a caller buffer.
 *
 * Both input and output bounds are checked before each run is written.
 *
 * @param input RLE stream (at least 2 bytes)
 * @param input_size Bytes available at input
 * @param output Destination buffer
 * @param output_size Destination capacity
 * @return Error::Ok, Error::Underflow if input ends early,
 *         Error::Overflow if a run does not fit in output
 */
Error rle_decompress(const std::uint8_t* input, std::size_t input_size, std::uint8_t* output,
                     std::size_t output_size) noexcept;

/**
 * @brief Walk a run-length stream and report its decoded size.
 *
 * @param input RLE stream (at least 2 bytes)
 * @param input_size Bytes available at input
 * @param[out] size Number of bytes the stream expands to
 * @return Error::Ok or Error::Underflow
 */
Error rle_decompressed_size(const std::uint8_t* input, std::size_t input_size,
                            std::size_t& size) noexcept;

/**
 * @brief Decode a run-length stream into a freshly sized vector.
 *
 * @param input RLE stream
 * @param input_size Bytes available at input
 * @param[out] output Decoded bytes
 * @return Error::Ok or the first error of sizing or decoding
 */
Error rle_decompress_alloc(const std::uint8_t* input, std::size_t input_size,
                           std::vector<std::uint8_t>& output);

} // namespace lercdec

#endif // LERCDEC_RLE_HPP
