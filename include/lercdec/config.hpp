/**
 * @file config.hpp
 * @brief LERC decoder compile-time configuration.
 *
 * Version information, format constants of the Lerc2 container and the
 * exception switch for embedded builds.
 *
 * @see https://github.com/Esri/lerc LERC format reference
 */

#ifndef LERCDEC_CONFIG_HPP
#define LERCDEC_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace lercdec {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Format Constants
 * @{
 */

/// Magic key at the start of every Lerc2 blob
inline constexpr char FILE_KEY[] = "Lerc2 ";
inline constexpr std::size_t FILE_KEY_LENGTH = sizeof(FILE_KEY) - 1;

/// Highest Lerc2 codec version this decoder understands
#ifndef LERCDEC_MAX_CODEC_VERSION
#define LERCDEC_MAX_CODEC_VERSION 6
#endif

inline constexpr int MAX_CODEC_VERSION = LERCDEC_MAX_CODEC_VERSION;

/// Largest micro block (tile) edge accepted by the tile reader
inline constexpr int MAX_MICRO_BLOCK_SIZE = 32;

/// Huffman decode lookup table width in bits
inline constexpr int MAX_NUM_BITS_LUT = 12;

/// Huffman histogram (code table) size limit
inline constexpr int MAX_HISTO_SIZE = 1 << 15;

/// Highest byte-plane delta level in float-point lossless streams
inline constexpr int MAX_FPL_DELTA = 5;

/// Largest pixel buffer, in bytes, that one decode call may allocate
#ifndef LERCDEC_MAX_DECODED_BYTES
#define LERCDEC_MAX_DECODED_BYTES 0x400000000ULL
#endif

inline constexpr std::uint64_t MAX_DECODED_BYTES = LERCDEC_MAX_DECODED_BYTES;

/// RLE terminator count
inline constexpr std::int16_t RLE_EOF = -32768;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define LERCDEC_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef LERCDEC_NO_EXCEPTIONS
#define LERCDEC_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace lercdec

#endif // LERCDEC_CONFIG_HPP
