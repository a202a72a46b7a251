/**
 * @file byte_reader.cpp
 * @brief ByteReader compilation unit.
 *
 * ByteReader is header-only so the per-value reads inline into the pixel
 * loops. This unit checks that the header compiles on its own.
 *
 * @see include/lercdec/byte_reader.hpp
 */

#include <lercdec/byte_reader.hpp>
