/**
 * @file bit_mask.cpp
 * @brief BitMask compilation unit.
 *
 * @see include/lercdec/bit_mask.hpp for the implementation
 */

#include <lercdec/bit_mask.hpp>
