/**
 * @file lercdec.hpp
 * @brief Umbrella header for the LERC decoder.
 *
 * Pulls in the blob-level API (get_blob_info, decode) together with the
 * single-band engine and its building blocks.
 *
 * @see https://github.com/Esri/lerc LERC format reference
 */

#ifndef LERCDEC_HPP
#define LERCDEC_HPP

#include "bit_mask.hpp"
#include "bit_stuffer.hpp"
#include "byte_reader.hpp"
#include "config.hpp"
#include "error.hpp"
#include "fpl.hpp"
#include "huffman.hpp"
#include "lerc.hpp"
#include "lerc2.hpp"
#include "rle.hpp"

#endif // LERCDEC_HPP
