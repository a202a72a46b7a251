/**
 * @file lerc2.hpp
 * @brief Single-band Lerc2 blob decoder.
 *
 * A blob carries one band of rows x cols pixels with depth values each.
 * Layout: header, validity mask (RLE), optional per-depth min/max ranges
 * (v4+), then the pixel data in one of these encodings:
 * - constant image (z_min == z_max, or every depth range collapsed)
 * - raw values for all valid pixels ("one sweep")
 * - Huffman coded 8-bit values, plain or delta (lossless Byte/Char)
 * - float-point lossless byte planes (v6 lossless Float/Double)
 * - micro-block tiles, each raw, constant or bit-stuffed quantized
 *   values relative to a tile offset
 *
 * Quantized values reconstruct as offset + q * 2 * max_z_error, clamped
 * to the band (or depth slice) maximum.
 *
 * @see https://github.com/Esri/lerc LERC format reference
 */

#ifndef LERCDEC_LERC2_HPP
#define LERCDEC_LERC2_HPP

#include "bit_mask.hpp"
#include "bit_stuffer.hpp"
#include "byte_reader.hpp"
#include "config.hpp"
#include "error.hpp"

#include <optional>
#include <vector>

namespace lercdec {

/**
 * @brief Pixel data types, valued as their wire codes.
 */
enum class DataType : int {
    Char = 0,
    Byte = 1,
    Short = 2,
    UShort = 3,
    Int = 4,
    UInt = 5,
    Float = 6,
    Double = 7,
    Undefined = 8
};

/// Size in bytes of one value of the given type (0 for Undefined)
inline constexpr std::size_t data_type_size(DataType dt) noexcept {
    switch (dt) {
    case DataType::Char:
    case DataType::Byte:
        return 1;
    case DataType::Short:
    case DataType::UShort:
        return 2;
    case DataType::Int:
    case DataType::UInt:
    case DataType::Float:
        return 4;
    case DataType::Double:
        return 8;
    default:
        return 0;
    }
}

/// Map a wire code to a DataType, Undefined when out of range
inline constexpr DataType data_type_from_int(int code) noexcept {
    return (code >= 0 && code < static_cast<int>(DataType::Undefined)) ? static_cast<DataType>(code)
                                                                        : DataType::Undefined;
}

/// Data type of a C++ pixel type
template <typename T> struct DataTypeOf;
template <> struct DataTypeOf<std::int8_t> { static constexpr DataType value = DataType::Char; };
template <> struct DataTypeOf<std::uint8_t> { static constexpr DataType value = DataType::Byte; };
template <> struct DataTypeOf<std::int16_t> { static constexpr DataType value = DataType::Short; };
template <> struct DataTypeOf<std::uint16_t> { static constexpr DataType value = DataType::UShort; };
template <> struct DataTypeOf<std::int32_t> { static constexpr DataType value = DataType::Int; };
template <> struct DataTypeOf<std::uint32_t> { static constexpr DataType value = DataType::UInt; };
template <> struct DataTypeOf<float> { static constexpr DataType value = DataType::Float; };
template <> struct DataTypeOf<double> { static constexpr DataType value = DataType::Double; };

/**
 * @brief Whole-image encodings selected by the encode-mode byte.
 */
enum class ImageEncodeMode : std::uint8_t {
    Tiling = 0,
    DeltaHuffman = 1,
    Huffman = 2,
    DeltaDeltaHuffman = 3
};

/**
 * @brief Parsed Lerc2 blob header.
 */
struct HeaderInfo {
    int version = 0;
    std::uint32_t checksum = 0;
    int n_rows = 0;
    int n_cols = 0;
    int n_depth = 1;
    int num_valid_pixel = 0;
    int micro_block_size = 0;
    int blob_size = 0;
    int n_blobs_more = 0; ///< v6+: number of blobs that follow this one
    std::uint8_t pass_no_data_values = 0;
    std::uint8_t is_int = 0;
    DataType dt = DataType::Undefined;
    double max_z_error = 0.0;
    double z_min = 0.0;
    double z_max = 0.0;
    double no_data_val = 0.0;      ///< value marking no-data inside the blob
    double no_data_val_orig = 0.0; ///< no-data value the caller expects

    [[nodiscard]] std::size_t num_pixels() const noexcept {
        return static_cast<std::size_t>(n_rows) * static_cast<std::size_t>(n_cols);
    }

    /// Lossless 8-bit data may be Huffman coded
    [[nodiscard]] bool try_huffman_int() const noexcept {
        return version >= 2 && (dt == DataType::Byte || dt == DataType::Char) &&
               max_z_error == 0.5;
    }

    /// Lossless float data may use float-point lossless coding
    [[nodiscard]] bool try_huffman_flt() const noexcept {
        return version >= 6 && (dt == DataType::Float || dt == DataType::Double) &&
               max_z_error == 0.0;
    }
};

/**
 * @brief Decoder for one Lerc2 blob at a time.
 *
 * Keeps the validity mask of the last decoded blob; a following blob may
 * reuse it by omitting its own mask payload. Not safe for concurrent use.
 */
class Lerc2Decoder {
public:
    Lerc2Decoder() = default;

    /**
     * @brief Parse a blob header without decoding pixels.
     *
     * @param data Blob start
     * @param size Bytes available
     * @param[out] header Parsed header
     * @param[out] has_mask True when some but not all pixels are valid
     * @return Error::Ok, Error::InvalidHeader, Error::UnsupportedVersion,
     *         Error::UnsupportedDataType or Error::Underflow
     */
    static Error get_header_info(const std::uint8_t* data, std::size_t size, HeaderInfo& header,
                                 bool& has_mask) noexcept;

    /**
     * @brief Decode one blob.
     *
     * Invalid pixels are left at zero.
     *
     * @tparam T Pixel type, must match the blob's data type
     * @param data Blob start
     * @param size Bytes available (may extend past the blob)
     * @param[out] bytes_remaining size minus the blob size
     * @param output Destination, at least rows * cols * depth values
     * @param output_size Capacity of output in values
     * @return Error::Ok or the first decoding error
     */
    template <typename T>
    Error decode(const std::uint8_t* data, std::size_t size, std::size_t& bytes_remaining,
                 T* output, std::size_t output_size);

    /**
     * @brief Validity of the last decoded blob.
     *
     * @return One entry per pixel, or std::nullopt when every pixel is valid
     */
    [[nodiscard]] std::optional<std::vector<bool>> get_mask_as_bool_vec() const;

    [[nodiscard]] const HeaderInfo& header_info() const noexcept {
        return header_info_;
    }

    [[nodiscard]] const BitMask& bit_mask() const noexcept {
        return bit_mask_;
    }

    /// Fletcher-32 over the given bytes (odd trailing byte padded with zero)
    static std::uint32_t compute_checksum_fletcher32(const std::uint8_t* data,
                                                     std::size_t size) noexcept;

    /**
     * @brief Type in which a tile offset is stored.
     *
     * @param dt Band data type
     * @param reduced_type_code Bits 6-7 of the tile control byte
     */
    static DataType get_data_type_used(DataType dt, int reduced_type_code) noexcept;

private:
    static Error read_header(ByteReader& reader, HeaderInfo& header) noexcept;
    static Error read_variable_data_type(ByteReader& reader, DataType dt, double& value) noexcept;

    Error read_mask(ByteReader& reader);
    bool check_min_max_equal() const noexcept;

    template <typename T> Error decode_pixels(ByteReader& reader, T* output);
    template <typename T> Error fill_const_image(T* output);
    template <typename T> Error read_min_max_ranges(ByteReader& reader);
    template <typename T> Error read_data_one_sweep(ByteReader& reader, T* output);
    template <typename T> Error read_tiles(ByteReader& reader, T* output);
    template <typename T>
    Error read_tile(ByteReader& reader, T* output, int i0, int i1, int j0, int j1, int i_depth);
    template <typename T> Error decode_huffman(ByteReader& reader, T* output);
    template <typename T> Error decode_fpl(ByteReader& reader, T* output);

    HeaderInfo header_info_;
    BitMask bit_mask_;
    BitStuffer bit_stuffer_;
    std::vector<double> z_min_vec_;
    std::vector<double> z_max_vec_;
    ImageEncodeMode image_encode_mode_ = ImageEncodeMode::Tiling;
};

} // namespace lercdec

#endif // LERCDEC_LERC2_HPP
