/**
 * @file lerc2.cpp
 * @brief Single-band Lerc2 blob decoder implementation.
 *
 * The per-type decode paths are templates; decode<T>() is explicitly
 * instantiated at the end of this file for the eight pixel types.
 */

#include <lercdec/fpl.hpp>
#include <lercdec/huffman.hpp>
#include <lercdec/lerc2.hpp>
#include <lercdec/rle.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <type_traits>

namespace lercdec {

namespace {

/// Convert a reconstructed value to the pixel type, saturating integers
template <typename T> inline T convert_value(double z) noexcept {
    if constexpr (std::is_floating_point_v<T>) {
        return static_cast<T>(z);
    } else {
        if (std::isnan(z)) {
            return T(0);
        }
        if (z <= static_cast<double>(std::numeric_limits<T>::min())) {
            return std::numeric_limits<T>::min();
        }
        if (z >= static_cast<double>(std::numeric_limits<T>::max())) {
            return std::numeric_limits<T>::max();
        }
        return static_cast<T>(z);
    }
}

/// Integer addition modulo the type width; plain addition for floats
template <typename T> inline T wrapping_add(T a, T b) noexcept {
    if constexpr (std::is_integral_v<T>) {
        using U = std::make_unsigned_t<T>;
        return static_cast<T>(static_cast<U>(static_cast<U>(a) + static_cast<U>(b)));
    } else {
        return a + b;
    }
}

inline std::size_t header_prefix_size(int version) noexcept {
    return FILE_KEY_LENGTH + sizeof(std::int32_t) + (version >= 3 ? sizeof(std::uint32_t) : 0);
}

} // namespace

// ============================================================================
// Header
// ============================================================================

std::uint32_t Lerc2Decoder::compute_checksum_fletcher32(const std::uint8_t* data,
                                                        std::size_t size) noexcept {
    std::uint32_t sum1 = 0xffff;
    std::uint32_t sum2 = 0xffff;
    std::size_t words = size / 2;
    const std::uint8_t* p = data;

    while (words > 0) {
        std::size_t tlen = std::min<std::size_t>(words, 359);
        words -= tlen;
        for (std::size_t i = 0; i < tlen; ++i) {
            sum1 += static_cast<std::uint32_t>(*p++) << 8;
            sum1 += *p++;
            sum2 += sum1;
        }
        sum1 = (sum1 & 0xffff) + (sum1 >> 16);
        sum2 = (sum2 & 0xffff) + (sum2 >> 16);
    }

    if (size & 1) {
        sum1 += static_cast<std::uint32_t>(*p) << 8;
        sum2 += sum1;
    }

    sum1 = (sum1 & 0xffff) + (sum1 >> 16);
    sum2 = (sum2 & 0xffff) + (sum2 >> 16);

    return (sum2 << 16) | sum1;
}

Error Lerc2Decoder::read_header(ByteReader& reader, HeaderInfo& header) noexcept {
    const std::uint8_t* key = nullptr;
    if (reader.read_bytes(FILE_KEY_LENGTH, key) != Error::Ok ||
        std::memcmp(key, FILE_KEY, FILE_KEY_LENGTH) != 0) {
        return Error::InvalidHeader;
    }

    HeaderInfo hd;
    Error status = reader.read(hd.version);
    if (status != Error::Ok) {
        return status;
    }
    if (hd.version < 1 || hd.version > MAX_CODEC_VERSION) {
        return Error::UnsupportedVersion;
    }

    if (hd.version >= 3) {
        status = reader.read(hd.checksum);
        if (status != Error::Ok) {
            return status;
        }
    }

    const int n_ints = 6 + (hd.version >= 4 ? 1 : 0) + (hd.version >= 6 ? 1 : 0);
    const int n_dbls = 3 + (hd.version >= 6 ? 2 : 0);

    std::int32_t ints[8] = {};
    for (int i = 0; i < n_ints; ++i) {
        status = reader.read(ints[i]);
        if (status != Error::Ok) {
            return status;
        }
    }

    if (hd.version >= 6) {
        const std::uint8_t* extra = nullptr;
        status = reader.read_bytes(4, extra);
        if (status != Error::Ok) {
            return status;
        }
        hd.pass_no_data_values = extra[0];
        hd.is_int = extra[1];
    }

    double dbls[5] = {};
    for (int i = 0; i < n_dbls; ++i) {
        status = reader.read(dbls[i]);
        if (status != Error::Ok) {
            return status;
        }
    }

    int i = 0;
    hd.n_rows = ints[i++];
    hd.n_cols = ints[i++];
    hd.n_depth = (hd.version >= 4) ? ints[i++] : 1;
    hd.num_valid_pixel = ints[i++];
    hd.micro_block_size = ints[i++];
    hd.blob_size = ints[i++];
    const int dt = ints[i++];
    if (hd.version >= 6) {
        hd.n_blobs_more = ints[i++];
    }

    hd.max_z_error = dbls[0];
    hd.z_min = dbls[1];
    hd.z_max = dbls[2];
    if (hd.version >= 6) {
        hd.no_data_val = dbls[3];
        hd.no_data_val_orig = dbls[4];
    }

    hd.dt = data_type_from_int(dt);
    if (hd.dt == DataType::Undefined) {
        return Error::UnsupportedDataType;
    }

    if (hd.n_rows <= 0 || hd.n_cols <= 0 || hd.n_depth <= 0 || hd.num_valid_pixel < 0 ||
        hd.micro_block_size <= 0 || hd.blob_size <= 0) {
        return Error::InvalidHeader;
    }
    if (hd.n_rows > std::numeric_limits<std::int32_t>::max() / hd.n_cols) {
        return Error::InvalidHeader;
    }
    if (hd.num_valid_pixel > hd.n_rows * hd.n_cols) {
        return Error::InvalidHeader;
    }

    header = hd;
    return Error::Ok;
}

Error Lerc2Decoder::get_header_info(const std::uint8_t* data, std::size_t size,
                                    HeaderInfo& header, bool& has_mask) noexcept {
    if (data == nullptr) {
        return Error::InvalidArg;
    }

    ByteReader reader(data, size);
    Error status = read_header(reader, header);
    if (status != Error::Ok) {
        return status;
    }

    has_mask = header.num_valid_pixel > 0 && header.num_valid_pixel < header.n_rows * header.n_cols;
    return Error::Ok;
}

DataType Lerc2Decoder::get_data_type_used(DataType dt, int reduced_type_code) noexcept {
    const int tc = reduced_type_code;
    const int code = static_cast<int>(dt);

    switch (dt) {
    case DataType::Short:
    case DataType::Int: {
        DataType used = data_type_from_int(code - tc);
        return used == DataType::Undefined ? dt : used;
    }
    case DataType::UShort:
    case DataType::UInt: {
        DataType used = data_type_from_int(code - 2 * tc);
        return used == DataType::Undefined ? dt : used;
    }
    case DataType::Float:
        return tc == 0 ? dt : (tc == 1 ? DataType::Short : DataType::Byte);
    case DataType::Double: {
        if (tc == 0) {
            return dt;
        }
        DataType used = data_type_from_int(code - 2 * tc + 1);
        return used == DataType::Undefined ? dt : used;
    }
    default:
        return dt;
    }
}

Error Lerc2Decoder::read_variable_data_type(ByteReader& reader, DataType dt,
                                            double& value) noexcept {
    Error status = Error::Ok;
    switch (dt) {
    case DataType::Char: {
        std::int8_t v = 0;
        status = reader.read(v);
        value = v;
        break;
    }
    case DataType::Byte: {
        std::uint8_t v = 0;
        status = reader.read(v);
        value = v;
        break;
    }
    case DataType::Short: {
        std::int16_t v = 0;
        status = reader.read(v);
        value = v;
        break;
    }
    case DataType::UShort: {
        std::uint16_t v = 0;
        status = reader.read(v);
        value = v;
        break;
    }
    case DataType::Int: {
        std::int32_t v = 0;
        status = reader.read(v);
        value = v;
        break;
    }
    case DataType::UInt: {
        std::uint32_t v = 0;
        status = reader.read(v);
        value = v;
        break;
    }
    case DataType::Float: {
        float v = 0.0F;
        status = reader.read(v);
        value = v;
        break;
    }
    case DataType::Double:
        status = reader.read(value);
        break;
    default:
        return Error::UnsupportedDataType;
    }
    return status;
}

// ============================================================================
// Mask
// ============================================================================

Error Lerc2Decoder::read_mask(ByteReader& reader) {
    const int num_valid = header_info_.num_valid_pixel;
    const int w = header_info_.n_cols;
    const int h = header_info_.n_rows;

    std::int32_t num_bytes_mask = 0;
    Error status = reader.read(num_bytes_mask);
    if (status != Error::Ok) {
        return status;
    }

    const bool trivial = (num_valid == 0 || num_valid == w * h);
    if ((trivial && num_bytes_mask != 0) || num_bytes_mask < 0) {
        return Error::InvalidMask;
    }

    const bool same_size = bit_mask_.width() == w && bit_mask_.height() == h;

    status = bit_mask_.set_size(w, h);
    if (status != Error::Ok) {
        return status;
    }

    if (num_valid == 0) {
        bit_mask_.set_all_invalid();
    } else if (num_valid == w * h) {
        bit_mask_.set_all_valid();
    } else if (num_bytes_mask > 0) {
        const std::uint8_t* rle = nullptr;
        status = reader.read_bytes(static_cast<std::size_t>(num_bytes_mask), rle);
        if (status != Error::Ok) {
            return status;
        }
        status = rle_decompress(rle, static_cast<std::size_t>(num_bytes_mask), bit_mask_.bits(),
                                bit_mask_.size());
        if (status != Error::Ok) {
            return status;
        }
    } else if (!same_size) {
        // An omitted mask repeats the previous band's mask.
        return Error::InvalidMask;
    }

    return Error::Ok;
}

std::optional<std::vector<bool>> Lerc2Decoder::get_mask_as_bool_vec() const {
    if (header_info_.num_valid_pixel == header_info_.n_rows * header_info_.n_cols) {
        return std::nullopt;
    }
    return bit_mask_.to_bool_vec();
}

bool Lerc2Decoder::check_min_max_equal() const noexcept {
    for (std::size_t i = 0; i < z_min_vec_.size(); ++i) {
        if (z_min_vec_[i] != z_max_vec_[i]) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Pixel data
// ============================================================================

template <typename T>
Error Lerc2Decoder::decode(const std::uint8_t* data, std::size_t size,
                           std::size_t& bytes_remaining, T* output, std::size_t output_size) {
    if (data == nullptr || output == nullptr) {
        return Error::InvalidArg;
    }

    ByteReader header_reader(data, size);
    HeaderInfo hd;
    Error status = read_header(header_reader, hd);
    if (status != Error::Ok) {
        return status;
    }

    if (static_cast<std::size_t>(hd.blob_size) > size) {
        return Error::Underflow;
    }
    if (hd.dt != DataTypeOf<T>::value) {
        return Error::InvalidArg;
    }

    const std::size_t total = hd.num_pixels() * static_cast<std::size_t>(hd.n_depth);
    if (output_size < total) {
        return Error::Overflow;
    }

    header_info_ = hd;
    z_min_vec_.clear();
    z_max_vec_.clear();
    image_encode_mode_ = ImageEncodeMode::Tiling;

    if (hd.version >= 3) {
        const std::size_t n = header_prefix_size(hd.version);
        if (static_cast<std::size_t>(hd.blob_size) < n) {
            return Error::InvalidHeader;
        }
        std::uint32_t checksum =
            compute_checksum_fletcher32(data + n, static_cast<std::size_t>(hd.blob_size) - n);
        if (checksum != hd.checksum) {
            return Error::ChecksumMismatch;
        }
    }

    ByteReader reader(data, static_cast<std::size_t>(hd.blob_size));
    status = reader.skip(header_reader.position());
    if (status != Error::Ok) {
        return status;
    }

    status = read_mask(reader);
    if (status != Error::Ok) {
        return status;
    }

    std::fill(output, output + total, T(0));

    status = decode_pixels(reader, output);
    if (status != Error::Ok) {
        return status;
    }

    bytes_remaining = size - static_cast<std::size_t>(hd.blob_size);
    return Error::Ok;
}

template <typename T> Error Lerc2Decoder::decode_pixels(ByteReader& reader, T* output) {
    const HeaderInfo& hd = header_info_;

    if (hd.num_valid_pixel == 0) {
        return Error::Ok;
    }

    if (hd.z_min == hd.z_max) {
        return fill_const_image(output);
    }

    if (hd.version >= 4) {
        Error status = read_min_max_ranges<T>(reader);
        if (status != Error::Ok) {
            return status;
        }
        if (check_min_max_equal()) {
            return fill_const_image(output);
        }
    }

    std::uint8_t one_sweep = 0;
    Error status = reader.read(one_sweep);
    if (status != Error::Ok) {
        return status;
    }

    if (one_sweep != 0) {
        return read_data_one_sweep(reader, output);
    }

    if (hd.try_huffman_int() || hd.try_huffman_flt()) {
        std::uint8_t flag = 0;
        status = reader.read(flag);
        if (status != Error::Ok) {
            return status;
        }

        if (flag > 3 || (flag > 2 && hd.version < 6) || (flag > 1 && hd.version < 4)) {
            return Error::InvalidData;
        }
        image_encode_mode_ = static_cast<ImageEncodeMode>(flag);

        if (image_encode_mode_ != ImageEncodeMode::Tiling) {
            if (hd.try_huffman_int()) {
                if (image_encode_mode_ == ImageEncodeMode::DeltaHuffman ||
                    (hd.version >= 4 && image_encode_mode_ == ImageEncodeMode::Huffman)) {
                    return decode_huffman(reader, output);
                }
                return Error::InvalidData;
            }
            if (image_encode_mode_ == ImageEncodeMode::DeltaDeltaHuffman) {
                return decode_fpl(reader, output);
            }
            return Error::InvalidData;
        }
    }

    return read_tiles(reader, output);
}

template <typename T> Error Lerc2Decoder::fill_const_image(T* output) {
    const HeaderInfo& hd = header_info_;
    const int n_cols = hd.n_cols;
    const int n_rows = hd.n_rows;
    const auto n_depth = static_cast<std::size_t>(hd.n_depth);
    const T z0 = convert_value<T>(hd.z_min);

    if (n_depth == 1) {
        for (int k = 0; k < n_rows * n_cols; ++k) {
            if (bit_mask_.is_valid(k)) {
                output[k] = z0;
            }
        }
        return Error::Ok;
    }

    std::vector<T> z_buf(n_depth, z0);
    if (hd.z_min != hd.z_max) {
        if (z_min_vec_.size() != n_depth) {
            return Error::InvalidData;
        }
        for (std::size_t m = 0; m < n_depth; ++m) {
            z_buf[m] = convert_value<T>(z_min_vec_[m]);
        }
    }

    for (int k = 0; k < n_rows * n_cols; ++k) {
        if (bit_mask_.is_valid(k)) {
            std::copy(z_buf.begin(), z_buf.end(), output + static_cast<std::size_t>(k) * n_depth);
        }
    }
    return Error::Ok;
}

template <typename T> Error Lerc2Decoder::read_min_max_ranges(ByteReader& reader) {
    const auto n_depth = static_cast<std::size_t>(header_info_.n_depth);
    const std::size_t len = n_depth * sizeof(T);

    const std::uint8_t* p = nullptr;
    Error status = reader.read_bytes(2 * len, p);
    if (status != Error::Ok) {
        return status;
    }

    z_min_vec_.resize(n_depth);
    z_max_vec_.resize(n_depth);
    for (std::size_t i = 0; i < n_depth; ++i) {
        z_min_vec_[i] = static_cast<double>(detail::load_le<T>(p + i * sizeof(T)));
        z_max_vec_[i] = static_cast<double>(detail::load_le<T>(p + len + i * sizeof(T)));
    }
    return Error::Ok;
}

template <typename T> Error Lerc2Decoder::read_data_one_sweep(ByteReader& reader, T* output) {
    const auto n_depth = static_cast<std::size_t>(header_info_.n_depth);
    const std::size_t len = n_depth * sizeof(T);
    const std::size_t n_valid = bit_mask_.count_valid_bits();

    const std::uint8_t* src = nullptr;
    Error status = reader.read_bytes(n_valid * len, src);
    if (status != Error::Ok) {
        return status;
    }

    const int n_pixels = header_info_.n_rows * header_info_.n_cols;
    for (int k = 0; k < n_pixels; ++k) {
        if (!bit_mask_.is_valid(k)) {
            continue;
        }
        T* dst = output + static_cast<std::size_t>(k) * n_depth;
        for (std::size_t m = 0; m < n_depth; ++m) {
            dst[m] = detail::load_le<T>(src + m * sizeof(T));
        }
        src += len;
    }
    return Error::Ok;
}

// ============================================================================
// Tiles
// ============================================================================

template <typename T> Error Lerc2Decoder::read_tiles(ByteReader& reader, T* output) {
    const int mb_size = header_info_.micro_block_size;
    const int n_rows = header_info_.n_rows;
    const int n_cols = header_info_.n_cols;
    const int n_depth = header_info_.n_depth;

    if (mb_size > MAX_MICRO_BLOCK_SIZE) {
        return Error::InvalidData;
    }

    const int num_tiles_vert = (n_rows + mb_size - 1) / mb_size;
    const int num_tiles_hori = (n_cols + mb_size - 1) / mb_size;

    for (int i_tile = 0; i_tile < num_tiles_vert; ++i_tile) {
        const int i0 = i_tile * mb_size;
        const int i1 = std::min(i0 + mb_size, n_rows);

        for (int j_tile = 0; j_tile < num_tiles_hori; ++j_tile) {
            const int j0 = j_tile * mb_size;
            const int j1 = std::min(j0 + mb_size, n_cols);

            for (int i_depth = 0; i_depth < n_depth; ++i_depth) {
                Error status = read_tile(reader, output, i0, i1, j0, j1, i_depth);
                if (status != Error::Ok) {
                    return status;
                }
            }
        }
    }
    return Error::Ok;
}

template <typename T>
Error Lerc2Decoder::read_tile(ByteReader& reader, T* output, int i0, int i1, int j0, int j1,
                              int i_depth) {
    const HeaderInfo& hd = header_info_;
    const int n_cols = hd.n_cols;
    const auto n_depth = static_cast<std::size_t>(hd.n_depth);

    std::uint8_t compr_flag = 0;
    Error status = reader.read(compr_flag);
    if (status != Error::Ok) {
        return status;
    }

    const bool diff_enc = hd.version >= 5 && (compr_flag & 4) != 0;
    const int pattern = hd.version >= 5 ? 14 : 15;

    // Bits 2-5 repeat the tile column index as an integrity check.
    if (((compr_flag >> 2) & pattern) != ((j0 >> 3) & pattern)) {
        return Error::InvalidData;
    }
    if (diff_enc && i_depth == 0) {
        return Error::InvalidData;
    }

    const int bits67 = compr_flag >> 6;
    const int mode = compr_flag & 3;

    if (mode == 2) {
        for (int i = i0; i < i1; ++i) {
            int k = i * n_cols + j0;
            std::size_t m = static_cast<std::size_t>(k) * n_depth + static_cast<std::size_t>(i_depth);
            for (int j = j0; j < j1; ++j, ++k, m += n_depth) {
                if (bit_mask_.is_valid(k)) {
                    output[m] = diff_enc ? output[m - 1] : T(0);
                }
            }
        }
        return Error::Ok;
    }

    if (mode == 0) {
        if (diff_enc) {
            return Error::InvalidData;
        }
        for (int i = i0; i < i1; ++i) {
            int k = i * n_cols + j0;
            std::size_t m = static_cast<std::size_t>(k) * n_depth + static_cast<std::size_t>(i_depth);
            for (int j = j0; j < j1; ++j, ++k, m += n_depth) {
                if (bit_mask_.is_valid(k)) {
                    status = reader.read(output[m]);
                    if (status != Error::Ok) {
                        return status;
                    }
                }
            }
        }
        return Error::Ok;
    }

    const DataType offset_type = get_data_type_used(
        (diff_enc && hd.dt < DataType::Float) ? DataType::Int : hd.dt, bits67);

    double offset = 0.0;
    status = read_variable_data_type(reader, offset_type, offset);
    if (status != Error::Ok) {
        return status;
    }

    const double z_max = (hd.version >= 4 && n_depth > 1)
                             ? z_max_vec_[static_cast<std::size_t>(i_depth)]
                             : hd.z_max;

    if (mode == 3) {
        const T value = convert_value<T>(offset);
        for (int i = i0; i < i1; ++i) {
            int k = i * n_cols + j0;
            std::size_t m = static_cast<std::size_t>(k) * n_depth + static_cast<std::size_t>(i_depth);
            for (int j = j0; j < j1; ++j, ++k, m += n_depth) {
                if (!bit_mask_.is_valid(k)) {
                    continue;
                }
                if (diff_enc) {
                    double z = offset + static_cast<double>(output[m - 1]);
                    output[m] = convert_value<T>(std::min(z, z_max));
                } else {
                    output[m] = value;
                }
            }
        }
        return Error::Ok;
    }

    const auto max_element_count = static_cast<std::size_t>(i1 - i0) *
                                   static_cast<std::size_t>(j1 - j0);
    status = bit_stuffer_.decode(reader, max_element_count, hd.version);
    if (status != Error::Ok) {
        return status;
    }

    const std::vector<std::uint32_t>& q = bit_stuffer_.values();
    const double inv_scale = 2.0 * hd.max_z_error;
    const bool all_valid = q.size() == max_element_count;
    std::size_t src = 0;

    for (int i = i0; i < i1; ++i) {
        int k = i * n_cols + j0;
        std::size_t m = static_cast<std::size_t>(k) * n_depth + static_cast<std::size_t>(i_depth);
        for (int j = j0; j < j1; ++j, ++k, m += n_depth) {
            if (!all_valid && !bit_mask_.is_valid(k)) {
                continue;
            }
            if (src >= q.size()) {
                return Error::InvalidData;
            }
            double z = offset + static_cast<double>(q[src++]) * inv_scale;
            if (diff_enc) {
                z += static_cast<double>(output[m - 1]);
            }
            output[m] = convert_value<T>(std::min(z, z_max));
        }
    }
    return Error::Ok;
}

// ============================================================================
// Huffman and float-point lossless
// ============================================================================

template <typename T> Error Lerc2Decoder::decode_huffman(ByteReader& reader, T* output) {
    const HeaderInfo& hd = header_info_;

    Huffman huffman;
    Error status = huffman.read_code_table(reader, hd.version);
    if (status != Error::Ok) {
        return status;
    }
    int num_bits_lut = 0;
    status = huffman.build_tree_from_codes(num_bits_lut);
    if (status != Error::Ok) {
        return status;
    }

    const int offset = (hd.dt == DataType::Char) ? 128 : 0;
    const int height = hd.n_rows;
    const int width = hd.n_cols;
    const auto n_depth = static_cast<std::size_t>(hd.n_depth);
    const bool all_valid = hd.num_valid_pixel == width * height;
    const auto row_stride = static_cast<std::size_t>(width) * n_depth;

    const std::uint8_t* stream = reader.current();
    const std::size_t stream_size = reader.remaining();
    std::size_t pos = 0;
    int bit_pos = 0;
    int val = 0;

    if (image_encode_mode_ == ImageEncodeMode::DeltaHuffman) {
        for (std::size_t i_depth = 0; i_depth < n_depth; ++i_depth) {
            T prev_val = T(0);
            for (int i = 0; i < height; ++i) {
                for (int j = 0; j < width; ++j) {
                    const int k = i * width + j;
                    if (!all_valid && !bit_mask_.is_valid(k)) {
                        continue;
                    }
                    const std::size_t m = static_cast<std::size_t>(k) * n_depth + i_depth;

                    status = huffman.decode_one_value(stream, stream_size, pos, bit_pos, val);
                    if (status != Error::Ok) {
                        return status;
                    }
                    T delta = static_cast<T>(val - offset);

                    if (j > 0 && (all_valid || bit_mask_.is_valid(k - 1))) {
                        delta = wrapping_add(delta, prev_val);
                    } else if (i > 0 && (all_valid || bit_mask_.is_valid(k - width))) {
                        delta = wrapping_add(delta, output[m - row_stride]);
                    } else {
                        delta = wrapping_add(delta, prev_val);
                    }

                    output[m] = delta;
                    prev_val = delta;
                }
            }
        }
    } else if (image_encode_mode_ == ImageEncodeMode::Huffman) {
        for (int k = 0; k < width * height; ++k) {
            if (!all_valid && !bit_mask_.is_valid(k)) {
                continue;
            }
            T* dst = output + static_cast<std::size_t>(k) * n_depth;
            for (std::size_t m = 0; m < n_depth; ++m) {
                status = huffman.decode_one_value(stream, stream_size, pos, bit_pos, val);
                if (status != Error::Ok) {
                    return status;
                }
                dst[m] = static_cast<T>(val - offset);
            }
        }
    } else {
        return Error::InvalidHuffman;
    }

    // The decoder may have looked one word ahead; the encoder accounts for it.
    const std::size_t consumed = pos + (static_cast<std::size_t>(bit_pos > 0 ? 1 : 0) + 1) * 4;
    return reader.skip(consumed);
}

template <typename T> Error Lerc2Decoder::decode_fpl(ByteReader& reader, T* output) {
    const HeaderInfo& hd = header_info_;

    std::vector<std::uint8_t> bytes;
    Error status = fpl_decode(reader, hd.dt == DataType::Double, hd.n_cols, hd.n_rows,
                              hd.n_depth, bytes);
    if (status != Error::Ok) {
        return status;
    }

    const std::size_t total = hd.num_pixels() * static_cast<std::size_t>(hd.n_depth);
    const std::size_t unit = (hd.dt == DataType::Double) ? 8U : 4U;
    if (bytes.size() != total * unit) {
        return Error::InvalidFpl;
    }

    for (std::size_t i = 0; i < total; ++i) {
        double z = (unit == 8) ? detail::load_le<double>(bytes.data() + i * 8)
                               : static_cast<double>(detail::load_le<float>(bytes.data() + i * 4));
        output[i] = convert_value<T>(z);
    }
    return Error::Ok;
}

// ============================================================================
// Explicit instantiations
// ============================================================================

template Error Lerc2Decoder::decode<std::int8_t>(const std::uint8_t*, std::size_t, std::size_t&,
                                                 std::int8_t*, std::size_t);
template Error Lerc2Decoder::decode<std::uint8_t>(const std::uint8_t*, std::size_t, std::size_t&,
                                                  std::uint8_t*, std::size_t);
template Error Lerc2Decoder::decode<std::int16_t>(const std::uint8_t*, std::size_t, std::size_t&,
                                                  std::int16_t*, std::size_t);
template Error Lerc2Decoder::decode<std::uint16_t>(const std::uint8_t*, std::size_t,
                                                   std::size_t&, std::uint16_t*, std::size_t);
template Error Lerc2Decoder::decode<std::int32_t>(const std::uint8_t*, std::size_t, std::size_t&,
                                                  std::int32_t*, std::size_t);
template Error Lerc2Decoder::decode<std::uint32_t>(const std::uint8_t*, std::size_t,
                                                   std::size_t&, std::uint32_t*, std::size_t);
template Error Lerc2Decoder::decode<float>(const std::uint8_t*, std::size_t, std::size_t&, float*,
                                           std::size_t);
template Error Lerc2Decoder::decode<double>(const std::uint8_t*, std::size_t, std::size_t&,
                                            double*, std::size_t);

} // namespace lercdec
