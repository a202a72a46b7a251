/**
 * @file lerc.cpp
 * @brief Multi-band blob walker.
 */

#include <lercdec/lerc.hpp>

#include <algorithm>
#include <initializer_list>
#include <limits>
#include <new>
#include <type_traits>

namespace lercdec {

namespace {

bool same_layout(const LercInfo& info, const HeaderInfo& hd) noexcept {
    return hd.n_cols == info.n_cols && hd.n_rows == info.n_rows && hd.n_depth == info.n_depth &&
           hd.dt == info.data_type;
}

/// Output bytes for the whole buffer, or Error::Overflow past MAX_DECODED_BYTES
Error checked_output_bytes(const LercInfo& info, std::uint64_t& bytes) noexcept {
    bytes = data_type_size(info.data_type);
    for (int factor : {info.n_rows, info.n_cols, info.n_depth, info.n_bands}) {
        const auto f = static_cast<std::uint64_t>(factor);
        if (bytes > MAX_DECODED_BYTES / f) {
            return Error::Overflow;
        }
        bytes *= f;
    }
    if constexpr (sizeof(std::size_t) < sizeof(std::uint64_t)) {
        if (bytes > std::numeric_limits<std::size_t>::max()) {
            return Error::Overflow;
        }
    }
    return Error::Ok;
}

template <typename T> bool representable(double z) noexcept {
    if constexpr (std::is_floating_point_v<T>) {
        return true;
    } else {
        return z >= static_cast<double>(std::numeric_limits<T>::min()) &&
               z <= static_cast<double>(std::numeric_limits<T>::max());
    }
}

template <typename T> Error allocate(std::vector<T>& pixels, std::size_t n) {
    if (n > pixels.max_size()) {
        return Error::Overflow;
    }
#if !LERCDEC_NO_EXCEPTIONS
    try {
        pixels.resize(n);
    } catch (const std::bad_alloc&) {
        return Error::Overflow;
    }
#else
    pixels.resize(n);
#endif
    return Error::Ok;
}

/// Replace the internal no-data value of a band by the caller's one
template <typename T>
void remap_no_data(T* band, const std::vector<bool>* mask, std::size_t n_pixels,
                   std::size_t n_depth, double no_data_val, double no_data_val_orig) {
    if (!representable<T>(no_data_val) || !representable<T>(no_data_val_orig)) {
        return;
    }
    const auto internal = static_cast<T>(no_data_val);
    const auto original = static_cast<T>(no_data_val_orig);

    for (std::size_t k = 0; k < n_pixels; ++k) {
        if (mask != nullptr && !(*mask)[k]) {
            continue;
        }
        T* values = band + k * n_depth;
        for (std::size_t m = 0; m < n_depth; ++m) {
            if (values[m] == internal) {
                values[m] = original;
            }
        }
    }
}

template <typename T>
Error decode_bands(const std::uint8_t* data, std::size_t size, LercInfo info,
                   DecodedData& result) {
    const std::size_t n_pixels =
        static_cast<std::size_t>(info.n_rows) * static_cast<std::size_t>(info.n_cols);
    const auto n_depth = static_cast<std::size_t>(info.n_depth);
    const std::size_t band_size = n_pixels * n_depth;
    const auto n_bands = static_cast<std::size_t>(info.n_bands);

    std::vector<T> pixels;
    Error status = allocate(pixels, band_size * n_bands);
    if (status != Error::Ok) {
        return status;
    }
    std::vector<std::optional<std::vector<bool>>> band_masks(n_bands);
    std::vector<bool> uses_no_data(n_bands, false);
    std::vector<double> no_data_values(n_bands, 0.0);

    Lerc2Decoder decoder;
    std::size_t pos = 0;

    for (std::size_t b = 0; b < n_bands; ++b) {
        std::size_t bytes_remaining = 0;
        T* band = pixels.data() + b * band_size;
        const std::size_t capacity = pixels.size() - b * band_size;

        status = decoder.decode(data + pos, size - pos, bytes_remaining, band, capacity);
        if (status != Error::Ok) {
            return status;
        }

        band_masks[b] = decoder.get_mask_as_bool_vec();

        const HeaderInfo& hd = decoder.header_info();
        if (hd.pass_no_data_values != 0) {
            uses_no_data[b] = true;
            no_data_values[b] = hd.no_data_val_orig;
            if (n_depth > 1 && hd.no_data_val != hd.no_data_val_orig) {
                const std::vector<bool>* mask = band_masks[b] ? &*band_masks[b] : nullptr;
                remap_no_data(band, mask, n_pixels, n_depth, hd.no_data_val,
                              hd.no_data_val_orig);
            }
        }

        pos += static_cast<std::size_t>(hd.blob_size);
    }

    const bool any_mask =
        std::any_of(band_masks.begin(), band_masks.end(), [](const auto& m) { return m.has_value(); });

    std::optional<std::vector<bool>> mask;
    if (!any_mask) {
        info.n_masks = 0;
    } else if (std::all_of(band_masks.begin(), band_masks.end(),
                           [&](const auto& m) { return m == band_masks[0]; })) {
        info.n_masks = 1;
        mask = std::move(band_masks[0]);
    } else {
        info.n_masks = info.n_bands;
        std::vector<bool> all;
        all.reserve(n_pixels * n_bands);
        for (const auto& m : band_masks) {
            if (m) {
                all.insert(all.end(), m->begin(), m->end());
            } else {
                all.insert(all.end(), n_pixels, true);
            }
        }
        mask = std::move(all);
    }

    result.pixels = PixelBuffer(std::move(pixels));
    result.mask = std::move(mask);
    result.info = info;
    result.uses_no_data = std::move(uses_no_data);
    result.no_data_values = std::move(no_data_values);
    return Error::Ok;
}

} // namespace

Error get_blob_info(const std::uint8_t* data, std::size_t size, LercInfo& info) {
    if (data == nullptr || size == 0) {
        return Error::InvalidData;
    }

    LercInfo acc;
    std::size_t pos = 0;
    bool same_num_valid = true;
    bool any_mask = false;

    while (pos < size) {
        HeaderInfo hd;
        bool has_mask = false;
        if (Lerc2Decoder::get_header_info(data + pos, size - pos, hd, has_mask) != Error::Ok) {
            break;
        }

        const auto blob_size = static_cast<std::size_t>(hd.blob_size);
        if (blob_size > size - pos) {
            return Error::Underflow;
        }

        if (acc.n_bands == 0) {
            acc.version = hd.version;
            acc.n_depth = hd.n_depth;
            acc.n_cols = hd.n_cols;
            acc.n_rows = hd.n_rows;
            acc.num_valid_pixel = hd.num_valid_pixel;
            acc.data_type = hd.dt;
            acc.z_min = hd.z_min;
            acc.z_max = hd.z_max;
            acc.max_z_error = hd.max_z_error;
        } else {
            if (!same_layout(acc, hd)) {
                return Error::InvalidData;
            }
            acc.z_min = std::min(acc.z_min, hd.z_min);
            acc.z_max = std::max(acc.z_max, hd.z_max);
            acc.max_z_error = std::max(acc.max_z_error, hd.max_z_error);
            same_num_valid = same_num_valid && hd.num_valid_pixel == acc.num_valid_pixel;
        }

        any_mask = any_mask || has_mask || hd.num_valid_pixel == 0;
        if (hd.pass_no_data_values != 0) {
            ++acc.n_uses_no_data_value;
        }

        ++acc.n_bands;
        acc.blob_size += blob_size;
        pos += blob_size;

        if (hd.version >= 6 && hd.n_blobs_more == 0) {
            break;
        }
    }

    if (acc.n_bands == 0) {
        return Error::InvalidData;
    }

    std::uint64_t output_bytes = 0;
    Error status = checked_output_bytes(acc, output_bytes);
    if (status != Error::Ok) {
        return status;
    }

    // Header-level estimate; decode() refines it from the decoded masks.
    if (any_mask) {
        acc.n_masks = same_num_valid ? 1 : acc.n_bands;
    }

    info = acc;
    return Error::Ok;
}

Error decode(const std::uint8_t* data, std::size_t size, DecodedData& result) {
    LercInfo info;
    Error status = get_blob_info(data, size, info);
    if (status != Error::Ok) {
        return status;
    }

    switch (info.data_type) {
    case DataType::Char:
        return decode_bands<std::int8_t>(data, size, info, result);
    case DataType::Byte:
        return decode_bands<std::uint8_t>(data, size, info, result);
    case DataType::Short:
        return decode_bands<std::int16_t>(data, size, info, result);
    case DataType::UShort:
        return decode_bands<std::uint16_t>(data, size, info, result);
    case DataType::Int:
        return decode_bands<std::int32_t>(data, size, info, result);
    case DataType::UInt:
        return decode_bands<std::uint32_t>(data, size, info, result);
    case DataType::Float:
        return decode_bands<float>(data, size, info, result);
    case DataType::Double:
        return decode_bands<double>(data, size, info, result);
    default:
        return Error::UnsupportedDataType;
    }
}

} // namespace lercdec
