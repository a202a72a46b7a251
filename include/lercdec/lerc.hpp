/**
 * @file lerc.hpp
 * @brief LERC blob decoding API.
 *
 * A buffer may hold several single-band Lerc2 blobs back to back, one per
 * band. get_blob_info() walks the headers; decode() decodes every band
 * into one pixel buffer laid out band after band, each band
 * rows x cols x depth values in row-major pixel order.
 *
 * Usage:
 * @code
 * lercdec::DecodedData result;
 * if (lercdec::decode(blob.data(), blob.size(), result) == lercdec::Error::Ok) {
 *     const auto* pixels = result.pixels.get_if<float>();
 * }
 * @endcode
 */

#ifndef LERCDEC_LERC_HPP
#define LERCDEC_LERC_HPP

#include "config.hpp"
#include "error.hpp"
#include "lerc2.hpp"

#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace lercdec {

/**
 * @brief Metadata aggregated over all bands of a buffer.
 */
struct LercInfo {
    int version = 0;         ///< codec version of the first band
    int n_depth = 0;         ///< values per pixel
    int n_cols = 0;
    int n_rows = 0;
    int num_valid_pixel = 0; ///< valid pixels of the first band
    int n_bands = 0;
    int n_masks = 0;         ///< 0 (all valid), 1 (shared) or n_bands
    int n_uses_no_data_value = 0;
    std::size_t blob_size = 0; ///< bytes covered by all bands
    DataType data_type = DataType::Undefined;
    double z_min = 0.0;       ///< minimum over bands
    double z_max = 0.0;       ///< maximum over bands
    double max_z_error = 0.0; ///< maximum over bands

    [[nodiscard]] std::size_t num_values() const noexcept {
        return static_cast<std::size_t>(n_rows) * static_cast<std::size_t>(n_cols) *
               static_cast<std::size_t>(n_depth) * static_cast<std::size_t>(n_bands);
    }
};

/**
 * @brief Decoded pixels, typed by the blob's data type.
 */
class PixelBuffer {
public:
    using Storage = std::variant<std::vector<std::int8_t>, std::vector<std::uint8_t>,
                                 std::vector<std::int16_t>, std::vector<std::uint16_t>,
                                 std::vector<std::int32_t>, std::vector<std::uint32_t>,
                                 std::vector<float>, std::vector<double>>;

    PixelBuffer() = default;

    template <typename T>
    explicit PixelBuffer(std::vector<T> values) : storage_(std::move(values)) {}

    [[nodiscard]] std::size_t size() const {
        return std::visit([](const auto& v) { return v.size(); }, storage_);
    }

    [[nodiscard]] bool empty() const {
        return size() == 0;
    }

    [[nodiscard]] DataType data_type() const {
        return std::visit(
            [](const auto& v) {
                using T = typename std::decay_t<decltype(v)>::value_type;
                return DataTypeOf<T>::value;
            },
            storage_);
    }

    /// Pixel vector if the buffer holds type T, else nullptr
    template <typename T> [[nodiscard]] const std::vector<T>* get_if() const noexcept {
        return std::get_if<std::vector<T>>(&storage_);
    }

    template <typename T> [[nodiscard]] std::vector<T>* get_if() noexcept {
        return std::get_if<std::vector<T>>(&storage_);
    }

    /// Value at index i converted to double
    [[nodiscard]] double value_at(std::size_t i) const {
        return std::visit([i](const auto& v) { return static_cast<double>(v[i]); }, storage_);
    }

    [[nodiscard]] const Storage& storage() const noexcept {
        return storage_;
    }

private:
    Storage storage_;
};

/**
 * @brief Result of a full decode.
 */
struct DecodedData {
    PixelBuffer pixels;

    /// Validity per pixel; one mask for all bands when info.n_masks == 1,
    /// band masks concatenated when n_masks == n_bands, absent when all valid.
    std::optional<std::vector<bool>> mask;

    LercInfo info;

    std::vector<bool> uses_no_data;    ///< per band: blob carries a no-data value
    std::vector<double> no_data_values; ///< per band: the no-data value
};

/**
 * @brief Walk the band headers of a buffer.
 *
 * Stops after a v6+ band announcing no further blobs, at the end of the
 * buffer, or at the first position where no header parses.
 *
 * @param data Buffer start
 * @param size Buffer size
 * @param[out] info Aggregated metadata
 * @return Error::Ok, Error::InvalidData when no header parses or bands
 *         disagree in size or type, Error::Underflow when a band is truncated,
 *         Error::Overflow when the decoded buffer would exceed MAX_DECODED_BYTES
 */
Error get_blob_info(const std::uint8_t* data, std::size_t size, LercInfo& info);

/**
 * @brief Decode every band of a buffer.
 *
 * Nothing is written to result unless all bands decode.
 *
 * @param data Buffer start
 * @param size Buffer size
 * @param[out] result Pixels, mask and metadata
 * @return Error::Ok, the first error of any band, or Error::Overflow when
 *         the pixel buffer cannot be allocated
 */
Error decode(const std::uint8_t* data, std::size_t size, DecodedData& result);

#if !LERCDEC_NO_EXCEPTIONS

/**
 * @brief Throwing variant of get_blob_info().
 * @throws LercException (or a subclass) on failure
 */
inline LercInfo get_blob_info(const std::uint8_t* data, std::size_t size) {
    LercInfo info;
    throw_if_error(get_blob_info(data, size, info), "LERC blob info");
    return info;
}

/**
 * @brief Throwing variant of decode().
 * @throws LercException (or a subclass) on failure
 */
inline DecodedData decode(const std::uint8_t* data, std::size_t size) {
    DecodedData result;
    throw_if_error(decode(data, size, result), "LERC decode");
    return result;
}

inline DecodedData decode(const std::vector<std::uint8_t>& blob) {
    return decode(blob.data(), blob.size());
}

#endif // !LERCDEC_NO_EXCEPTIONS

} // namespace lercdec

#endif // LERCDEC_LERC_HPP
