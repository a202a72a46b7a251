/**
 * @file bit_mask.hpp
 * @brief Packed per-pixel validity mask.
 *
 * One bit per pixel in row-major order, MSB-first within each byte:
 * pixel k lives in byte k >> 3 at bit 7 - (k & 7).
 */

#ifndef LERCDEC_BIT_MASK_HPP
#define LERCDEC_BIT_MASK_HPP

#include "config.hpp"
#include "error.hpp"

#include <cstring>
#include <limits>
#include <vector>

namespace lercdec {

/**
 * @brief Validity bitmap sized width x height.
 *
 * Reads and writes outside the mask are tolerated: queries return false
 * and updates are ignored.
 */
class BitMask {
public:
    BitMask() noexcept = default;

    /**
     * @brief Create a zeroed (all invalid) mask.
     *
     * @param n_cols Width in pixels
     * @param n_rows Height in pixels
     * @param[out] mask Resized mask
     * @return Error::Ok, or Error::InvalidDimensions (see set_size())
     */
    static Error with_size(int n_cols, int n_rows, BitMask& mask) {
        mask.clear();
        return mask.set_size(n_cols, n_rows);
    }

    /**
     * @brief Resize the mask.
     *
     * Keeps the current bits when the dimensions do not change, otherwise
     * the mask is reset to all invalid.
     *
     * @return Error::Ok, or Error::InvalidDimensions if either size is <= 0
     *         or the pixel count does not fit an int
     */
    Error set_size(int n_cols, int n_rows) {
        if (n_cols <= 0 || n_rows <= 0) {
            return Error::InvalidDimensions;
        }
        if (n_rows > std::numeric_limits<int>::max() / n_cols) {
            return Error::InvalidDimensions;
        }
        if (n_cols == n_cols_ && n_rows == n_rows_) {
            return Error::Ok;
        }
        n_cols_ = n_cols;
        n_rows_ = n_rows;
        bits_.assign(num_bytes(), 0);
        return Error::Ok;
    }

    /// Release storage and reset dimensions to zero
    void clear() noexcept {
        bits_.clear();
        n_cols_ = 0;
        n_rows_ = 0;
    }

    [[nodiscard]] int width() const noexcept {
        return n_cols_;
    }

    [[nodiscard]] int height() const noexcept {
        return n_rows_;
    }

    /// Number of pixels covered
    [[nodiscard]] std::size_t num_pixels() const noexcept {
        return static_cast<std::size_t>(n_cols_) * static_cast<std::size_t>(n_rows_);
    }

    /// Storage size in bytes, ceil(width * height / 8)
    [[nodiscard]] std::size_t size() const noexcept {
        return bits_.size();
    }

    [[nodiscard]] const std::uint8_t* bits() const noexcept {
        return bits_.data();
    }

    [[nodiscard]] std::uint8_t* bits() noexcept {
        return bits_.data();
    }

    [[nodiscard]] inline bool is_valid(int k) const noexcept {
        if (k < 0) [[unlikely]] {
            return false;
        }
        std::size_t byte_idx = static_cast<std::size_t>(k) >> 3;
        if (byte_idx >= bits_.size()) [[unlikely]] {
            return false;
        }
        return (bits_[byte_idx] & bit(k)) != 0;
    }

    [[nodiscard]] bool is_valid_at(int row, int col) const noexcept {
        if (!contains(row, col)) [[unlikely]] {
            return false;
        }
        return is_valid(row * n_cols_ + col);
    }

    inline void set_valid(int k) noexcept {
        if (k < 0 || (static_cast<std::size_t>(k) >> 3) >= bits_.size()) [[unlikely]] {
            return;
        }
        bits_[static_cast<std::size_t>(k) >> 3] |= bit(k);
    }

    inline void set_invalid(int k) noexcept {
        if (k < 0 || (static_cast<std::size_t>(k) >> 3) >= bits_.size()) [[unlikely]] {
            return;
        }
        bits_[static_cast<std::size_t>(k) >> 3] &= static_cast<std::uint8_t>(~bit(k));
    }

    void set_valid_at(int row, int col) noexcept {
        if (contains(row, col)) [[likely]] {
            set_valid(row * n_cols_ + col);
        }
    }

    void set_invalid_at(int row, int col) noexcept {
        if (contains(row, col)) [[likely]] {
            set_invalid(row * n_cols_ + col);
        }
    }

    void set_all_valid() noexcept {
        std::memset(bits_.data(), 0xFF, bits_.size());
    }

    void set_all_invalid() noexcept {
        std::memset(bits_.data(), 0, bits_.size());
    }

    /**
     * @brief Count valid pixels.
     *
     * Padding bits past width * height in the last byte are ignored.
     */
    [[nodiscard]] std::size_t count_valid_bits() const noexcept {
        std::size_t n = num_pixels();
        std::size_t full_bytes = n >> 3;
        std::size_t count = 0;

        for (std::size_t i = 0; i < full_bytes; ++i) {
            count += static_cast<std::size_t>(__builtin_popcount(bits_[i]));
        }

        std::size_t tail = n & 7;
        if (tail != 0) {
            std::uint8_t tail_mask = static_cast<std::uint8_t>(0xFFU << (8 - tail));
            count += static_cast<std::size_t>(__builtin_popcount(bits_[full_bytes] & tail_mask));
        }
        return count;
    }

    /**
     * @brief Replace the mask bits with an external packed buffer.
     *
     * @param src Packed bits in mask layout
     * @param src_size Bytes available at src (at least size())
     * @return Error::Ok, or Error::Underflow if src is too short
     */
    Error copy_from(const std::uint8_t* src, std::size_t src_size) noexcept {
        if (src_size < bits_.size()) {
            return Error::Underflow;
        }
        if (!bits_.empty()) {
            std::memcpy(bits_.data(), src, bits_.size());
        }
        return Error::Ok;
    }

    /// One entry per pixel, row-major
    [[nodiscard]] std::vector<bool> to_bool_vec() const {
        std::size_t n = num_pixels();
        std::vector<bool> out(n);
        for (std::size_t k = 0; k < n; ++k) {
            out[k] = (bits_[k >> 3] & (0x80U >> (k & 7))) != 0;
        }
        return out;
    }

private:
    static inline std::uint8_t bit(int k) noexcept {
        return static_cast<std::uint8_t>(0x80U >> (static_cast<unsigned>(k) & 7U));
    }

    [[nodiscard]] bool contains(int row, int col) const noexcept {
        return row >= 0 && row < n_rows_ && col >= 0 && col < n_cols_;
    }

    [[nodiscard]] std::size_t num_bytes() const noexcept {
        return (num_pixels() + 7) >> 3;
    }

    std::vector<std::uint8_t> bits_;
    int n_cols_ = 0;
    int n_rows_ = 0;
};

} // namespace lercdec

#endif // LERCDEC_BIT_MASK_HPP
