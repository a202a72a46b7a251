/**
 * @file byte_reader.hpp
 * @brief Bounds-checked little-endian reads from a blob.
 *
 * All multi-byte fields of a Lerc2 blob are little-endian. The reader
 * assembles them byte by byte, so results do not depend on host byte
 * order or alignment.
 */

#ifndef LERCDEC_BYTE_READER_HPP
#define LERCDEC_BYTE_READER_HPP

#include "config.hpp"
#include "error.hpp"

#include <cstring>
#include <type_traits>

namespace lercdec {

namespace detail {

/**
 * @brief Load an unsigned little-endian integer of sizeof(U) bytes.
 *
 * @warning Caller must ensure sizeof(U) bytes are readable at p.
 */
template <typename U> inline U load_le_unsigned(const std::uint8_t* p) noexcept {
    static_assert(std::is_unsigned_v<U>, "unsigned type required");
    U value = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        value |= static_cast<U>(static_cast<U>(p[i]) << (8U * i));
    }
    return value;
}

/// Unsigned integer type with the same width as T
template <typename T>
using bits_of_t = std::conditional_t<
    sizeof(T) == 1, std::uint8_t,
    std::conditional_t<sizeof(T) == 2, std::uint16_t,
                       std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>>>;

/**
 * @brief Load any arithmetic value stored little-endian.
 *
 * @warning Caller must ensure sizeof(T) bytes are readable at p.
 */
template <typename T> inline T load_le(const std::uint8_t* p) noexcept {
    static_assert(std::is_arithmetic_v<T>, "arithmetic type required");
    using U = bits_of_t<T>;
    U raw = load_le_unsigned<U>(p);
    if constexpr (std::is_same_v<T, U>) {
        return raw;
    } else {
        T value;
        std::memcpy(&value, &raw, sizeof(T));
        return value;
    }
}

} // namespace detail

/**
 * @brief Sequential byte cursor over an immutable buffer.
 *
 * Every read checks the remaining length first and reports
 * Error::Underflow without moving the cursor when it is too short.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to source buffer
     * @param size Number of readable bytes
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Read a little-endian arithmetic value.
     *
     * @param[out] value Decoded value
     * @return Error::Ok, or Error::Underflow if fewer than sizeof(T) bytes remain
     */
    template <typename T> Error read(T& value) noexcept {
        if (remaining() < sizeof(T)) [[unlikely]] {
            return Error::Underflow;
        }
        value = detail::load_le<T>(data_ + pos_);
        pos_ += sizeof(T);
        return Error::Ok;
    }

    /**
     * @brief Borrow the next n bytes and advance past them.
     *
     * @param n Number of bytes
     * @param[out] ptr Start of the borrowed bytes
     * @return Error::Ok, or Error::Underflow
     */
    Error read_bytes(std::size_t n, const std::uint8_t*& ptr) noexcept {
        if (remaining() < n) [[unlikely]] {
            return Error::Underflow;
        }
        ptr = data_ + pos_;
        pos_ += n;
        return Error::Ok;
    }

    /**
     * @brief Advance by n bytes.
     * @return Error::Ok, or Error::Underflow
     */
    Error skip(std::size_t n) noexcept {
        if (remaining() < n) [[unlikely]] {
            return Error::Underflow;
        }
        pos_ += n;
        return Error::Ok;
    }

    /// Pointer to the next unread byte
    [[nodiscard]] const std::uint8_t* current() const noexcept {
        return data_ + pos_;
    }

    /// Bytes consumed so far
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /// Bytes left to read
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

    /// Total buffer size
    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace lercdec

#endif // LERCDEC_BYTE_READER_HPP
