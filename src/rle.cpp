/**
 * @file rle.cpp
 * @brief Run-length decoder implementation.
 */

#include <lercdec/byte_reader.hpp>
#include <lercdec/rle.hpp>

#include <cstring>

namespace lercdec {

namespace {

inline Error read_count(ByteReader& reader, std::int16_t& count) noexcept {
    return reader.read(count);
}

/// Bytes a run consumes from the input after its count
inline std::size_t run_input_bytes(std::int16_t count) noexcept {
    return (count > 0) ? static_cast<std::size_t>(count) : 1U;
}

inline std::size_t run_length(std::int16_t count) noexcept {
    return (count > 0) ? static_cast<std::size_t>(count)
                       : static_cast<std::size_t>(-static_cast<int>(count));
}

} // namespace

Error rle_decompress(const std::uint8_t* input, std::size_t input_size, std::uint8_t* output,
                     std::size_t output_size) noexcept {
    if (input == nullptr || input_size < 2) {
        return Error::Underflow;
    }
    if (output == nullptr && output_size > 0) {
        return Error::InvalidArg;
    }

    ByteReader reader(input, input_size);
    std::size_t dst = 0;

    std::int16_t count = 0;
    Error status = read_count(reader, count);

    while (status == Error::Ok && count != RLE_EOF) {
        std::size_t len = run_length(count);

        const std::uint8_t* src = nullptr;
        if (reader.read_bytes(run_input_bytes(count), src) != Error::Ok) {
            return Error::Underflow;
        }
        if (len > output_size - dst) {
            return Error::Overflow;
        }

        if (count > 0) {
            std::memcpy(output + dst, src, len);
        } else if (len > 0) {
            std::memset(output + dst, *src, len);
        }
        dst += len;

        status = read_count(reader, count);
    }

    return status;
}

Error rle_decompressed_size(const std::uint8_t* input, std::size_t input_size,
                            std::size_t& size) noexcept {
    size = 0;
    if (input == nullptr || input_size < 2) {
        return Error::Underflow;
    }

    ByteReader reader(input, input_size);
    std::size_t total = 0;

    std::int16_t count = 0;
    Error status = read_count(reader, count);

    while (status == Error::Ok && count != RLE_EOF) {
        if (reader.skip(run_input_bytes(count)) != Error::Ok) {
            return Error::Underflow;
        }
        total += run_length(count);
        status = read_count(reader, count);
    }

    if (status == Error::Ok) {
        size = total;
    }
    return status;
}

Error rle_decompress_alloc(const std::uint8_t* input, std::size_t input_size,
                           std::vector<std::uint8_t>& output) {
    std::size_t size = 0;
    Error status = rle_decompressed_size(input, input_size, size);
    if (status != Error::Ok) {
        return status;
    }

    output.assign(size, 0);
    return rle_decompress(input, input_size, output.data(), output.size());
}

} // namespace lercdec
