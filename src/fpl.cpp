/**
 * @file fpl.cpp
 * @brief Float-point lossless stream decoding.
 */

#include <lercdec/fpl.hpp>
#include <lercdec/huffman.hpp>

namespace lercdec {

namespace {

Error decode_plane(const std::uint8_t* data, std::size_t size, std::size_t expected,
                   std::vector<std::uint8_t>& plane) {
    if (size == 0) {
        return Error::Underflow;
    }

    switch (static_cast<FplPlaneMode>(data[0])) {
    case FplPlaneMode::Huffman: {
        ByteReader reader(data + 1, size - 1);
        Huffman huffman;
        Error status = huffman.read_code_table(reader, 5);
        if (status != Error::Ok) {
            return status;
        }
        int num_bits_lut = 0;
        status = huffman.build_tree_from_codes(num_bits_lut);
        if (status != Error::Ok) {
            return status;
        }

        const std::uint8_t* stream = reader.current();
        const std::size_t stream_size = reader.remaining();
        std::size_t pos = 0;
        int bit_pos = 0;

        plane.resize(expected);
        for (std::size_t i = 0; i < expected; ++i) {
            int value = 0;
            status = huffman.decode_one_value(stream, stream_size, pos, bit_pos, value);
            if (status != Error::Ok) {
                return status;
            }
            plane[i] = static_cast<std::uint8_t>(value);
        }
        return Error::Ok;
    }
    case FplPlaneMode::ConstRun: {
        if (size < 6) {
            return Error::Underflow;
        }
        std::uint32_t count = detail::load_le<std::uint32_t>(data + 2);
        if (count != expected) {
            return Error::InvalidFpl;
        }
        plane.assign(expected, data[1]);
        return Error::Ok;
    }
    case FplPlaneMode::Raw:
        if (size - 1 < expected) {
            return Error::Underflow;
        }
        plane.assign(data + 1, data + 1 + expected);
        return Error::Ok;
    case FplPlaneMode::PackBits:
        return fpl_decode_packbits(data + 1, size - 1, expected, plane);
    default:
        return Error::InvalidFpl;
    }
}

template <typename U, U (*Add)(U, U) noexcept>
void restore_block_sequence(int delta, std::vector<U>& values, std::size_t cols, std::size_t rows) {
    if (delta == 2) {
        for (std::size_t row = 0; row < rows; ++row) {
            U* line = values.data() + row * cols;
            for (std::size_t i = 2; i < cols; ++i) {
                line[i] = Add(line[i], line[i - 1]);
            }
        }
    }
    if (delta >= 1) {
        for (std::size_t row = 0; row < rows; ++row) {
            U* line = values.data() + row * cols;
            for (std::size_t i = 1; i < cols; ++i) {
                line[i] = Add(line[i], line[i - 1]);
            }
        }
    }
}

template <typename U, U (*Add)(U, U) noexcept>
void restore_cross(std::vector<U>& values, std::size_t cols, std::size_t rows) {
    for (std::size_t col = 0; col < cols; ++col) {
        for (std::size_t row = 1; row < rows; ++row) {
            std::size_t idx = row * cols + col;
            values[idx] = Add(values[idx], values[idx - cols]);
        }
    }
    for (std::size_t row = 0; row < rows; ++row) {
        U* line = values.data() + row * cols;
        for (std::size_t i = 1; i < cols; ++i) {
            line[i] = Add(line[i], line[i - 1]);
        }
    }
}

/// Undo the predictor on the reassembled samples, in place
template <typename U, U (*Add)(U, U) noexcept>
void restore_samples(FplPredictor predictor, std::vector<std::uint8_t>& bytes, std::size_t cols,
                     std::size_t rows) {
    std::size_t n = cols * rows;
    std::vector<U> values(n);
    for (std::size_t i = 0; i < n; ++i) {
        values[i] = detail::load_le<U>(bytes.data() + i * sizeof(U));
    }

    if (predictor == FplPredictor::RowsCols) {
        restore_cross<U, Add>(values, cols, rows);
    } else {
        restore_block_sequence<U, Add>(static_cast<int>(predictor), values, cols, rows);
    }

    for (std::size_t i = 0; i < n; ++i) {
        U v = values[i];
        if constexpr (sizeof(U) == 4) {
            v = fpl_undo_move_bits_to_front(v);
        }
        for (std::size_t b = 0; b < sizeof(U); ++b) {
            bytes[i * sizeof(U) + b] = static_cast<std::uint8_t>(v >> (8U * b));
        }
    }
}

Error decode_slice(ByteReader& reader, bool is_double, std::size_t cols, std::size_t rows,
                   std::vector<std::uint8_t>& output) {
    const std::size_t unit_size = is_double ? 8U : 4U;
    const std::size_t expected = cols * rows;

    std::uint8_t predictor_code = 0;
    Error status = reader.read(predictor_code);
    if (status != Error::Ok) {
        return status;
    }
    if (predictor_code > 2) {
        return Error::InvalidFpl;
    }
    auto predictor = static_cast<FplPredictor>(predictor_code);

    output.assign(expected * unit_size, 0);
    std::vector<std::uint8_t> plane;

    for (std::size_t p = 0; p < unit_size; ++p) {
        const std::uint8_t* record = nullptr;
        status = reader.read_bytes(6, record);
        if (status != Error::Ok) {
            return status;
        }

        std::uint8_t byte_index = record[0];
        std::uint8_t level = record[1];
        std::uint32_t payload_size = detail::load_le<std::uint32_t>(record + 2);

        if (byte_index >= unit_size || level > MAX_FPL_DELTA) {
            return Error::InvalidFpl;
        }

        const std::uint8_t* payload = nullptr;
        status = reader.read_bytes(payload_size, payload);
        if (status != Error::Ok) {
            return status;
        }

        status = decode_plane(payload, payload_size, expected, plane);
        if (status != Error::Ok) {
            return status;
        }

        fpl_restore_sequence(plane.data(), plane.size(), level);

        for (std::size_t i = 0; i < expected; ++i) {
            output[i * unit_size + byte_index] = plane[i];
        }
    }

    if (is_double) {
        restore_samples<std::uint64_t, fpl_add_double>(predictor, output, cols, rows);
    } else {
        restore_samples<std::uint32_t, fpl_add_float>(predictor, output, cols, rows);
    }
    return Error::Ok;
}

} // namespace

Error fpl_decode_packbits(const std::uint8_t* data, std::size_t size, std::size_t expected,
                          std::vector<std::uint8_t>& output) {
    output.clear();
    output.reserve(expected);

    std::size_t i = 0;
    while (i < size && output.size() < expected) {
        int b = data[i];
        if (b <= 127) {
            std::size_t run = static_cast<std::size_t>(b) + 1;
            if (size - i - 1 < run) {
                return Error::Underflow;
            }
            output.insert(output.end(), data + i + 1, data + i + 1 + run);
            i += run + 1;
        } else {
            if (i + 1 >= size) {
                return Error::Underflow;
            }
            output.insert(output.end(), static_cast<std::size_t>(b - 126), data[i + 1]);
            i += 2;
        }
    }

    return (output.size() == expected) ? Error::Ok : Error::InvalidFpl;
}

Error fpl_decode(ByteReader& reader, bool is_double, int width, int height, int depth,
                 std::vector<std::uint8_t>& output) {
    if (width <= 0 || height <= 0 || depth <= 0) {
        return Error::InvalidArg;
    }

    auto w = static_cast<std::size_t>(width);
    auto h = static_cast<std::size_t>(height);
    if (depth == 1) {
        return decode_slice(reader, is_double, w, h, output);
    }
    return decode_slice(reader, is_double, static_cast<std::size_t>(depth), w * h, output);
}

} // namespace lercdec
