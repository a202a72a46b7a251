/**
 * @file bit_stuffer.cpp
 * @brief Bit-stuffed block decoder implementation.
 */

#include <lercdec/bit_stuffer.hpp>

namespace lercdec {

const BitStuffer::UnstuffFn BitStuffer::LAYOUTS[2] = {
    &BitStuffer::bit_unstuff_before_v3,
    &BitStuffer::bit_unstuff,
};

Error BitStuffer::decode_uint(ByteReader& reader, int num_bytes, std::uint32_t& value) noexcept {
    switch (num_bytes) {
    case 1: {
        std::uint8_t v = 0;
        Error status = reader.read(v);
        value = v;
        return status;
    }
    case 2: {
        std::uint16_t v = 0;
        Error status = reader.read(v);
        value = v;
        return status;
    }
    case 4:
        return reader.read(value);
    default:
        return Error::InvalidBitStuffing;
    }
}

Error BitStuffer::decode(ByteReader& reader, std::size_t max_element_count, int lerc2_version) {
    values_.clear();

    std::uint8_t control = 0;
    Error status = reader.read(control);
    if (status != Error::Ok) {
        return status;
    }

    int bits67 = control >> 6;
    int count_bytes = (bits67 == 0) ? 4 : 3 - bits67;
    bool do_lut = (control & (1U << 5)) != 0;
    int num_bits = control & 31;

    std::uint32_t num_elements = 0;
    status = decode_uint(reader, count_bytes, num_elements);
    if (status != Error::Ok) {
        return status;
    }
    if (num_elements > max_element_count) {
        return Error::InvalidBitStuffing;
    }

    if (!do_lut) {
        if (num_bits == 0) {
            values_.assign(num_elements, 0);
            return Error::Ok;
        }
        return unstuff(reader, values_, num_elements, num_bits, lerc2_version);
    }

    if (num_bits == 0) {
        return Error::InvalidBitStuffing;
    }

    std::uint8_t lut_size = 0;
    status = reader.read(lut_size);
    if (status != Error::Ok) {
        return status;
    }

    // The stored table omits entry 0, which is always the value 0.
    int n_lut = static_cast<int>(lut_size) - 1;
    if (n_lut < 1) {
        return Error::InvalidBitStuffing;
    }

    status = unstuff(reader, lut_, static_cast<std::uint32_t>(n_lut), num_bits, lerc2_version);
    if (status != Error::Ok) {
        return status;
    }

    int index_bits = 0;
    while ((n_lut >> index_bits) != 0) {
        ++index_bits;
    }

    status = unstuff(reader, values_, num_elements, index_bits, lerc2_version);
    if (status != Error::Ok) {
        return status;
    }

    lut_.insert(lut_.begin(), 0U);

    for (std::uint32_t& v : values_) {
        if (v >= lut_.size()) [[unlikely]] {
            return Error::InvalidBitStuffing;
        }
        v = lut_[v];
    }

    return Error::Ok;
}

Error BitStuffer::unstuff(ByteReader& reader, std::vector<std::uint32_t>& out,
                          std::uint32_t num_elements, int num_bits, int lerc2_version) {
    if (num_elements == 0 || num_bits <= 0 || num_bits >= 32) {
        return Error::InvalidBitStuffing;
    }
    UnstuffFn fn = LAYOUTS[lerc2_version >= 3 ? 1 : 0];
    return (this->*fn)(reader, out, num_elements, num_bits);
}

Error BitStuffer::load_words(ByteReader& reader, std::uint32_t num_elements, int num_bits,
                             std::size_t num_bytes) {
    std::uint64_t total_bits =
        static_cast<std::uint64_t>(num_elements) * static_cast<std::uint64_t>(num_bits);
    std::size_t num_words = static_cast<std::size_t>((total_bits + 31) / 32);

    const std::uint8_t* src = nullptr;
    Error status = reader.read_bytes(num_bytes, src);
    if (status != Error::Ok) {
        return status;
    }

    words_.assign(num_words, 0U);
    for (std::size_t i = 0; i < num_bytes; ++i) {
        words_[i >> 2] |= static_cast<std::uint32_t>(src[i]) << (8U * (i & 3U));
    }
    return Error::Ok;
}

Error BitStuffer::bit_unstuff(ByteReader& reader, std::vector<std::uint32_t>& out,
                              std::uint32_t num_elements, int num_bits) {
    std::uint64_t total_bits =
        static_cast<std::uint64_t>(num_elements) * static_cast<std::uint64_t>(num_bits);
    std::size_t num_bytes = static_cast<std::size_t>((total_bits + 31) / 32) * 4U -
                            num_tail_bytes_not_needed(num_elements, num_bits);

    Error status = load_words(reader, num_elements, num_bits, num_bytes);
    if (status != Error::Ok) {
        return status;
    }

    out.resize(num_elements);

    const std::uint32_t* src = words_.data();
    int bit_pos = 0;
    int nb = 32 - num_bits;

    for (std::uint32_t i = 0; i < num_elements; ++i) {
        if (nb - bit_pos >= 0) {
            out[i] = (*src << (nb - bit_pos)) >> nb;
            bit_pos += num_bits;
            if (bit_pos == 32) {
                ++src;
                bit_pos = 0;
            }
        } else {
            std::uint32_t value = *src >> bit_pos;
            ++src;
            value |= (*src << (64 - num_bits - bit_pos)) >> nb;
            out[i] = value;
            bit_pos -= nb;
        }
    }

    return Error::Ok;
}

Error BitStuffer::bit_unstuff_before_v3(ByteReader& reader, std::vector<std::uint32_t>& out,
                                        std::uint32_t num_elements, int num_bits) {
    std::uint64_t total_bits =
        static_cast<std::uint64_t>(num_elements) * static_cast<std::uint64_t>(num_bits);
    std::size_t num_bytes = static_cast<std::size_t>((total_bits + 7) / 8);

    Error status = load_words(reader, num_elements, num_bits, num_bytes);
    if (status != Error::Ok) {
        return status;
    }

    // Undo the down shift the encoder applied to the partial last word.
    std::uint32_t& last = words_.back();
    for (unsigned n = num_tail_bytes_not_needed(num_elements, num_bits); n > 0; --n) {
        last <<= 8;
    }

    out.resize(num_elements);

    const std::uint32_t* src = words_.data();
    int bit_pos = 0;

    for (std::uint32_t i = 0; i < num_elements; ++i) {
        if (32 - bit_pos >= num_bits) {
            out[i] = (*src << bit_pos) >> (32 - num_bits);
            bit_pos += num_bits;
            if (bit_pos == 32) {
                bit_pos = 0;
                ++src;
            }
        } else {
            std::uint32_t value = (*src << bit_pos) >> (32 - num_bits);
            ++src;
            bit_pos -= 32 - num_bits;
            value |= *src >> (32 - bit_pos);
            out[i] = value;
        }
    }

    return Error::Ok;
}

} // namespace lercdec
