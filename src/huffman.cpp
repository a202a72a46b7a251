/**
 * @file huffman.cpp
 * @brief Huffman code table parsing and symbol decoding.
 */

#include <lercdec/bit_stuffer.hpp>
#include <lercdec/huffman.hpp>

#include <algorithm>

namespace lercdec {

void Huffman::clear() {
    code_table_.clear();
    decode_lut_.clear();
    tree_.clear();
    num_bits_lut_ = 0;
    num_bits_to_skip_in_tree_ = 0;
}

Error Huffman::read_code_table(ByteReader& reader, int lerc2_version) {
    clear();

    std::int32_t header[4] = {0, 0, 0, 0};
    for (std::int32_t& v : header) {
        Error status = reader.read(v);
        if (status != Error::Ok) {
            return status;
        }
    }

    const int version = header[0];
    const int size = header[1];
    const int i0 = header[2];
    const int i1 = header[3];

    if (version < 2) {
        return Error::InvalidHuffman;
    }
    if (i0 >= i1 || i0 < 0 || size < 0 || size > MAX_HISTO_SIZE) {
        return Error::InvalidHuffman;
    }
    if (get_index_wrap_around(i0, size) >= size || get_index_wrap_around(i1 - 1, size) >= size) {
        return Error::InvalidHuffman;
    }

    BitStuffer bit_stuffer;
    Error status = bit_stuffer.decode(reader, static_cast<std::size_t>(i1 - i0), lerc2_version);
    if (status != Error::Ok) {
        return status;
    }

    const std::vector<std::uint32_t>& lengths = bit_stuffer.values();
    if (lengths.size() != static_cast<std::size_t>(i1 - i0)) {
        return Error::InvalidHuffman;
    }

    code_table_.assign(static_cast<std::size_t>(size), {0, 0});

    for (int i = i0; i < i1; ++i) {
        std::uint32_t len = lengths[static_cast<std::size_t>(i - i0)];
        if (len > 32) {
            return Error::InvalidHuffman;
        }
        auto k = static_cast<std::size_t>(get_index_wrap_around(i, size));
        code_table_[k].first = static_cast<std::uint16_t>(len);
    }

    return bit_unstuff_codes(reader, i0, i1);
}

Error Huffman::bit_unstuff_codes(ByteReader& reader, int i0, int i1) {
    const std::uint8_t* data = reader.current();
    const std::size_t avail = reader.remaining();
    const int size = static_cast<int>(code_table_.size());

    std::size_t pos = 0;
    int bit_pos = 0;

    for (int i = i0; i < i1; ++i) {
        auto k = static_cast<std::size_t>(get_index_wrap_around(i, size));
        int len = code_table_[k].first;
        if (len == 0) {
            continue;
        }

        if (pos + 4 > avail) {
            return Error::Underflow;
        }

        std::uint32_t word = detail::load_le<std::uint32_t>(data + pos);
        std::uint32_t code = (word << bit_pos) >> (32 - len);

        if (32 - bit_pos >= len) {
            bit_pos += len;
            if (bit_pos == 32) {
                bit_pos = 0;
                pos += 4;
            }
        } else {
            bit_pos += len - 32;
            pos += 4;
            if (pos + 4 > avail) {
                return Error::Underflow;
            }
            word = detail::load_le<std::uint32_t>(data + pos);
            code |= word >> (32 - bit_pos);
        }

        code_table_[k].second = code;
    }

    return reader.skip(pos + (bit_pos > 0 ? 4U : 0U));
}

Error Huffman::get_range(int& i0, int& i1, int& max_len) const noexcept {
    if (code_table_.empty() || code_table_.size() >= static_cast<std::size_t>(MAX_HISTO_SIZE)) {
        return Error::InvalidHuffman;
    }

    const int size = static_cast<int>(code_table_.size());

    int i = 0;
    while (i < size && code_table_[static_cast<std::size_t>(i)].first == 0) {
        ++i;
    }
    const int i0_simple = i;

    i = size - 1;
    while (i >= 0 && code_table_[static_cast<std::size_t>(i)].first == 0) {
        --i;
    }
    const int i1_simple = i + 1;

    if (i1_simple <= i0_simple) {
        return Error::InvalidHuffman;
    }

    // Largest stretch of unused symbols; the used range may wrap around it.
    int segm_start = 0;
    int segm_len = 0;
    int j = 0;
    while (j < size) {
        while (j < size && code_table_[static_cast<std::size_t>(j)].first > 0) {
            ++j;
        }
        int k0 = j;
        while (j < size && code_table_[static_cast<std::size_t>(j)].first == 0) {
            ++j;
        }
        int k1 = j;

        if (k1 - k0 > segm_len) {
            segm_start = k0;
            segm_len = k1 - k0;
        }
    }

    if (size - segm_len < i1_simple - i0_simple) {
        i0 = segm_start + segm_len;
        i1 = segm_start + size;
    } else {
        i0 = i0_simple;
        i1 = i1_simple;
    }

    if (i1 <= i0) {
        return Error::InvalidHuffman;
    }

    max_len = 0;
    for (i = i0; i < i1; ++i) {
        auto k = static_cast<std::size_t>(get_index_wrap_around(i, size));
        max_len = std::max(max_len, static_cast<int>(code_table_[k].first));
    }

    if (max_len <= 0 || max_len > 32) {
        return Error::InvalidHuffman;
    }
    return Error::Ok;
}

Error Huffman::build_tree_from_codes(int& num_bits_lut) {
    int i0 = 0;
    int i1 = 0;
    int max_len = 0;
    Error status = get_range(i0, i1, max_len);
    if (status != Error::Ok) {
        return status;
    }

    const int size = static_cast<int>(code_table_.size());
    const bool need_tree = max_len > MAX_NUM_BITS_LUT;
    num_bits_lut_ = std::min(max_len, MAX_NUM_BITS_LUT);

    decode_lut_.assign(std::size_t{1} << num_bits_lut_, {-1, -1});
    tree_.clear();

    int min_num_zero_bits = 32;

    for (int i = i0; i < i1; ++i) {
        auto k = static_cast<std::size_t>(get_index_wrap_around(i, size));
        int len = code_table_[k].first;
        if (len == 0) {
            continue;
        }

        std::uint32_t code = code_table_[k].second;

        if (len <= num_bits_lut_) {
            std::uint32_t shifted = code << (num_bits_lut_ - len);
            std::uint32_t num_entries = 1U << (num_bits_lut_ - len);
            std::pair<std::int16_t, std::int16_t> entry(static_cast<std::int16_t>(len),
                                                        static_cast<std::int16_t>(k));
            for (std::uint32_t e = 0; e < num_entries; ++e) {
                decode_lut_[shifted | e] = entry;
            }
        } else {
            int code_bits = 1;
            while (code_bits < 32 && (code >> code_bits) != 0) {
                ++code_bits;
            }
            min_num_zero_bits = std::min(min_num_zero_bits, len - code_bits);
        }
    }

    num_bits_to_skip_in_tree_ = need_tree ? min_num_zero_bits : 0;
    num_bits_lut = num_bits_lut_;

    if (!need_tree) {
        return Error::Ok;
    }

    tree_.emplace_back();

    for (int i = i0; i < i1; ++i) {
        auto k = static_cast<std::size_t>(get_index_wrap_around(i, size));
        int len = code_table_[k].first;
        if (len <= num_bits_lut_) {
            continue;
        }

        std::uint32_t code = code_table_[k].second;
        int node = 0;

        for (int j = len - num_bits_to_skip_in_tree_ - 1; j >= 0; --j) {
            bool one = ((code >> j) & 1U) != 0;
            int next = one ? tree_[static_cast<std::size_t>(node)].child1
                           : tree_[static_cast<std::size_t>(node)].child0;
            if (next < 0) {
                next = static_cast<int>(tree_.size());
                tree_.emplace_back();
                if (one) {
                    tree_[static_cast<std::size_t>(node)].child1 = next;
                } else {
                    tree_[static_cast<std::size_t>(node)].child0 = next;
                }
            }
            node = next;
        }
        tree_[static_cast<std::size_t>(node)].value = static_cast<std::int16_t>(k);
    }

    return Error::Ok;
}

Error Huffman::decode_one_value(const std::uint8_t* data, std::size_t size, std::size_t& pos,
                                int& bit_pos, int& value) const noexcept {
    if (bit_pos < 0 || bit_pos >= 32 || pos + 4 > size) [[unlikely]] {
        return Error::Underflow;
    }
    if (decode_lut_.empty()) [[unlikely]] {
        return Error::InvalidHuffman;
    }

    std::uint32_t word = detail::load_le<std::uint32_t>(data + pos);
    std::uint32_t index = (word << bit_pos) >> (32 - num_bits_lut_);

    if (32 - bit_pos < num_bits_lut_) {
        if (pos + 8 > size) {
            return Error::Underflow;
        }
        std::uint32_t next = detail::load_le<std::uint32_t>(data + pos + 4);
        index |= next >> (64 - bit_pos - num_bits_lut_);
    }

    const auto& entry = decode_lut_[index];
    if (entry.first >= 0) [[likely]] {
        value = entry.second;
        bit_pos += entry.first;
        if (bit_pos >= 32) {
            bit_pos -= 32;
            pos += 4;
        }
        return Error::Ok;
    }

    if (tree_.empty()) {
        return Error::InvalidHuffman;
    }

    // Codes longer than the table start with at least this many zeros.
    bit_pos += num_bits_to_skip_in_tree_;
    if (bit_pos >= 32) {
        bit_pos -= 32;
        pos += 4;
    }

    int node = 0;
    while (true) {
        if (pos + 4 > size) {
            return Error::Underflow;
        }
        word = detail::load_le<std::uint32_t>(data + pos);
        bool one = ((word << bit_pos) >> 31) != 0;
        ++bit_pos;
        if (bit_pos == 32) {
            bit_pos = 0;
            pos += 4;
        }

        const Node& current = tree_[static_cast<std::size_t>(node)];
        node = one ? current.child1 : current.child0;
        if (node < 0) {
            return Error::InvalidHuffman;
        }
        if (tree_[static_cast<std::size_t>(node)].value >= 0) {
            value = tree_[static_cast<std::size_t>(node)].value;
            return Error::Ok;
        }
    }
}

} // namespace lercdec
