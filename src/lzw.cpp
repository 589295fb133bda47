#include "lzw.hpp"
#include "rasterkit/errors.hpp"
#include "rasterkit/gif.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

namespace rk {
namespace gif {

namespace {

constexpr int kTableSize = 1 << kMaxCodeBits; // 4096

} // namespace

// ======================
//  LzwDecoder
// ======================

int LzwDecoder::read_code(int bits) {
    while (bit_count_ < bits) {
        if (block_pos_ == block_size_) {
            if (terminated_) return -1;
            block_size_ = reader_.read_u8();
            block_pos_ = 0;
            if (block_size_ == 0) {
                terminated_ = true;
                return -1;
            }
            reader_.read_bytes(block_.data(), block_size_);
        }
        bit_buffer_ |= static_cast<uint32_t>(block_[block_pos_++]) << bit_count_;
        bit_count_ += 8;
    }

    const int code = static_cast<int>(bit_buffer_ & ((1u << bits) - 1u));
    bit_buffer_ >>= bits;
    bit_count_ -= bits;
    return code;
}

void LzwDecoder::skip_remaining() {
    if (terminated_) return;
    // 目前這個 block 已經整個讀進 block_，只要往後跳過其餘 sub-block
    block_pos_ = block_size_;
    reader_.skip_sub_blocks();
    terminated_ = true;
}

void LzwDecoder::decode(int width, int height, int data_size, const RowCallback& on_row) {
    if (data_size < 1 || data_size > 8) {
        throw FormatError("gif: invalid LZW minimum code size " + std::to_string(data_size));
    }
    if (width <= 0 || height <= 0) return;

    const uint64_t total = static_cast<uint64_t>(width) * static_cast<uint64_t>(height);

    const int clear_code = 1 << data_size;
    const int end_code   = clear_code + 1;

    // 字典：每個 code = prefix code + 最後一個 index
    std::vector<uint16_t> prefix(kTableSize, 0);
    std::vector<uint8_t>  suffix(kTableSize, 0);
    std::vector<uint8_t>  first(kTableSize, 0);
    std::vector<uint16_t> length(kTableSize, 0);
    for (int i = 0; i < clear_code; ++i) {
        suffix[i] = static_cast<uint8_t>(i);
        first[i]  = static_cast<uint8_t>(i);
        length[i] = 1;
    }

    std::vector<uint8_t> row(static_cast<std::size_t>(width));
    std::vector<uint8_t> stack(kTableSize);
    int row_index = 0;
    int column = 0;
    uint64_t pos = 0;

    // 超過 total 的 index 直接丟掉
    auto put = [&](uint8_t index) {
        if (pos >= total) return;
        ++pos;
        row[static_cast<std::size_t>(column++)] = index;
        if (column == width) {
            on_row(row_index++, row.data());
            column = 0;
        }
    };

    // 沿著 prefix 往回收集，再依正序輸出
    auto write_string = [&](int code) {
        const std::size_t n = length[code];
        int c = code;
        for (std::size_t k = n; k-- > 0;) {
            stack[k] = suffix[c];
            c = prefix[c];
        }
        for (std::size_t k = 0; k < n; ++k) put(stack[k]);
    };

    int code_bits = data_size + 1;
    int next_code = clear_code + 2;
    int prev = -1;

    while (pos < total) {
        const int code = read_code(code_bits);
        if (code < 0) {
            throw FormatError("gif: LZW data ended after " + std::to_string(pos) +
                              " of " + std::to_string(total) + " pixels");
        }

        if (code == clear_code) {
            code_bits = data_size + 1;
            next_code = clear_code + 2;
            prev = -1;
            continue;
        }
        if (code == end_code) {
            throw FormatError("gif: LZW end code after " + std::to_string(pos) +
                              " of " + std::to_string(total) + " pixels");
        }

        if (prev < 0) {
            // clear 之後的第一個 code 一定是單一 index
            if (code >= clear_code) {
                throw FormatError("gif: LZW code " + std::to_string(code) + " without a prefix");
            }
            put(static_cast<uint8_t>(code));
            prev = code;
            continue;
        }

        if (code < next_code) {
            write_string(code);
            if (next_code < kTableSize) {
                prefix[next_code] = static_cast<uint16_t>(prev);
                suffix[next_code] = first[code];
                first[next_code]  = first[prev];
                length[next_code] = static_cast<uint16_t>(length[prev] + 1);
                ++next_code;
            }
        } else if (code == next_code && next_code < kTableSize) {
            // KwKwK：prev 的字串 + prev 的第一個 index
            prefix[next_code] = static_cast<uint16_t>(prev);
            suffix[next_code] = first[prev];
            first[next_code]  = first[prev];
            length[next_code] = static_cast<uint16_t>(length[prev] + 1);
            ++next_code;
            write_string(code);
        } else {
            throw FormatError("gif: invalid LZW code " + std::to_string(code) +
                              " (next free code " + std::to_string(next_code) + ")");
        }

        if (next_code >= (1 << code_bits) && code_bits < kMaxCodeBits) {
            ++code_bits;
        }
        prev = code;
    }
}

// ======================
//  LzwEncoder
// ======================

LzwEncoder::LzwEncoder(int data_size)
    : data_size_(data_size)
{
    if (data_size < 2 || data_size > 8) {
        throw ArgumentError("LzwEncoder: data size must be in [2, 8]");
    }
}

void LzwEncoder::emit(int code) {
    bit_buffer_ |= static_cast<uint32_t>(code) << bit_count_;
    bit_count_ += code_bits_;
    while (bit_count_ >= 8) {
        packed_.push_back(static_cast<uint8_t>(bit_buffer_ & 0xFF));
        bit_buffer_ >>= 8;
        bit_count_ -= 8;
    }
}

std::vector<uint8_t> LzwEncoder::encode(const std::vector<uint8_t>& indices) {
    const int clear_code = 1 << data_size_;
    const int end_code   = clear_code + 1;

    packed_.clear();
    bit_buffer_ = 0;
    bit_count_  = 0;
    code_bits_  = data_size_ + 1;

    // key = (prefix code << 8) | index
    std::unordered_map<uint32_t, uint16_t> table;
    table.reserve(kTableSize);
    int next_code = end_code + 1;

    emit(clear_code);

    if (!indices.empty()) {
        int current = indices[0] & (clear_code - 1);
        // clear 之後已經送出幾個 code；decoder 只在第二個 code 起才新增字典
        int emitted_since_clear = 0;

        for (std::size_t i = 1; i < indices.size(); ++i) {
            const int index = indices[i] & (clear_code - 1);
            const uint32_t key = (static_cast<uint32_t>(current) << 8) | static_cast<uint32_t>(index);

            const auto it = table.find(key);
            if (it != table.end()) {
                current = it->second;
                continue;
            }

            emit(current);
            ++emitted_since_clear;

            if (next_code < kTableSize) {
                table.emplace(key, static_cast<uint16_t>(next_code++));
                if (next_code > (1 << code_bits_) && code_bits_ < kMaxCodeBits) ++code_bits_;
            } else {
                // 字典滿了：送 clear，兩邊一起重來
                emit(clear_code);
                table.clear();
                next_code = end_code + 1;
                code_bits_ = data_size_ + 1;
                emitted_since_clear = 0;
            }
            current = index;
        }

        emit(current);
        // decoder 讀到最後這個 code 時會新增一筆，可能因此多一個 bit
        if (emitted_since_clear > 0 && next_code >= (1 << code_bits_) && code_bits_ < kMaxCodeBits) {
            ++code_bits_;
        }
    }

    emit(end_code);
    if (bit_count_ > 0) {
        packed_.push_back(static_cast<uint8_t>(bit_buffer_ & 0xFF));
        bit_buffer_ = 0;
        bit_count_ = 0;
    }

    // 切成最多 255 bytes 的 sub-block，最後補 terminator
    std::vector<uint8_t> out;
    out.reserve(packed_.size() + packed_.size() / 255 + 2);
    for (std::size_t off = 0; off < packed_.size(); off += 255) {
        const std::size_t n = std::min<std::size_t>(255, packed_.size() - off);
        out.push_back(static_cast<uint8_t>(n));
        out.insert(out.end(), packed_.begin() + static_cast<std::ptrdiff_t>(off),
                   packed_.begin() + static_cast<std::ptrdiff_t>(off + n));
    }
    out.push_back(kTerminator);
    return out;
}

} // namespace gif
} // namespace rk
