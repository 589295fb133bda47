#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "gif_io.hpp"

namespace rk {
namespace gif {

// ------------------------------------------------------------
// LzwDecoder：從 image data sub-blocks 還原 index stream
// code 以 LSB-first 排列，寬度從 data_size + 1 開始，最多 12 bits
// ------------------------------------------------------------
class LzwDecoder {
public:
    explicit LzwDecoder(GifReader& reader) : reader_(reader) {}

    // on_row(row, indices)：indices 剛好 width 個，只在 callback 期間有效
    using RowCallback = std::function<void(int, const uint8_t*)>;

    // 依序解出 height 列，每列 width 個 index，只保留一列的 buffer
    // 資料不足或 code 不合法丟 FormatError
    void decode(int width, int height, int data_size, const RowCallback& on_row);

    // 跳過這個 frame 剩下的 sub-block（含 0 terminator）
    void skip_remaining();

private:
    // 資料已經讀完（遇到 terminator）時回傳 -1
    int read_code(int bits);

    GifReader& reader_;

    std::array<uint8_t, 255> block_{};
    std::size_t block_size_ = 0;
    std::size_t block_pos_  = 0;
    bool terminated_ = false;

    uint32_t bit_buffer_ = 0;
    int bit_count_ = 0;
};

// ------------------------------------------------------------
// LzwEncoder：index stream → 已切好 sub-block 的資料（含 terminator）
// ------------------------------------------------------------
class LzwEncoder {
public:
    // data_size: 2 ~ 8
    explicit LzwEncoder(int data_size);

    std::vector<uint8_t> encode(const std::vector<uint8_t>& indices);

private:
    void emit(int code);

    int data_size_;
    int code_bits_ = 0;
    uint32_t bit_buffer_ = 0;
    int bit_count_ = 0;
    std::vector<uint8_t> packed_;
};

} // namespace gif
} // namespace rk
