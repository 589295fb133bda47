#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

#include "rasterkit/errors.hpp"

namespace rk {
namespace gif {

// ------------------------------------------------------------
// GifReader：little-endian 讀取 + sub-block 處理
// 讀到檔尾一律丟 FormatError，不會回傳未定義的資料
// ------------------------------------------------------------
class GifReader {
public:
    explicit GifReader(std::istream& in) : in_(in) {}

    uint8_t read_u8() {
        uint8_t v = 0;
        if (!try_read_u8(v)) fail(1);
        return v;
    }

    // 檔尾回傳 false（block 之間的 EOF 視為串流結束）
    bool try_read_u8(uint8_t& out) {
        const auto c = in_.get();
        if (c == std::istream::traits_type::eof()) return false;
        out = static_cast<uint8_t>(c);
        return true;
    }

    uint16_t read_u16_le() {
        const uint16_t lo = read_u8();
        const uint16_t hi = read_u8();
        return static_cast<uint16_t>(lo | (hi << 8));
    }

    void read_bytes(uint8_t* out, std::size_t n) {
        if (n == 0) return;
        in_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(n));
        if (static_cast<std::size_t>(in_.gcount()) != n) fail(n);
    }

    void skip(std::size_t n) {
        if (n == 0) return;
        in_.ignore(static_cast<std::streamsize>(n));
        if (static_cast<std::size_t>(in_.gcount()) != n) fail(n);
    }

    // 跳過 length-prefixed sub-block 直到 0 terminator
    void skip_sub_blocks() {
        for (uint8_t size = read_u8(); size != kTerminatorByte; size = read_u8()) {
            skip(size);
        }
    }

private:
    static constexpr uint8_t kTerminatorByte = 0;

    void fail(std::size_t wanted) const {
        throw FormatError("gif: unexpected end of stream (wanted " + std::to_string(wanted) + " more bytes)");
    }

    std::istream& in_;
};

} // namespace gif
} // namespace rk
