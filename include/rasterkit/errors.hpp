#pragma once

#include <stdexcept>
#include <string>

namespace rk {

// 呼叫端給了不合法的參數（null stream、超出範圍的參數）
class ArgumentError : public std::invalid_argument {
public:
    explicit ArgumentError(const std::string& what) : std::invalid_argument(what) {}
};

// 像素存取越界：呼叫端違反介面約定
class IndexError : public std::out_of_range {
public:
    explicit IndexError(const std::string& what) : std::out_of_range(what) {}
};

// 二進位格式結構錯誤，或找不到符合的格式
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

// stream 無法讀取 / 無法 seek，在開始解析之前就失敗
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// ProcessOptions::cancel 被設起來
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what) : std::runtime_error(what) {}
};

} // namespace rk
