#pragma once

#include <map>
#include <string>
#include <vector>

#include "rasterkit/color.hpp"
#include "rasterkit/image.hpp"
#include "rasterkit/processor.hpp"

namespace rk {

// ------------------------------------------------------------
// 具名 processor 的參數 schema
// ------------------------------------------------------------
enum class ParameterKind {
    Int,
    Float,
    Bool,
    Enum,
    Color,
};

struct ParameterSpec {
    std::string name;
    ParameterKind kind = ParameterKind::Int;
    double min = 0.0;                  // Int / Float
    double max = 0.0;
    std::vector<std::string> choices;  // Enum（小寫）
    bool required = false;
    std::string default_value;         // 非 required 時使用
};

struct ProcessorInfo {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;
};

// resize / crop 的輸出上限，由呼叫端的設定決定
struct ProcessorLimits {
    int max_width  = kMaxWidth;
    int max_height = kMaxHeight;
};

using Parameters = std::map<std::string, std::string>;

// ------------------------------------------------------------
// 驗證過的參數（含預設值），取值時轉成對應型別
// ------------------------------------------------------------
class ParameterSet {
public:
    ParameterSet(const ProcessorInfo& info, const Parameters& raw);

    bool has(const std::string& name) const { return values_.count(name) != 0; }

    int         get_int(const std::string& name) const;
    float       get_float(const std::string& name) const;
    bool        get_bool(const std::string& name) const;
    std::string get_enum(const std::string& name) const;
    Color       get_color(const std::string& name) const;

private:
    const std::string& value(const std::string& name) const;

    std::string processor_;
    std::map<std::string, std::string> values_;
};

// 所有 processor 名稱（依字母順序）
std::vector<std::string> list_processors();

// 名稱不存在丟 ArgumentError
const ProcessorInfo& processor_info(const std::string& name);

// 對 image 的複本套用具名 processor（所有 frame）
// 名稱 / 參數不合法或超過 limits 丟 ArgumentError
Image process(const Image& image,
              const std::string& name,
              const Parameters& parameters,
              const ProcessOptions& options = {},
              const ProcessorLimits& limits = {});

} // namespace rk
