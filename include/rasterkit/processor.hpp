#pragma once

#include <atomic>
#include <functional>

#include "rasterkit/image.hpp"

namespace rk {

// ------------------------------------------------------------
// 後端：Auto 在有 OpenMP 時走 OpenMP，否則 Single
// ------------------------------------------------------------
enum class Backend {
    Auto = 0,
    Single = 1,
    OpenMP = 2,
};

inline Backend normalize_backend(Backend b) {
#ifdef RK_HAS_OPENMP
    if (b == Backend::Auto) return Backend::OpenMP;
    return b;
#else
    (void)b;
    return Backend::Single;
#endif
}

// ------------------------------------------------------------
// 執行選項
// ------------------------------------------------------------
struct ProcessOptions {
    Backend backend = Backend::Auto;

    // OpenMP 執行緒數，0 = omp_get_max_threads()
    int threads = 0;

    // (已完成列數, 總列數)；只會遞增，最後一次等於總列數
    std::function<void(int, int)> on_rows_processed;

    // 每個 row range 開始前檢查，設起來就丟 OperationCancelled
    const std::atomic<bool>* cancel = nullptr;
};

// ------------------------------------------------------------
// ImageProcessor：所有像素轉換的共同介面
//
//   target_size / source_rectangle  決定輸出大小與讀取範圍
//   prepare                         dispatch 前呼叫一次（例如算 resize 權重）
//   apply_rows                      處理 target 的 [start_y, end_y) 列，
//                                   會被多個執行緒同時呼叫，不可修改 processor
// ------------------------------------------------------------
class ImageProcessor {
public:
    virtual ~ImageProcessor() = default;

    virtual Size target_size(const PixelBuffer& source) const { return source.size(); }
    virtual Rect source_rectangle(const PixelBuffer& source) const { return source.bounds(); }

    virtual void prepare(const Rect& /*target_rect*/, const Rect& /*source_rect*/, Backend /*backend*/) {}

    virtual void apply_rows(PixelBuffer& target,
                            const PixelBuffer& source,
                            const Rect& target_rect,
                            const Rect& source_rect,
                            int start_y,
                            int end_y) const = 0;
};

// 配置新的 target、分段處理、最後 swap 進來；
// 取消或發生例外時 buffer 保持原樣
void apply(PixelBuffer& buffer, ImageProcessor& processor, const ProcessOptions& options = {});

// primary frame 與所有額外 frame；progress 總數 = target 高 x frame 數
void apply(Image& image, ImageProcessor& processor, const ProcessOptions& options = {});

} // namespace rk
