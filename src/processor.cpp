#include "rasterkit/processor.hpp"
#include "rasterkit/errors.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

#ifdef RK_HAS_OPENMP
#include <omp.h>
#endif

namespace rk {

namespace {

// 一個 row range：哪個 frame、target 的哪幾列
struct RowTask {
    const PixelBuffer* source;
    PixelBuffer* target;
    int start_y;
    int end_y;
};

int worker_count(Backend backend, int threads) {
#ifdef RK_HAS_OPENMP
    if (backend == Backend::OpenMP) {
        return threads > 0 ? threads : omp_get_max_threads();
    }
#else
    (void)backend;
    (void)threads;
#endif
    return 1;
}

// 把 [0, height) 切成最多 parts 段，每段至少一列
void partition_rows(std::vector<RowTask>& tasks,
                    const PixelBuffer& source,
                    PixelBuffer& target,
                    int parts)
{
    const int height = target.height();
    parts = std::clamp(parts, 1, height);
    const int step = (height + parts - 1) / parts;
    for (int y = 0; y < height; y += step) {
        tasks.push_back(RowTask{&source, &target, y, std::min(height, y + step)});
    }
}

bool cancel_requested(const ProcessOptions& options) {
    return options.cancel != nullptr && options.cancel->load();
}

void run_single(const std::vector<RowTask>& tasks,
                const ImageProcessor& processor,
                const Rect& target_rect,
                const Rect& source_rect,
                const ProcessOptions& options,
                int rows_total)
{
    int rows_done = 0;
    for (const RowTask& t : tasks) {
        if (cancel_requested(options)) {
            throw OperationCancelled("apply: cancelled after " + std::to_string(rows_done) +
                                     " of " + std::to_string(rows_total) + " rows");
        }
        processor.apply_rows(*t.target, *t.source, target_rect, source_rect, t.start_y, t.end_y);
        rows_done += t.end_y - t.start_y;
        if (options.on_rows_processed) options.on_rows_processed(rows_done, rows_total);
    }
}

#ifdef RK_HAS_OPENMP
void run_openmp(const std::vector<RowTask>& tasks,
                const ImageProcessor& processor,
                const Rect& target_rect,
                const Rect& source_rect,
                const ProcessOptions& options,
                int rows_total,
                int workers)
{
    const int n = static_cast<int>(tasks.size());
    int rows_done = 0;
    int rows_reported = 0;
    std::mutex report_mutex;
    bool stop = false;
    bool cancelled = false;
    std::exception_ptr error;

#pragma omp parallel for schedule(dynamic) num_threads(workers)
    for (int i = 0; i < n; ++i) {
        bool skip = false;
#pragma omp critical(rk_apply_state)
        {
            if (!stop && cancel_requested(options)) {
                stop = true;
                cancelled = true;
            }
            skip = stop;
        }
        if (skip) continue;

        const RowTask& t = tasks[static_cast<std::size_t>(i)];
        try {
            processor.apply_rows(*t.target, *t.source, target_rect, source_rect, t.start_y, t.end_y);
        } catch (...) {
            // 不能讓例外離開 parallel region：記下第一個，join 後再丟
#pragma omp critical(rk_apply_state)
            {
                if (!error) error = std::current_exception();
                stop = true;
            }
            continue;
        }

        int snapshot = 0;
        bool report = false;
#pragma omp critical(rk_apply_state)
        {
            rows_done += t.end_y - t.start_y;
            snapshot = rows_done;
            report = !stop && options.on_rows_processed;
        }
        if (!report) continue;

        // callback 不在 critical 內呼叫（callback 裡可能再呼叫 apply）
        // report_mutex 只屬於這次呼叫：callback 依序執行，數字只增不減
        std::lock_guard<std::mutex> guard(report_mutex);
        if (snapshot <= rows_reported) continue;
        rows_reported = snapshot;
        try {
            options.on_rows_processed(snapshot, rows_total);
        } catch (...) {
#pragma omp critical(rk_apply_state)
            {
                if (!error) error = std::current_exception();
                stop = true;
            }
        }
    }

    if (error) std::rethrow_exception(error);
    if (cancelled) {
        throw OperationCancelled("apply: cancelled after " + std::to_string(rows_done) +
                                 " of " + std::to_string(rows_total) + " rows");
    }
}
#endif

// frames[i] 對應 targets[i]；全部成功後才 swap
void run(const std::vector<PixelBuffer*>& frames,
         ImageProcessor& processor,
         const ProcessOptions& options)
{
    if (frames.empty() || frames.front()->empty()) {
        throw ArgumentError("apply: empty image");
    }

    const PixelBuffer& primary = *frames.front();
    const Size size = processor.target_size(primary);
    if (size.width <= 0 || size.height <= 0 || size.width > kMaxWidth || size.height > kMaxHeight) {
        throw ArgumentError("apply: invalid target size " + std::to_string(size.width) + "x" +
                            std::to_string(size.height));
    }

    const Rect source_rect = intersect(processor.source_rectangle(primary), primary.bounds());
    if (source_rect.empty()) {
        throw ArgumentError("apply: source rectangle does not overlap the image");
    }
    const Rect target_rect{0, 0, size.width, size.height};

    const Backend backend = normalize_backend(options.backend);
    processor.prepare(target_rect, source_rect, backend);

    const int workers = worker_count(backend, options.threads);

    std::vector<PixelBuffer> targets;
    targets.reserve(frames.size());
    std::vector<RowTask> tasks;
    for (const PixelBuffer* frame : frames) {
        targets.emplace_back(size.width, size.height);
        partition_rows(tasks, *frame, targets.back(), workers * 4);
    }

    const int rows_total = size.height * static_cast<int>(frames.size());

#ifdef RK_HAS_OPENMP
    if (backend == Backend::OpenMP) {
        run_openmp(tasks, processor, target_rect, source_rect, options, rows_total, workers);
    } else {
        run_single(tasks, processor, target_rect, source_rect, options, rows_total);
    }
#else
    run_single(tasks, processor, target_rect, source_rect, options, rows_total);
#endif

    for (std::size_t i = 0; i < frames.size(); ++i) {
        frames[i]->swap_pixels(targets[i]);
    }
}

} // namespace

void apply(PixelBuffer& buffer, ImageProcessor& processor, const ProcessOptions& options) {
    run(std::vector<PixelBuffer*>{&buffer}, processor, options);
}

void apply(Image& image, ImageProcessor& processor, const ProcessOptions& options) {
    std::vector<PixelBuffer*> frames;
    frames.reserve(static_cast<std::size_t>(image.frame_count()));
    for (int i = 0; i < image.frame_count(); ++i) {
        frames.push_back(&image.frame(i));
    }
    run(frames, processor, options);
}

} // namespace rk
