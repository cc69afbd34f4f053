#pragma once

#include <any>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>

namespace frameline::core {

// Worker pool for loads that routines await (images, fonts, video frames).
// Without init() jobs run inline on the submitting thread.
struct JobSystem {
    // If num_threads is 0, uses hardware_concurrency - 1
    static void init(int num_threads = 0);
    static void shutdown();

    static void submit(std::function<void()> job);

    // Submit a job and get a future for the result
    template<typename F, typename R = std::invoke_result_t<F>>
    static std::future<R> submit_with_result(F&& func);

    // Type-erased shared result, the form a routine can await
    template<typename F>
    static std::shared_future<std::any> submit_async(F&& func);

    // Wait for all submitted jobs to complete
    static void wait_all();

    static int thread_count();
    static bool is_worker_thread();
};

// Template implementation
template<typename F, typename R>
std::future<R> JobSystem::submit_with_result(F&& func) {
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
    auto future = task->get_future();
    submit([task]() { (*task)(); });
    return future;
}

template<typename F>
std::shared_future<std::any> JobSystem::submit_async(F&& func) {
    using R = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<std::any()>>(
        [fn = std::forward<F>(func)]() mutable -> std::any {
            if constexpr (std::is_void_v<R>) {
                fn();
                return {};
            } else {
                return std::any(fn());
            }
        });
    std::shared_future<std::any> future = task->get_future().share();
    submit([task]() { (*task)(); });
    return future;
}

} // namespace frameline::core
