/**
 * Fixed-size worker pool for coordinate-parallel kernels.
 *
 * Workers are started once and reused for every batch submitted to them.
 * Tasks hand back futures, so an exception thrown inside a worker reaches
 * the thread that waits on the batch instead of terminating the process.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace grassmann {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads) {
        num_threads = std::max(size_t(1), num_threads);
        workers_.reserve(num_threads);
        try {
            for (size_t i = 0; i < num_threads; ++i) {
                workers_.emplace_back(&ThreadPool::worker_loop, this);
            }
        } catch (const std::system_error&) {
            shutdown();
            throw;
        }
    }

    ~ThreadPool() { shutdown(); }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Submit a task and get a future for the result
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    /**
     * Split [begin, end) into at most one contiguous range per worker, run
     * func(range_begin, range_end) on each and wait for all of them.
     *
     * Every range is waited on before the first failure is rethrown, so no
     * task outlives func.
     */
    template<typename Func>
    void parallel_ranges(size_t begin, size_t end, Func&& func) {
        if (begin >= end) return;

        const size_t total = end - begin;
        const size_t chunks = std::min(total, workers_.size());
        const size_t chunk_size = (total + chunks - 1) / chunks;

        std::vector<std::future<void>> futures;
        std::exception_ptr error;
        try {
            futures.reserve(chunks);
            for (size_t i = begin; i < end; i += chunk_size) {
                const size_t chunk_end = std::min(i + chunk_size, end);
                futures.push_back(submit([&func, i, chunk_end]() { func(i, chunk_end); }));
            }
        } catch (const std::exception&) {
            error = std::current_exception();
        }

        for (auto& future : futures) {
            try {
                future.get();
            } catch (const std::exception&) {
                if (!error) error = std::current_exception();
            }
        }

        if (error) std::rethrow_exception(error);
    }

    size_t num_threads() const { return workers_.size(); }

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

} // namespace grassmann
