#pragma once

// ============================================================
// thread_pool.hpp -- Header-only C++17 bounded worker pool
// ============================================================

#include <vector>
#include <thread>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <algorithm>

class ThreadPool {
public:
    // min(8, cores + 2)
    static size_t default_size() {
        size_t hw = std::thread::hardware_concurrency();
        if (hw == 0) hw = 1;
        return std::min<size_t>(8, hw + 2);
    }

    explicit ThreadPool(size_t num_threads) : stop_(false) {
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] {
                for (;;) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                        if (stop_ && tasks_.empty()) return;
                        task = std::move(tasks_.front());
                        tasks_.pop_front();
                    }
                    task();
                }
            });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

    // Queue a callable and return a future for its result.
    // Exceptions thrown by the callable surface from future::get().
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using RetType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<RetType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<RetType> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("ThreadPool is stopped");
            tasks_.emplace_back([task]() { (*task)(); });
        }
        cv_.notify_one();
        return res;
    }

    // Drop every task that has not started yet. Their futures report
    // std::future_errc::broken_promise. Running tasks are not interrupted.
    size_t cancel_pending() {
        std::deque<std::function<void()>> dropped;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            dropped.swap(tasks_);
        }
        return dropped.size();
    }

    size_t pending() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    size_t size() const { return workers_.size(); }

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

private:
    std::vector<std::thread>          workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex                mutex_;
    std::condition_variable           cv_;
    bool                              stop_;
};
