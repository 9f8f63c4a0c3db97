#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of worker threads draining a FIFO queue. Destruction stops
// intake, runs what is already queued and joins.
class WorkerPool {
public:
    explicit WorkerPool(size_t workers) {
        if (workers == 0) workers = 1;
        threads_.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads_.emplace_back([this](std::stop_token) { run(); });
        }
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using R = std::invoke_result_t<std::decay_t<Fn>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        auto fut = task->get_future();
        {
            std::lock_guard lock(mutex_);
            // Refused work is dropped; its future reports broken_promise.
            if (stopping_) return fut;
            queue_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            if (stopping_) return;
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

    size_t size() const { return threads_.size(); }

    size_t pending() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    void run() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) return;
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            job();
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::vector<std::jthread> threads_;
};
