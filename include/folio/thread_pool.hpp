#pragma once

#include <folio/log.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace folio {

// Fixed-size worker pool with a FIFO task queue.
// shutdown() stops accepting work, drains the queue and joins the workers.
class ThreadPool {
public:
    // max_queue_size 0 means unbounded
    explicit ThreadPool(size_t num_threads, std::string name = "pool",
                        size_t max_queue_size = 0)
        : name_(std::move(name)), max_queue_size_(max_queue_size), stop_(false) {
        if (num_threads == 0) num_threads = 1;
        log::debug("%s: starting %zu worker(s)", name_.c_str(), num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this, i] { worker_loop(i); });
        }
    }

    ~ThreadPool() { shutdown(); }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // False when the pool is stopped or the queue is full
    bool enqueue(std::function<void()> task) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) return false;
            if (max_queue_size_ > 0 && tasks_.size() >= max_queue_size_) {
                log::warn("%s: queue full (%zu/%zu), rejecting task",
                          name_.c_str(), tasks_.size(), max_queue_size_);
                return false;
            }
            tasks_.push(std::move(task));
        }
        condition_.notify_one();
        return true;
    }

    // Run fn on a worker; the future carries its result or exception.
    // A rejected task yields a future holding std::runtime_error.
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> fut = task->get_future();
        if (!enqueue([task] { (*task)(); })) {
            std::promise<R> rejected;
            rejected.set_exception(std::make_exception_ptr(
                std::runtime_error(name_ + ": task rejected")));
            return rejected.get_future();
        }
        return fut;
    }

    void shutdown() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) return;
            stop_ = true;
        }
        condition_.notify_all();
        for (std::thread& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
        log::debug("%s: stopped", name_.c_str());
    }

    size_t queue_size() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return tasks_.size();
    }

    size_t active_threads() const { return active_threads_.load(); }
    size_t pool_size() const { return workers_.size(); }

private:
    void worker_loop(size_t id) {
        log::set_thread_tag(name_ + "-" + std::to_string(id));
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) break;
                task = std::move(tasks_.front());
                tasks_.pop();
            }

            active_threads_++;
            try {
                task();
            } catch (const std::exception& e) {
                log::error("%s: worker %zu task threw: %s", name_.c_str(), id, e.what());
            }
            active_threads_--;
        }
    }

    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;

    size_t max_queue_size_;
    bool stop_;
    std::atomic<size_t> active_threads_{0};
};

} // namespace folio
