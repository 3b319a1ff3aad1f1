#include "capwire/worker_pool.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"
#include <algorithm>

namespace capwire {

WorkerPool::WorkerPool(std::size_t threads) {
    if (threads == 0) threads = 1;
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { run(); });
        ids_.push_back(threads_.back().get_id());
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_cv_.wait(lock, [this] { return !tasks_.empty() || stopping_; });
            if (tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            logger()->error("worker task failed: {}", e.what());
        } catch (...) {
            logger()->error("worker task failed with a non-standard exception");
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0) idle_cv_.notify_all();
        }
    }
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) throw Error("Worker pool is stopped");
        tasks_.push(std::move(task));
    }
    task_cv_.notify_one();
}

bool WorkerPool::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return tasks_.empty() && active_ == 0; });
}

void WorkerPool::stop() {
    const bool inside = on_worker_thread();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    task_cv_.notify_all();
    if (inside) return;

    std::lock_guard<std::mutex> stop_lock(stop_mutex_);
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

bool WorkerPool::on_worker_thread() const {
    const auto self = std::this_thread::get_id();
    return std::find(ids_.begin(), ids_.end(), self) != ids_.end();
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + active_;
}

} // namespace capwire
