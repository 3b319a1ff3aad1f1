#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace capwire {

/// Fixed-size thread pool running queued tasks in FIFO order. Must not be
/// destroyed from one of its own tasks.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 4);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Throws capwire::Error once the pool is stopping.
    /// Exceptions escaping a task are logged and dropped.
    void submit(std::function<void()> task);

    /// Block until no task is queued or running, or until `timeout` passes.
    /// Returns true when the pool is idle.
    bool wait_idle(std::chrono::milliseconds timeout);

    /// Finish queued tasks and join the workers. Idempotent. Called from one
    /// of the pool's own tasks it only stops intake; the join happens on the
    /// next stop() from outside, at the latest in the destructor.
    void stop();

    /// True on a thread owned by this pool.
    [[nodiscard]] bool on_worker_thread() const;

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }
    [[nodiscard]] std::size_t pending() const;

private:
    void run();

    std::vector<std::thread> threads_;
    std::vector<std::thread::id> ids_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::mutex stop_mutex_;
    std::condition_variable task_cv_;
    std::condition_variable idle_cv_;
    std::size_t active_{0};
    bool stopping_{false};
};

} // namespace capwire
