#pragma once

#include <vector>
#include <thread>
#include <future>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>

// Fixed-size worker pool fed by a bounded queue. tryCommit() rejects when the
// queue is full, commit() blocks the caller until a slot frees up.
class ThreadPool {
public:
    ThreadPool(unsigned int size, size_t capacity);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename Func, typename... Args>
    auto commit(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
        auto task = makeTask(std::forward<Func>(func), std::forward<Args>(args)...);
        auto ret = task->get_future();
        {
            std::unique_lock<std::mutex> lock{_mtx};
            _space_cv.wait(lock, [this]() -> bool {
                return _stop.load(std::memory_order_acquire) || _tasks.size() < _capacity;
            });
            if (_stop.load(std::memory_order_acquire)) {
                throw std::runtime_error("ThreadPool is stopped");
            }
            _tasks.emplace([task]() { (*task)(); });
        }
        _cv.notify_one();
        return ret;
    }

    template <typename Func, typename... Args>
    auto tryCommit(Func&& func, Args&&... args)
        -> std::optional<std::future<std::invoke_result_t<Func, Args...>>> {
        auto task = makeTask(std::forward<Func>(func), std::forward<Args>(args)...);
        auto ret = task->get_future();
        {
            std::lock_guard<std::mutex> lock{_mtx};
            if (_stop.load(std::memory_order_acquire)) {
                throw std::runtime_error("ThreadPool is stopped");
            }
            if (_tasks.size() >= _capacity) {
                return std::nullopt;
            }
            _tasks.emplace([task]() { (*task)(); });
        }
        _cv.notify_one();
        return ret;
    }

    // Stops accepting work, drains the queue and joins the workers.
    void shutdown();

    size_t pending() const;
    size_t size() const { return _poolSize; }
    size_t capacity() const { return _capacity; }

private:
    using Task = std::function<void()>;

    template <typename Func, typename... Args>
    static auto makeTask(Func&& func, Args&&... args) {
        using ReturnType = std::invoke_result_t<Func, Args...>;
        return std::make_shared<std::packaged_task<ReturnType()>>(
            [func = std::forward<Func>(func), ... args = std::forward<Args>(args)]() mutable -> ReturnType {
                return func(args...);
            });
    }

    void workerLoop();

    mutable std::mutex _mtx;
    std::condition_variable _cv;
    std::condition_variable _space_cv;

    std::queue<Task> _tasks;
    std::vector<std::jthread> _threads;

    std::atomic_bool _stop{false};
    size_t _poolSize{0};
    size_t _capacity{0};
};
