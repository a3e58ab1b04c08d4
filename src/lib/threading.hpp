#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace threading {

// Thread pool for running independent per-document tasks
class ThreadPool {
  private:
    std::vector<std::thread> workers;
    std::vector<std::function<void()>> tasks;
    std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable done;
    size_t active_tasks = 0;
    std::atomic<bool> stop{false};
    std::exception_ptr first_error;
    size_t num_threads;

  public:
    explicit ThreadPool(size_t threads);
    ~ThreadPool();

    // Enqueue a task to be executed by the thread pool
    template <typename F> void enqueue(F &&f) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            tasks.emplace_back(std::forward<F>(f));
        }
        condition.notify_one();
    }

    // Wait for all tasks to complete. Rethrows the first exception raised by
    // a task, if any.
    void wait();

    size_t thread_count() const { return num_threads; }

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;
};

// Calls fn(i) for every i in [0, n). Runs inline when workers <= 1.
void parallel_for(size_t n, size_t workers,
                  const std::function<void(size_t)> &fn);

} // namespace threading
