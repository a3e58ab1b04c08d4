#include "threading.hpp"

#include <algorithm>

namespace threading {

ThreadPool::ThreadPool(size_t threads) : num_threads(threads) {
    workers.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this]() {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock, [this]() {
                        return stop.load() || !tasks.empty();
                    });

                    if (stop.load() && tasks.empty()) {
                        return;
                    }

                    task = std::move(tasks.back());
                    tasks.pop_back();
                    ++active_tasks;
                }

                try {
                    task();
                } catch (...) {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    if (!first_error) first_error = std::current_exception();
                }

                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    --active_tasks;
                }
                done.notify_all();
            }
        });
    }
}

void ThreadPool::wait() {
    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        done.wait(lock,
                  [this]() { return active_tasks == 0 && tasks.empty(); });
        std::swap(error, first_error);
    }
    if (error) std::rethrow_exception(error);
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        stop.store(true);
    }
    condition.notify_all();
    for (std::thread &worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void parallel_for(size_t n, size_t workers,
                  const std::function<void(size_t)> &fn) {
    if (workers <= 1 || n <= 1) {
        for (size_t i = 0; i < n; ++i) fn(i);
        return;
    }

    ThreadPool pool(std::min(workers, n));
    for (size_t i = 0; i < n; ++i) {
        pool.enqueue([&fn, i]() { fn(i); });
    }
    pool.wait();
}

} // namespace threading
