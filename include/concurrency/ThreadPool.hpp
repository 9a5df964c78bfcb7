#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include <type_traits>

namespace bob::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 1);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drains the queue and joins every worker.
    void stop();

    void submit(std::shared_ptr<Task> task);

    // Queues fn and returns a future that yields its result or rethrows its exception.
    template <typename F, typename R = std::invoke_result_t<F&>>
    std::future<R> run(F&& fn) {
        auto task = std::make_shared<PromisedTask<R>>(std::forward<F>(fn));
        auto future = task->getFuture();
        submit(task);
        return future;
    }

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

}
