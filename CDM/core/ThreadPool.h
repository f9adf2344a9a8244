#pragma once
#include <vector>
#include <thread>
#include <functional>
#include <mutex>

class ThreadPool {
public:
    using WorkerFn = std::function<void()>;

    ThreadPool() = default;
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void start(std::size_t n, WorkerFn worker);
    // Waits for every worker to return on its own.
    void join();

private:
    std::vector<std::thread> threads;
    mutable std::mutex mtx;
};
