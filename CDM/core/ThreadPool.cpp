#include "ThreadPool.h"

ThreadPool::~ThreadPool() {
    join();
}

void ThreadPool::start(std::size_t n, WorkerFn worker) {
    std::lock_guard<std::mutex> lock(mtx);

    for (std::size_t i = 0; i < n; ++i) {
        threads.emplace_back(worker);
    }
}

void ThreadPool::join() {
    std::vector<std::thread> joining;
    {
        std::lock_guard<std::mutex> lock(mtx);
        joining.swap(threads);
    }

    for (auto& t : joining) {
        if (t.joinable())
            t.join();
    }
}
