#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>

#include "ThreadPool.h"
#include "utils.h"

class TransferState;
class Logger;

// Replaces every "{name}" key of `values` in one left-to-right pass;
// substituted text is never rescanned.
std::string expandHookCommand(const std::string& tmpl,
    const std::map<std::string, std::string>& values);

// Runs `command` through the shell, capturing stdout and stderr together.
// Returns the exit status, or -1 if the command could not be started.
int runShellCommand(const std::string& command, std::string& output);

// runShellCommand as an Error: ErrorCode::Hook unless the exit status is 0.
Error runHookCommand(const std::string& command, std::string& output);

// Runs the configured command once per completed chunk on its own worker
// pool. Results go to TransferState; failures are logged, never fatal.
class HookPipeline {
public:
    HookPipeline(const std::string& commandTemplate,
        std::size_t workers,
        std::size_t capacity,
        TransferState& state,
        Logger& logger);
    ~HookPipeline();

    HookPipeline(const HookPipeline&) = delete;
    HookPipeline& operator=(const HookPipeline&) = delete;

    void start();

    // Never blocks; false if the queue is closed or full.
    bool submit(int chunkIndex);

    // Closes the queue and waits for the workers. drain=false drops queued
    // hooks that have not started; they stay pending in the state.
    void finish(bool drain);

    std::size_t succeeded() const { return okCount.load(); }
    std::size_t failed() const { return failCount.load(); }
    std::size_t dropped() const { return dropCount.load(); }

private:
    void workerLoop();
    void runHook(int chunkIndex);

private:
    std::string commandTemplate;
    std::size_t workerCount;
    std::size_t capacity;
    TransferState& state;
    Logger& logger;

    std::deque<int> queue;
    bool closed{ false };
    std::mutex mtx;
    std::condition_variable cv;

    ThreadPool pool;
    bool started{ false };

    std::atomic<std::size_t> okCount{ 0 };
    std::atomic<std::size_t> failCount{ 0 };
    std::atomic<std::size_t> dropCount{ 0 };
};
