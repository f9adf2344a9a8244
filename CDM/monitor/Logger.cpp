#include "Logger.h"
#include <iostream>

namespace {
const char* levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "[debug] ";
    case LogLevel::Info: return "";
    case LogLevel::Warn: return "[warn] ";
    case LogLevel::Error: return "[error] ";
    }
    return "";
}
}

Logger::Logger()
    : Logger(std::cout, std::cerr) {
}

Logger::Logger(std::ostream& out, std::ostream& err)
    : outStream(out), errStream(err) {
}

Logger::~Logger() {
    stop();
}

void Logger::start() {
    std::lock_guard<std::mutex> lock(mtx);
    if (running.load())
        return;

    running.store(true);
    worker = std::thread(&Logger::run, this);
}

void Logger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();

    if (worker.joinable())
        worker.join();

    // Lines logged while stopped are written synchronously
    std::lock_guard<std::mutex> lock(mtx);
    while (!messages.empty()) {
        write(messages.front());
        messages.pop();
    }
}

void Logger::setLevel(LogLevel level) {
    minLevel.store(level);
}

void Logger::log(LogLevel level, const std::string& msg) {
    if (level < minLevel.load(std::memory_order_relaxed))
        return;

    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running.load()) {
            write({ level, msg });
            return;
        }
        messages.push({ level, msg });
    }
    cv.notify_one();
}

void Logger::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (running.load() || !messages.empty()) {
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        while (!messages.empty()) {
            write(messages.front());
            messages.pop();
        }
    }
}

void Logger::write(const Line& line) {
    std::ostream& os = line.level >= LogLevel::Warn ? errStream : outStream;
    os << levelTag(line.level) << line.text << std::endl;
}
