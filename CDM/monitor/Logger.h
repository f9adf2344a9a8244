#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <ostream>

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

class Logger {
public:
    Logger();
    Logger(std::ostream& out, std::ostream& err);
    ~Logger();

    void start();
    void stop();

    void setLevel(LogLevel level);

    void log(LogLevel level, const std::string& msg);

    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    struct Line {
        LogLevel level;
        std::string text;
    };

    void run();
    void write(const Line& line);

private:
    std::ostream& outStream;
    std::ostream& errStream;

    std::queue<Line> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::atomic<LogLevel> minLevel{ LogLevel::Info };
    std::thread worker;
};
