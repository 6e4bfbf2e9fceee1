#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <ostream>

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

const char* logLevelName(LogLevel level);

class Logger {
public:
    explicit Logger(std::ostream& out, LogLevel minLevel = LogLevel::Info);
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void start();
    void stop();

    void log(const std::string& msg);
    void log(LogLevel level, const std::string& msg);

    void setMinLevel(LogLevel level);
    bool enabled(LogLevel level) const;

private:
    void run();

private:
    std::ostream& sink;
    std::atomic<LogLevel> minLevel;

    std::queue<std::string> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::thread worker;
};
