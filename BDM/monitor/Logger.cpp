#include "Logger.h"
#include <iostream>

const char* logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "?";
}

Logger::Logger(std::ostream& out, LogLevel level)
    : sink(out), minLevel(level) {}

Logger::Logger()
    : Logger(std::cout) {}

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
}

void Logger::log(const std::string& msg) {
    log(LogLevel::Info, msg);
}

void Logger::log(LogLevel level, const std::string& msg) {
    if (!enabled(level))
        return;

    std::string line = std::string("[") + logLevelName(level) + "] " + msg;
    {
        std::lock_guard<std::mutex> lock(mtx);
        // not started (or already stopped): write through
        if (!running.load()) {
            sink << line << std::endl;
            return;
        }
        messages.push(std::move(line));
    }
    cv.notify_one();
}

void Logger::setMinLevel(LogLevel level) {
    minLevel.store(level);
}

bool Logger::enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(minLevel.load());
}

void Logger::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (running.load() || !messages.empty()) {
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        while (!messages.empty()) {
            sink << messages.front() << std::endl;
            messages.pop();
        }
    }
}
