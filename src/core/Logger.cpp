#include "ks/core/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <system_error>
#include <vector>

namespace ks::core {

namespace {

struct LogSink {
    std::mutex mutex;
    std::ofstream file;
    std::vector<std::pair<std::size_t, Logger::Listener>> listeners;
    std::size_t nextToken = 1;
#ifdef KS_DEBUG
    std::atomic<bool> debugEnabled{true};
#else
    std::atomic<bool> debugEnabled{false};
#endif
};

LogSink& Sink() {
    static LogSink sink;
    return sink;
}

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "Debug";
        case LogLevel::Info:    return "Info";
        case LogLevel::Warning: return "Warning";
        case LogLevel::Error:   return "Error";
    }
    return "Log";
}

std::string Timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t seconds = system_clock::to_time_t(now);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    return fmt::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis.count());
}

} // namespace

void Logger::SetDebugEnabled(bool enabled) {
#ifdef KS_DEBUG
    Sink().debugEnabled.store(enabled, std::memory_order_relaxed);
#else
    (void)enabled;
#endif
}

bool Logger::IsDebugEnabled() {
    return Sink().debugEnabled.load(std::memory_order_relaxed);
}

void Logger::SetLogFile(const std::filesystem::path& path) {
    LogSink& sink = Sink();
    std::lock_guard<std::mutex> lock(sink.mutex);
    if (sink.file.is_open()) {
        sink.file.close();
    }
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    sink.file.open(path, std::ios::out | std::ios::app);
    if (!sink.file.is_open()) {
        fmt::print(stderr, "[{}] [Warning] [Logger] Cannot open log file '{}'\n", Timestamp(), path.string());
    }
}

std::size_t Logger::AddListener(Listener listener) {
    if (!listener) {
        return 0;
    }
    LogSink& sink = Sink();
    std::lock_guard<std::mutex> lock(sink.mutex);
    const std::size_t token = sink.nextToken++;
    sink.listeners.emplace_back(token, std::move(listener));
    return token;
}

void Logger::RemoveListener(std::size_t token) {
    LogSink& sink = Sink();
    std::lock_guard<std::mutex> lock(sink.mutex);
    auto& listeners = sink.listeners;
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                   [token](const auto& entry) { return entry.first == token; }),
                    listeners.end());
}

void Logger::Write(LogLevel level, const std::string& message) {
    const std::string line = fmt::format("[{}] [{}] {}", Timestamp(), LevelName(level), message);

    LogSink& sink = Sink();
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(sink.mutex);
        fmt::print(stderr, "{}\n", line);
        if (sink.file.is_open()) {
            sink.file << line << '\n';
            sink.file.flush();
        }
        listeners.reserve(sink.listeners.size());
        for (const auto& entry : sink.listeners) {
            listeners.push_back(entry.second);
        }
    }

    // Called outside the lock so a listener may log.
    for (const auto& listener : listeners) {
        listener(level, line);
    }
}

} // namespace ks::core
