#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::atomic<LogLevel> g_level{LogLevel::Normal};
std::mutex g_outputMutex;

void emit(std::ostream& out, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_outputMutex);
    out << "[" << tag << "] " << message << "\n";
}
}

void Log::setLevel(LogLevel level) {
    g_level.store(level);
}

LogLevel Log::level() {
    return g_level.load();
}

bool Log::isVerbose() {
    return g_level.load() == LogLevel::Verbose;
}

void Log::info(const std::string& tag, const std::string& message) {
    if (g_level.load() == LogLevel::Quiet) return;
    emit(std::cout, tag, message);
}

void Log::verbose(const std::string& tag, const std::string& message) {
    if (g_level.load() != LogLevel::Verbose) return;
    emit(std::cout, tag, message);
}

void Log::warn(const std::string& tag, const std::string& message) {
    if (g_level.load() == LogLevel::Quiet) return;
    emit(std::cerr, tag, "Warning: " + message);
}

void Log::error(const std::string& tag, const std::string& message) {
    emit(std::cerr, tag, "Error: " + message);
}
