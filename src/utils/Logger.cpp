#include "utils/Logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ctsafety {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : level_(LogLevel::INFO), out_(&std::clog) {}

void Logger::setLogLevel(LogLevel level) {
    level_.store(level);
}

LogLevel Logger::getLogLevel() const {
    return level_.load();
}

void Logger::setOutputStream(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = &stream;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(level_.load())) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    std::ostringstream line;
    line << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
         << " [" << levelName(level) << "] [" << source << "] " << message << '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    (*out_) << line.str();
    out_->flush();
}

void Logger::debug(const std::string& source, const std::string& message) {
    log(LogLevel::DEBUG, source, message);
}

void Logger::info(const std::string& source, const std::string& message) {
    log(LogLevel::INFO, source, message);
}

void Logger::warning(const std::string& source, const std::string& message) {
    log(LogLevel::WARNING, source, message);
}

void Logger::error(const std::string& source, const std::string& message) {
    log(LogLevel::ERROR, source, message);
}

} // namespace ctsafety
