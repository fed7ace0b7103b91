#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>

namespace ctsafety {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

/**
 * @brief Process-wide logger.
 *
 * Every message is tagged with a source string. Translation units declare their own
 * tag once, e.g. `static const std::string LOG_SOURCE = "SIGNAL_DETECTOR";`.
 * Writing is serialized, so concurrent estimators can log freely.
 */
class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    /**
     * @brief Redirect output (defaults to std::clog). The stream must outlive the logger usage.
     */
    void setOutputStream(std::ostream& stream);

    void log(LogLevel level, const std::string& source, const std::string& message);

    void debug(const std::string& source, const std::string& message);
    void info(const std::string& source, const std::string& message);
    void warning(const std::string& source, const std::string& message);
    void error(const std::string& source, const std::string& message);

    static const char* levelName(LogLevel level);

private:
    Logger();

    std::atomic<LogLevel> level_;
    std::ostream* out_;
    std::mutex mutex_;
};

} // namespace ctsafety

#endif // LOGGER_HPP
