#ifndef CTSAFETY_EXCEPTIONS_HPP
#define CTSAFETY_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace ctsafety {

/**
 * @brief Base class for all errors raised by the safety inference core.
 *
 * Carries the throwing location (e.g. "BetaBinomialEngine::posterior") separately
 * from the message so that callers can log both without re-parsing what().
 */
class SafetyException : public std::runtime_error {
public:
    SafetyException(const std::string& source, const std::string& message)
        : std::runtime_error(source + ": " + message), source_(source), message_(message) {}

    const std::string& source() const noexcept { return source_; }
    const std::string& message() const noexcept { return message_; }

private:
    std::string source_;
    std::string message_;
};

/// Input validation failure: rejected immediately, never corrected.
class InvalidParameterException : public SafetyException {
public:
    using SafetyException::SafetyException;
};

/// Malformed configuration or data file content.
class DataFormatException : public SafetyException {
public:
    using SafetyException::SafetyException;
};

/// Logically impossible data, e.g. cumulative counts that decrease over time.
class DataInconsistencyException : public SafetyException {
public:
    using SafetyException::SafetyException;
};

/// A numerical routine failed and no acceptable fallback exists.
class NumericalException : public SafetyException {
public:
    using SafetyException::SafetyException;
};

/// The external reporting database could not answer a query.
class ExternalSourceException : public SafetyException {
public:
    using SafetyException::SafetyException;
};

class FileIOException : public SafetyException {
public:
    using SafetyException::SafetyException;
};

} // namespace ctsafety

#define THROW_INVALID_PARAM(source, msg) \
    throw ::ctsafety::InvalidParameterException((source), (msg))

#define THROW_DATA_INCONSISTENCY(source, msg) \
    throw ::ctsafety::DataInconsistencyException((source), (msg))

#endif // CTSAFETY_EXCEPTIONS_HPP
