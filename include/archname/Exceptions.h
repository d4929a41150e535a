#ifndef ARCHNAME_EXCEPTIONS_H
#define ARCHNAME_EXCEPTIONS_H

#include <exception>
#include <string>

namespace arn {

// Error codes
enum class NamingError {
    None = 0,
    FileNotFound,
    ReadError,
    WriteError,
    InvalidConfig,
    InvalidParameter,
    InvariantViolation,
    InternalError
};

// Base exception class
class NamingException : public std::exception {
protected:
    NamingError m_error;
    std::string m_message;
    std::string m_fullMessage;

public:
    explicit NamingException(NamingError error, const std::string& message = "")
        : m_error(error), m_message(message) {
        m_fullMessage = errorToString(error);
        if (!message.empty()) {
            m_fullMessage += ": " + message;
        }
    }

    NamingError error() const noexcept { return m_error; }
    const std::string& message() const noexcept { return m_message; }
    const char* what() const noexcept override { return m_fullMessage.c_str(); }

    static const char* errorToString(NamingError err) {
        switch (err) {
            case NamingError::None: return "No error";
            case NamingError::FileNotFound: return "File not found";
            case NamingError::ReadError: return "Read error";
            case NamingError::WriteError: return "Write error";
            case NamingError::InvalidConfig: return "Invalid configuration";
            case NamingError::InvalidParameter: return "Invalid parameter";
            case NamingError::InvariantViolation: return "Naming invariant violated";
            case NamingError::InternalError: return "Internal error";
            default: return "Unknown error";
        }
    }
};

// Specific exception classes
class FileNotFoundException : public NamingException {
public:
    explicit FileNotFoundException(const std::string& filename)
        : NamingException(NamingError::FileNotFound, filename) {}
};

class ReadException : public NamingException {
public:
    explicit ReadException(const std::string& details = "")
        : NamingException(NamingError::ReadError, details) {}
};

class WriteException : public NamingException {
public:
    explicit WriteException(const std::string& details = "")
        : NamingException(NamingError::WriteError, details) {}
};

class InvalidConfigException : public NamingException {
public:
    explicit InvalidConfigException(const std::string& details)
        : NamingException(NamingError::InvalidConfig, details) {}
};

class InvalidParameterException : public NamingException {
public:
    explicit InvalidParameterException(const std::string& details)
        : NamingException(NamingError::InvalidParameter, details) {}
};

// Raised when a produced name breaks a hard guarantee (ceiling, UTF-8, uniqueness).
// Indicates a defect, never an input problem.
class InvariantViolationException : public NamingException {
public:
    explicit InvariantViolationException(const std::string& details)
        : NamingException(NamingError::InvariantViolation, details) {}
};

} // namespace arn

#endif // ARCHNAME_EXCEPTIONS_H
