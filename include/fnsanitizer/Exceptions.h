#ifndef FNSANITIZER_EXCEPTIONS_H
#define FNSANITIZER_EXCEPTIONS_H

#include <exception>
#include <string>

namespace fns {

// Error codes
enum class SanitizerError {
    None = 0,
    NamingCollision,
    InvalidConfiguration,
    InvalidPath,
    FileNotFound,
    ReadError,
    WriteError,
    InternalError
};

// Base exception class
class SanitizerException : public std::exception {
protected:
    SanitizerError m_error;
    std::string m_message;
    std::string m_fullMessage;

public:
    explicit SanitizerException(SanitizerError error, const std::string& message = "")
        : m_error(error), m_message(message) {
        m_fullMessage = errorToString(error);
        if (!message.empty()) {
            m_fullMessage += ": " + message;
        }
    }

    SanitizerError error() const noexcept { return m_error; }
    const std::string& message() const noexcept { return m_message; }
    const char* what() const noexcept override { return m_fullMessage.c_str(); }

    static const char* errorToString(SanitizerError err) {
        switch (err) {
            case SanitizerError::None: return "No error";
            case SanitizerError::NamingCollision: return "Got a name collision";
            case SanitizerError::InvalidConfiguration: return "Invalid configuration";
            case SanitizerError::InvalidPath: return "Invalid path";
            case SanitizerError::FileNotFound: return "File not found";
            case SanitizerError::ReadError: return "Read error";
            case SanitizerError::WriteError: return "Write error";
            case SanitizerError::InternalError: return "Internal error";
            default: return "Unknown error";
        }
    }
};

// Specific exception classes

/**
 * A proposed name already exists on disk as an unrelated entry.
 * Raised before anything is renamed, so the whole batch is aborted.
 */
class NamingCollisionException : public SanitizerException {
public:
    NamingCollisionException(const std::string& oldPath, const std::string& newPath)
        : SanitizerException(SanitizerError::NamingCollision,
            "Proposed a new name: " + newPath + " for the file: " + oldPath +
            ". But a file with the new name already exists at the same path. "
            "Exiting to prevent potential data loss."),
          m_oldPath(oldPath), m_newPath(newPath) {}

    const std::string& oldPath() const noexcept { return m_oldPath; }
    const std::string& newPath() const noexcept { return m_newPath; }

private:
    std::string m_oldPath;
    std::string m_newPath;
};

class InvalidConfigurationException : public SanitizerException {
public:
    explicit InvalidConfigurationException(const std::string& details)
        : SanitizerException(SanitizerError::InvalidConfiguration, details) {}
};

class InvalidPathException : public SanitizerException {
public:
    explicit InvalidPathException(const std::string& path)
        : SanitizerException(SanitizerError::InvalidPath,
            "Parent directory of '" + path + "' does not exist") {}
};

class FileNotFoundException : public SanitizerException {
public:
    explicit FileNotFoundException(const std::string& filename)
        : SanitizerException(SanitizerError::FileNotFound, filename) {}
};

class ReadException : public SanitizerException {
public:
    explicit ReadException(const std::string& details = "")
        : SanitizerException(SanitizerError::ReadError, details) {}
};

class WriteException : public SanitizerException {
public:
    explicit WriteException(const std::string& details = "")
        : SanitizerException(SanitizerError::WriteError, details) {}
};

} // namespace fns

#endif // FNSANITIZER_EXCEPTIONS_H
