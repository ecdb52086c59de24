#pragma once
#include <exception>
#include <string>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_INVALID_CONFIGURATION,
    ERR_MALFORMED_CALIBRATION,
    ERR_IO_FAILURE,
    ERR_NO_PORT_AVAILABLE,
    ERR_SYNC_TIMEOUT,
    ERR_CANCELLED
};

const char* errorCodeName(ErrorCode code);

// ==================== Base exception ====================
class GloveException : public std::exception {
public:
    GloveException(const std::string& msg, ErrorCode code) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~GloveException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};

// Unsupported channel count or other bad construction parameter.
class InvalidConfigurationError : public GloveException {
public:
    explicit InvalidConfigurationError(const std::string& msg)
        : GloveException(msg, ERR_INVALID_CONFIGURATION) {}
};

// Missing line or unparsable numeric field in a calibration file.
class MalformedCalibrationError : public GloveException {
public:
    explicit MalformedCalibrationError(const std::string& msg)
        : GloveException(msg, ERR_MALFORMED_CALIBRATION) {}
};

// Transport-level fatal error (device gone, permission denied, ...)
class IoFailureError : public GloveException {
public:
    explicit IoFailureError(const std::string& msg)
        : GloveException(msg, ERR_IO_FAILURE) {}
};

class NoPortAvailableError : public GloveException {
public:
    explicit NoPortAvailableError(const std::string& msg)
        : GloveException(msg, ERR_NO_PORT_AVAILABLE) {}
};

// Attempt or deadline ceiling of the sync loop exhausted.
class SyncTimeoutError : public GloveException {
public:
    explicit SyncTimeoutError(const std::string& msg)
        : GloveException(msg, ERR_SYNC_TIMEOUT) {}
};

class CancelledError : public GloveException {
public:
    explicit CancelledError(const std::string& msg)
        : GloveException(msg, ERR_CANCELLED) {}
};
