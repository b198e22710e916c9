#pragma once

#include <stdexcept>
#include <string>

namespace QobuzDL {

/**
 * Base class for every error raised by the engine
 */
class QobuzError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Errors that abort the whole session
 */
class FatalError : public QobuzError {
public:
    using QobuzError::QobuzError;
};

// Bad credentials or expired token
class AuthenticationError : public FatalError {
public:
    using FatalError::FatalError;
};

// Account has no streaming entitlement
class IneligibleError : public FatalError {
public:
    using FatalError::FatalError;
};

// App id rejected by the API; credentials must be re-provisioned
class InvalidAppIdError : public FatalError {
public:
    using FatalError::FatalError;
};

// No usable app secret; credentials must be re-provisioned
class InvalidAppSecretError : public FatalError {
public:
    using FatalError::FatalError;
};

// Quality id outside {5, 6, 7, 27}
class InvalidQuality : public FatalError {
public:
    using FatalError::FatalError;
};

// Release or track cannot be streamed; skip it
class NonStreamable : public QobuzError {
public:
    using QobuzError::QobuzError;
};

// Source URL did not match any known content pattern
class InvalidUrl : public QobuzError {
public:
    using QobuzError::QobuzError;
};

// Output template references an unknown variable or is malformed
class TemplateError : public QobuzError {
public:
    using QobuzError::QobuzError;
};

/**
 * HTTP or transport failure for a single request
 * statusCode is 0 when no response was received at all
 */
class RemoteError : public QobuzError {
public:
    RemoteError(const std::string& message, long status = 0)
        : QobuzError(message)
        , statusCode(status) {
    }
    
    long getStatusCode() const { return statusCode; }
    
private:
    long statusCode;
};

} // namespace QobuzDL
