//
// Error taxonomy shared by the credential bridge, the staging engine and the publisher.
// The HTTP layer maps each family onto a response status.
//

#ifndef STAGING_GATEWAY_EXCEPTIONS_H
#define STAGING_GATEWAY_EXCEPTIONS_H

#include <stdexcept>
#include <string>

// Missing or malformed credentials, or an assertion that failed verification
class eAuthenticationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class eInvalidHeader : public eAuthenticationError {
public:
    using eAuthenticationError::eAuthenticationError;
};

class eBase64Error : public eAuthenticationError {
public:
    using eAuthenticationError::eAuthenticationError;
};

class eUtf8Error : public eAuthenticationError {
public:
    using eAuthenticationError::eAuthenticationError;
};

class eMalformedTokenError : public eAuthenticationError {
public:
    using eAuthenticationError::eAuthenticationError;
};

class eVerificationFailed : public eAuthenticationError {
public:
    using eAuthenticationError::eAuthenticationError;
};

// A client supplied something the gateway refuses to act on: a forged or stale repository key, a state
// transition that isn't allowed, or a path that escapes the staging area
class eValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The staging area on disk could not be read or written
class eStorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The identity service or the publishing service failed or rejected the request
class eUpstreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#endif //STAGING_GATEWAY_EXCEPTIONS_H
