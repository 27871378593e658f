#pragma once

#include <stdexcept>
#include <string>

/**
 * Base class for every failure raised while fetching an extension.
 * The Batch Driver catches this type and reports what() with the identifier.
 */
class ExtensionFetchError : public std::runtime_error
{
public:
    explicit ExtensionFetchError(const std::string &message) : std::runtime_error(message) {}
};

class InvalidIdentifierError : public ExtensionFetchError
{
public:
    using ExtensionFetchError::ExtensionFetchError;
};

// Batch file missing or unreadable
class BatchSourceError : public ExtensionFetchError
{
public:
    using ExtensionFetchError::ExtensionFetchError;
};

/**
 * Failures worth retrying: the request may succeed if sent again.
 * retryWithBackoff() only retries this family and RateLimitedError.
 */
class TransientError : public ExtensionFetchError
{
public:
    using ExtensionFetchError::ExtensionFetchError;
};

// Connection refused, DNS failure, timeout, interrupted transfer...
class TransportError : public TransientError
{
public:
    using TransientError::TransientError;
};

// Response body was not valid JSON
class MalformedResponseError : public TransientError
{
public:
    using TransientError::TransientError;
};

/**
 * HTTP 429 from the addon API. Retried after a fixed delay that does not
 * grow the backoff.
 */
class RateLimitedError : public ExtensionFetchError
{
public:
    using ExtensionFetchError::ExtensionFetchError;
};

/**
 * Non-success HTTP status that is not otherwise handled.
 */
class HttpStatusError : public ExtensionFetchError
{
public:
    HttpStatusError(long status, const std::string &message)
        : ExtensionFetchError(message), status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

class NotFoundError : public HttpStatusError
{
public:
    explicit NotFoundError(const std::string &message) : HttpStatusError(404, message) {}
};

// API answered 200 but the payload lacks a required field
class ApiResponseError : public ExtensionFetchError
{
public:
    using ExtensionFetchError::ExtensionFetchError;
};

class VersionNotFoundError : public ExtensionFetchError
{
public:
    using ExtensionFetchError::ExtensionFetchError;
};

/**
 * Raised once all retry attempts are used up.
 * The message carries the last underlying error.
 */
class RetryExhaustedError : public ExtensionFetchError
{
public:
    RetryExhaustedError(int attempts, const std::string &message)
        : ExtensionFetchError(message), attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

/**
 * CRX header could not be parsed.
 */
class PackageFormatError : public ExtensionFetchError
{
public:
    enum class Kind
    {
        BadMagic,
        Truncated,
        CorruptHeaderLength
    };

    PackageFormatError(Kind kind, const std::string &message)
        : ExtensionFetchError(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class ChecksumMismatchError : public ExtensionFetchError
{
public:
    using ExtensionFetchError::ExtensionFetchError;
};

// Output file exists and --force was not given
class OutputExistsError : public ExtensionFetchError
{
public:
    using ExtensionFetchError::ExtensionFetchError;
};
