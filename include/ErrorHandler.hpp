#pragma once

#include <string>
#include <stdexcept>
#include <cstddef>
#include <cerrno>

namespace sqlquote {

enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    EncodingError
};

// Quoting error code to errno / exit status mapping
class ErrorHandler {
public:
    // Convert error code to errno
    static int toErrno(ErrorCode code);

    // Process exit status used by the command-line tool
    static int toExitCode(ErrorCode code);

    // Get human-readable error message
    static std::string getErrorMessage(ErrorCode code);

    // Common exit codes
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_USAGE = 1;
    static constexpr int EXIT_INVALID_ARGUMENT = 2;
    static constexpr int EXIT_ENCODING = 3;
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Base exception for everything the quoting layer rejects.
// The message is prefixed with the active ErrorContext, if any.
class QuoteError : public std::runtime_error {
public:
    QuoteError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return m_code; }
    int posixError() const { return ErrorHandler::toErrno(m_code); }

private:
    ErrorCode m_code;
};

// Input that has no valid quoted form, e.g. a missing identifier
class InvalidArgument : public QuoteError {
public:
    explicit InvalidArgument(const std::string& message);
};

// Text that cannot be rendered safely inside a quoted fragment
class EncodingError : public QuoteError {
public:
    EncodingError(const std::string& message, size_t offset);

    // Byte offset of the offending character in the rejected value
    size_t offset() const { return m_offset; }

private:
    size_t m_offset;
};

}  // namespace sqlquote
