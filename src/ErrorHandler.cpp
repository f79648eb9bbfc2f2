#include "ErrorHandler.hpp"
#include <cerrno>

namespace sqlquote {

thread_local std::string ErrorContext::s_currentContext;

namespace {

std::string withContext(const std::string& message) {
    std::string context = ErrorContext::current();
    if (context.empty()) {
        return message;
    }
    return context + ": " + message;
}

}  // namespace

int ErrorHandler::toErrno(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return 0;
        case ErrorCode::InvalidArgument:
            return EINVAL;
        case ErrorCode::EncodingError:
            return EILSEQ;
        default:
            return EIO;
    }
}

int ErrorHandler::toExitCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return EXIT_OK;
        case ErrorCode::InvalidArgument:
            return EXIT_INVALID_ARGUMENT;
        case ErrorCode::EncodingError:
            return EXIT_ENCODING;
        default:
            return EXIT_USAGE;
    }
}

std::string ErrorHandler::getErrorMessage(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::EncodingError:
            return "Value cannot be encoded safely";
        default:
            return "Quoting error " + std::to_string(static_cast<int>(code));
    }
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

QuoteError::QuoteError(ErrorCode code, const std::string& message)
    : std::runtime_error(withContext(message))
    , m_code(code) {
}

InvalidArgument::InvalidArgument(const std::string& message)
    : QuoteError(ErrorCode::InvalidArgument, message) {
}

EncodingError::EncodingError(const std::string& message, size_t offset)
    : QuoteError(ErrorCode::EncodingError, message)
    , m_offset(offset) {
}

}  // namespace sqlquote
