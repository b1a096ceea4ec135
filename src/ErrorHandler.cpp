#include "ErrorHandler.hpp"
#include <utility>

namespace pgresult {

thread_local std::string ErrorContext::s_currentContext;

namespace {

std::string trimTrailing(const char* message) {
    if (!message) return "";
    std::string result(message);
    while (!result.empty() && (result.back() == '\n' || result.back() == ' ')) {
        result.pop_back();
    }
    return result;
}

}  // namespace

std::string ErrorHandler::statusName(ExecStatusType status) {
    const char* name = PQresStatus(status);
    return name ? name : "PGRES_UNKNOWN";
}

bool ErrorHandler::isCompletedStatus(ExecStatusType status) {
    switch (status) {
        case PGRES_TUPLES_OK:
        case PGRES_SINGLE_TUPLE:
        case PGRES_COMMAND_OK:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isErrorStatus(ExecStatusType status) {
    switch (status) {
        case PGRES_BAD_RESPONSE:
        case PGRES_NONFATAL_ERROR:
        case PGRES_FATAL_ERROR:
            return true;
        default:
            return false;
    }
}

std::string ErrorHandler::resultErrorMessage(const PGresult* result) {
    if (!result) {
        return "No result";
    }
    std::string message = trimTrailing(PQresultErrorMessage(result));
    if (message.empty()) {
        return statusName(PQresultStatus(result));
    }
    return message;
}

std::string ErrorHandler::sqlState(const PGresult* result) {
    if (!result) return "";
    const char* state = PQresultErrorField(result, PG_DIAG_SQLSTATE);
    return state ? state : "";
}

std::string ErrorHandler::connectionErrorMessage(const PGconn* conn) {
    if (!conn) {
        return "No connection";
    }
    std::string message = trimTrailing(PQerrorMessage(conn));
    return message.empty() ? "Unknown connection error" : message;
}

const char* ErrorHandler::kindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
        case ErrorKind::OutOfBounds:
            return "OutOfBounds";
        case ErrorKind::WrappedFailure:
            return "WrappedFailure";
    }
    return "Unknown";
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

ResultError::ResultError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_context(ErrorContext::current()) {
}

InvalidArgumentError::InvalidArgumentError(const std::string& message)
    : ResultError(ErrorKind::InvalidArgument, message) {
}

OutOfBoundsError::OutOfBoundsError(const std::string& message)
    : ResultError(ErrorKind::OutOfBounds, message) {
}

WrappedFailureError::WrappedFailureError(const std::string& message)
    : ResultError(ErrorKind::WrappedFailure, message) {
}

QueryError::QueryError(const std::string& message, std::string sqlState)
    : std::runtime_error(message)
    , m_sqlState(std::move(sqlState))
    , m_context(ErrorContext::current()) {
}

QueryError::QueryError(const PGresult* result)
    : std::runtime_error(ErrorHandler::resultErrorMessage(result))
    , m_sqlState(ErrorHandler::sqlState(result))
    , m_context(ErrorContext::current()) {
}

ConnectionError::ConnectionError(const std::string& message)
    : std::runtime_error(message)
    , m_context(ErrorContext::current()) {
}

}  // namespace pgresult
