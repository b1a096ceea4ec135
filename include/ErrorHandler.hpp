#pragma once

#include <libpq-fe.h>
#include <stdexcept>
#include <string>

namespace pgresult {

// Classification of failures raised by ResultHandle accessors
enum class ErrorKind {
    InvalidArgument,
    OutOfBounds,
    WrappedFailure
};

// libpq status helpers
class ErrorHandler {
public:
    // Status name as reported by PQresStatus (e.g. "PGRES_TUPLES_OK")
    static std::string statusName(ExecStatusType status);

    // True for statuses a ResultHandle accepts: TUPLES_OK, SINGLE_TUPLE, COMMAND_OK
    static bool isCompletedStatus(ExecStatusType status);

    // True for statuses that mean the query failed
    static bool isErrorStatus(ExecStatusType status);

    // Server message attached to a result, trimmed of the trailing newline
    static std::string resultErrorMessage(const PGresult* result);

    // Five character SQLSTATE, or empty if the result carries none
    static std::string sqlState(const PGresult* result);

    // Connection level message, trimmed
    static std::string connectionErrorMessage(const PGconn* conn);

    static const char* kindName(ErrorKind kind);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Base of the errors raised by ResultHandle
class ResultError : public std::runtime_error {
public:
    ResultError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return m_kind; }

    // ErrorContext::current() at the point the error was raised
    const std::string& context() const { return m_context; }

private:
    ErrorKind m_kind;
    std::string m_context;
};

// Malformed caller input: bad resource, unknown column name
class InvalidArgumentError : public ResultError {
public:
    explicit InvalidArgumentError(const std::string& message);
};

// Row or field position out of range, or access after free()
class OutOfBoundsError : public ResultError {
public:
    explicit OutOfBoundsError(const std::string& message);
};

// libpq reported failure on an otherwise valid request
class WrappedFailureError : public ResultError {
public:
    explicit WrappedFailureError(const std::string& message);
};

// Query execution failed on the server
class QueryError : public std::runtime_error {
public:
    QueryError(const std::string& message, std::string sqlState);
    explicit QueryError(const PGresult* result);

    const std::string& sqlState() const { return m_sqlState; }
    const std::string& context() const { return m_context; }

private:
    std::string m_sqlState;
    std::string m_context;
};

// Connection could not be established or was lost
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& message);

    const std::string& context() const { return m_context; }

private:
    std::string m_context;
};

}  // namespace pgresult
