/**
 * @file Connection.cpp
 * @brief Implementation of the PostgreSQL connection wrapper.
 */

#include "Connection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <sstream>
#include <utility>

namespace pgresult {

namespace {

// libpq conninfo value: single quotes, backslash escapes for ' and backslash
std::string quoteConnValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

void appendOption(std::ostringstream& out, const char* key, const std::string& value) {
    if (value.empty()) return;
    if (out.tellp() > 0) out << ' ';
    out << key << '=' << quoteConnValue(value);
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

Connection::Connection(const ConnectionConfig& config)
    : m_conn(nullptr), m_catalog(TypeCatalog::builtin()) {
    ErrorContext ctx("connect");

    m_conn = PQconnectdb(buildConnInfo(config).c_str());

    if (!m_conn) {
        throw ConnectionError("Failed to allocate PostgreSQL connection");
    }

    if (PQstatus(m_conn) != CONNECTION_OK) {
        std::string errorMsg = ErrorHandler::connectionErrorMessage(m_conn);
        PQfinish(m_conn);
        m_conn = nullptr;
        throw ConnectionError("Failed to connect to PostgreSQL: " + errorMsg);
    }

    if (PQsetClientEncoding(m_conn, "UTF8") != 0) {
        spdlog::warn("Could not set client encoding to UTF8: {}",
                     ErrorHandler::connectionErrorMessage(m_conn));
    }

    spdlog::debug("Connected to {}:{} (server version {})",
                  config.host, config.port, PQserverVersion(m_conn));
}

Connection::~Connection() {
    if (m_conn) {
        PQfinish(m_conn);
    }
}

Connection::Connection(Connection&& other) noexcept
    : m_conn(other.m_conn), m_catalog(std::move(other.m_catalog)) {
    other.m_conn = nullptr;
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        if (m_conn) {
            PQfinish(m_conn);
        }
        m_conn = other.m_conn;
        m_catalog = std::move(other.m_catalog);
        other.m_conn = nullptr;
    }
    return *this;
}

std::string Connection::buildConnInfo(const ConnectionConfig& config) {
    std::ostringstream connInfo;

    appendOption(connInfo, "host", config.host);
    appendOption(connInfo, "port", std::to_string(config.port));
    appendOption(connInfo, "user", config.user);
    appendOption(connInfo, "password", config.password);
    appendOption(connInfo, "dbname", config.database);

    // Whole seconds, rounded up: libpq reads 0 as no timeout
    auto timeout_ms = config.connect_timeout.count();
    auto timeout_s = timeout_ms > 0 ? (timeout_ms + 999) / 1000 : 0;
    appendOption(connInfo, "connect_timeout", std::to_string(timeout_s));

    appendOption(connInfo, "sslmode", config.sslmode);
    appendOption(connInfo, "sslrootcert", config.sslrootcert);
    appendOption(connInfo, "sslcert", config.sslcert);
    appendOption(connInfo, "sslkey", config.sslkey);

    appendOption(connInfo, "application_name", config.application_name);

    return connInfo.str();
}

// ============================================================================
// State
// ============================================================================

bool Connection::isValid() const {
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

ConnStatusType Connection::status() const {
    if (!m_conn) return CONNECTION_BAD;
    return PQstatus(m_conn);
}

std::string Connection::error() const {
    return ErrorHandler::connectionErrorMessage(m_conn);
}

// ============================================================================
// Query Execution
// ============================================================================

ResultHandle Connection::wrap(PGresult* res, const std::string& sql) {
    if (!res) {
        throw ConnectionError("Query could not be sent: " + error());
    }

    if (ErrorHandler::isErrorStatus(PQresultStatus(res))) {
        QueryError err(res);
        PQclear(res);
        spdlog::debug("Query failed in {} [{}]: {}", ErrorContext::current(), err.sqlState(), sql);
        throw err;
    }

    return ResultHandle(res, m_catalog);
}

ResultHandle Connection::execute(const std::string& sql) {
    ErrorContext ctx("execute");

    if (!isValid()) {
        throw ConnectionError("Connection is not usable: " + error());
    }

    spdlog::debug("Executing: {}", sql);
    return wrap(PQexec(m_conn, sql.c_str()), sql);
}

ResultHandle Connection::executeParams(const std::string& sql,
                                       const std::vector<SqlValue>& params) {
    ErrorContext ctx("execute");

    if (!isValid()) {
        throw ConnectionError("Connection is not usable: " + error());
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param ? param->c_str() : nullptr);
    }

    spdlog::debug("Executing with {} parameters: {}", params.size(), sql);
    return wrap(PQexecParams(m_conn, sql.c_str(), static_cast<int>(values.size()),
                             nullptr, values.data(), nullptr, nullptr, 0),
                sql);
}

std::shared_ptr<const TypeCatalog> Connection::loadTypeCatalog() {
    ErrorContext ctx("load type catalog");

    ResultHandle types = execute("SELECT oid, typname FROM pg_catalog.pg_type");
    m_catalog = std::make_shared<TypeCatalog>(TypeCatalog::fromResult(types));
    return m_catalog;
}

}  // namespace pgresult
