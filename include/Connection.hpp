#pragma once

/**
 * @file Connection.hpp
 * @brief RAII wrapper for a single PostgreSQL connection.
 *
 * Connection owns a PGconn* for its lifetime and produces ResultHandle
 * objects for the queries it executes. It does no pooling and no
 * transaction management.
 */

#include "Config.hpp"
#include "ResultHandle.hpp"
#include "TypeCatalog.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>
#include <vector>

namespace pgresult {

/**
 * @class Connection
 * @brief Owns a PGconn and executes queries on it.
 *
 * PostgreSQL libpq API Usage:
 * - PQconnectdb() with a conninfo string built from ConnectionConfig
 * - PQexec() / PQexecParams() for queries
 * - PQfinish() on destruction
 *
 * Failed queries are reported as QueryError; the failed PGresult is
 * cleared before the exception leaves execute().
 *
 * Thread Safety:
 * - A connection must not be used from several threads at once.
 */
class Connection {
public:
    /**
     * @brief Connect to the server.
     * @param config Connection parameters.
     * @throws ConnectionError if the connection cannot be established.
     */
    explicit Connection(const ConnectionConfig& config);

    /**
     * @brief Destructor - closes the connection.
     */
    ~Connection();

    // Non-copyable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Movable
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    /**
     * @brief Build the libpq conninfo string for a configuration.
     *
     * Values are single-quoted with backslash escapes, so passwords and
     * paths containing spaces or quotes are passed through intact.
     * Empty optional settings are omitted.
     */
    static std::string buildConnInfo(const ConnectionConfig& config);

    PGconn* get() const { return m_conn; }

    /// True if the connection is established and not in error state
    bool isValid() const;

    ConnStatusType status() const;

    /// Last error message reported by libpq
    std::string error() const;

    /**
     * @brief Execute a SQL statement.
     * @return Handle owning the result.
     * @throws QueryError if the server reports an error.
     * @throws ConnectionError if the connection is not usable.
     */
    ResultHandle execute(const std::string& sql);

    /**
     * @brief Execute a statement with $1, $2, ... placeholders.
     *
     * Parameters are sent as text; std::nullopt is sent as NULL.
     */
    ResultHandle executeParams(const std::string& sql,
                               const std::vector<SqlValue>& params);

    /**
     * @brief Load pg_type into a catalog used by every later result.
     * @return The loaded catalog.
     */
    std::shared_ptr<const TypeCatalog> loadTypeCatalog();

    /// Catalog handed to results created by this connection
    std::shared_ptr<const TypeCatalog> typeCatalog() const { return m_catalog; }

private:
    ResultHandle wrap(PGresult* res, const std::string& sql);

    PGconn* m_conn;                                ///< Owned connection handle
    std::shared_ptr<const TypeCatalog> m_catalog;  ///< Catalog for produced results
};

}  // namespace pgresult
