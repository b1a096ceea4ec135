#pragma once

/**
 * @file TypeCatalog.hpp
 * @brief Mapping from PostgreSQL type oids to type names.
 *
 * libpq only reports a column's type as an Oid (PQftype). Naming the type
 * requires the server's pg_type catalog. TypeCatalog carries the standard
 * built-in entries and can be extended with rows loaded from a live server.
 */

#include <libpq-fe.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace pgresult {

class ResultHandle;

/**
 * @class TypeCatalog
 * @brief Oid to type name table.
 *
 * Usage:
 * @code
 *   auto catalog = std::make_shared<TypeCatalog>(
 *       TypeCatalog::fromResult(conn.execute("SELECT oid, typname FROM pg_type")));
 *   catalog->typeName(23);  // "int4"
 * @endcode
 *
 * Thread Safety:
 * - Lookups on a catalog that is no longer modified are safe from any thread.
 * - builtin() is immutable.
 */
class TypeCatalog {
public:
    /// Empty catalog
    TypeCatalog() = default;

    /**
     * @brief Shared catalog holding the built-in pg_type entries.
     *
     * Covers the types shipped with every server (numeric, text, temporal,
     * json, network, geometric, ranges, common arrays and pseudo-types).
     */
    static std::shared_ptr<const TypeCatalog> builtin();

    /**
     * @brief Build a catalog from the rows of a pg_type query.
     * @param result Result with "oid" and "typname" columns.
     * @return Built-in entries overridden by the rows of @p result.
     * @throws InvalidArgumentError if a column is missing or an oid is not numeric.
     */
    static TypeCatalog fromResult(ResultHandle& result);

    /// Register or replace a type name
    void add(Oid oid, std::string name);

    /**
     * @brief Look up a type name.
     * @return The name, or std::nullopt when the oid is not registered.
     */
    std::optional<std::string> typeName(Oid oid) const;

    bool contains(Oid oid) const;

    size_t size() const { return m_names.size(); }

private:
    std::unordered_map<Oid, std::string> m_names;
};

}  // namespace pgresult
