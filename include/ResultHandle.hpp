#pragma once

/**
 * @file ResultHandle.hpp
 * @brief RAII owner of one executed PostgreSQL query result.
 *
 * ResultHandle takes ownership of a PGresult* produced by query execution,
 * exposes its rows, columns and column metadata, and clears it exactly once,
 * either through free() or when the handle goes out of scope.
 */

#include "TypeCatalog.hpp"
#include <libpq-fe.h>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pgresult {

// A single field value; std::nullopt is SQL NULL
using SqlValue = std::optional<std::string>;

/**
 * @class RowData
 * @brief A row as column name -> value mapping, in result column order.
 *
 * Assigning to an existing name replaces its value in place, so with
 * duplicate column names the key keeps the position of its first column
 * and holds the value of the last one.
 */
class RowData {
public:
    using value_type = std::pair<std::string, SqlValue>;
    using iterator = std::vector<value_type>::const_iterator;
    using const_iterator = std::vector<value_type>::const_iterator;

    RowData() = default;
    RowData(std::initializer_list<value_type> fields);

    /// Value of a column; a missing name is appended as NULL
    SqlValue& operator[](const std::string& name);

    /// @throws std::out_of_range if no column is named @p name
    const SqlValue& at(const std::string& name) const;

    size_t count(const std::string& name) const;
    size_t size() const { return m_fields.size(); }
    bool empty() const { return m_fields.empty(); }

    const_iterator begin() const { return m_fields.begin(); }
    const_iterator end() const { return m_fields.end(); }

    bool operator==(const RowData& other) const { return m_fields == other.m_fields; }
    bool operator!=(const RowData& other) const { return m_fields != other.m_fields; }

private:
    std::vector<value_type> m_fields;
};

/**
 * @class ResultHandle
 * @brief Owning wrapper around a completed PGresult.
 *
 * States:
 * - Alive: holds a non-null PGresult validated at construction.
 * - Freed: terminal. Reached through free() or by being moved from.
 *   Every accessor throws OutOfBoundsError in this state.
 *
 * Values are returned as text exactly as the server sent them; converting
 * them to typed values is left to the caller, who can use getFieldType()
 * and getTypeOid() as hints.
 *
 * Column names are matched exactly: the name is quoted before it is
 * resolved, so "Name" and "name" are different columns.
 *
 * Usage:
 * @code
 *   ResultHandle result(PQexec(conn, "SELECT id, name FROM employees"));
 *   for (int i = 0; i < result.countRows(); ++i) {
 *       RowData row = result.fetchRow(i);
 *       // row["name"] ...
 *   }
 *   auto names = result.fetchColumn("name");
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; the underlying PGresult is not reentrant.
 */
class ResultHandle {
public:
    /**
     * @brief Take ownership of a query result.
     * @param result PGresult handle from query execution.
     * @param catalog Type names used by getFieldType(); the built-in
     *        catalog when null.
     * @throws InvalidArgumentError if @p result is null or its status is not
     *         PGRES_TUPLES_OK, PGRES_SINGLE_TUPLE or PGRES_COMMAND_OK. A
     *         rejected non-null result is cleared before throwing.
     */
    explicit ResultHandle(PGresult* result,
                          std::shared_ptr<const TypeCatalog> catalog = nullptr);

    /**
     * @brief Destructor - calls free().
     */
    ~ResultHandle();

    // Non-copyable
    ResultHandle(const ResultHandle&) = delete;
    ResultHandle& operator=(const ResultHandle&) = delete;

    // Movable; the source is left freed
    ResultHandle(ResultHandle&& other) noexcept;
    ResultHandle& operator=(ResultHandle&& other) noexcept;

    /**
     * @brief Release the result.
     * @return *this, to allow chaining.
     *
     * Clears the PGresult if still held. Further calls do nothing.
     */
    ResultHandle& free();

    /// True once free() has run or the handle was moved from
    bool isFreed() const { return m_res == nullptr; }

    /**
     * @brief Get the underlying PGresult handle.
     * @return Raw PGresult* (still owned by this object), or nullptr when freed.
     */
    PGresult* get() const { return m_res; }

    // ----- Status -----

    ExecStatusType status() const;

    /// Status name, e.g. "PGRES_TUPLES_OK"
    std::string statusMessage() const;

    // ----- Rows -----

    /**
     * @brief Fetch a row as a column name -> value mapping.
     * @param index Zero-based row index.
     * @throws OutOfBoundsError if @p index is not a row of this result.
     *
     * Keys follow result column order. With duplicate column names the
     * rightmost column's value wins.
     */
    RowData fetchRow(int index) const;

    /**
     * @brief Get a single value by position.
     * @throws OutOfBoundsError if @p row or @p field_no is out of range.
     */
    SqlValue getValue(int row, int field_no) const;

    /**
     * @brief Every row's value for a column, in row order.
     * @throws InvalidArgumentError if no column is named @p name.
     */
    std::vector<SqlValue> fetchColumn(const std::string& name) const;

    // ----- Counts -----

    /// Number of columns, defined for zero-row results
    int countFields() const;

    /// Number of rows; 0 for statements that return no rows
    int countRows() const;

    /**
     * @brief Rows affected by INSERT/UPDATE/DELETE/MERGE and friends.
     *
     * Parsed from PQcmdTuples(); 0 when the command reports no count.
     */
    uint64_t countAffectedRows() const;

    // ----- Column metadata -----

    /// Column names in result order
    std::vector<std::string> getFieldNames() const;

    /**
     * @brief Name of a column.
     * @param field_no Zero-based column position.
     * @throws OutOfBoundsError if @p field_no is out of range.
     */
    std::string getFieldName(int field_no) const;

    /**
     * @brief Check whether a column exists.
     *
     * Never throws for a missing name; false on a freed handle.
     */
    bool fieldExist(const std::string& name) const;

    /**
     * @brief Declared type name of a column.
     * @return Type name from the catalog, or std::nullopt when the type
     *         is not known or is the "unknown" pseudo-type.
     * @throws InvalidArgumentError if no column is named @p name.
     */
    std::optional<std::string> getFieldType(const std::string& name) const;

    /**
     * @brief Type oid of a column.
     * @throws InvalidArgumentError if no column is named @p name.
     * @throws WrappedFailureError if libpq reports no type for the column.
     */
    Oid getTypeOid(const std::string& name) const;

    /**
     * @brief Positional forms of getFieldType() and getTypeOid().
     *
     * These address a column directly, so they also reach the later
     * columns of a duplicated name.
     * @throws OutOfBoundsError if @p field_no is out of range.
     */
    std::optional<std::string> getFieldTypeAt(int field_no) const;
    Oid getTypeOidAt(int field_no) const;

    /// Replace the catalog used by getFieldType(); null restores the built-in one
    void setTypeCatalog(std::shared_ptr<const TypeCatalog> catalog);

    const TypeCatalog& typeCatalog() const { return *m_catalog; }

protected:
    /**
     * @brief Position of a column.
     * @throws InvalidArgumentError listing the available columns when
     *         @p name does not exist.
     */
    int getFieldNumber(const std::string& name) const;

private:
    // Throws OutOfBoundsError once freed
    PGresult* alive() const;

    // PQfnumber on the quoted name, -1 when not found
    int lookupField(const std::string& name) const;

    // Throws OutOfBoundsError unless field_no is a column of this result
    int checkedField(int field_no) const;

    PGresult* m_res;                                ///< Owned result, null once freed
    std::shared_ptr<const TypeCatalog> m_catalog;   ///< Oid -> type name
};

}  // namespace pgresult
