#pragma once

/**
 * @file FormatConverter.hpp
 * @brief CSV and JSON export of query results.
 *
 * Converts a live ResultHandle into text. Column type names reported by
 * the result are used as hints to emit JSON numbers and booleans; all
 * other values stay strings.
 */

#include "ResultHandle.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace pgresult {

// Objects keep result column order
using json = nlohmann::ordered_json;

// Options structs declared outside the class to avoid default argument issues
struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
    bool arrayFormat = true;  // true = array of objects, false = object with rows array
};

/**
 * @class FormatConverter
 * @brief Static helpers turning a ResultHandle into CSV or JSON.
 *
 * All methods throw OutOfBoundsError when handed a freed result.
 */
class FormatConverter {
public:
    /**
     * @brief Convert a result to CSV.
     *
     * NULL values are written as empty fields. Fields containing the
     * delimiter, the quote character or a line break are quoted.
     */
    static std::string toCSV(const ResultHandle& result, const CSVOptions& options = CSVOptions{});

    /**
     * @brief Convert a result to a JSON array of row objects.
     *
     * Columns typed int2/int4/int8/oid become integers, float4/float8/numeric
     * become numbers and bool becomes true/false. Values that do not parse
     * stay strings.
     */
    static std::string toJSON(const ResultHandle& result, const JSONOptions& options = JSONOptions{});

    /**
     * @brief Convert one row to a JSON object.
     * @throws OutOfBoundsError if @p row is not a row of the result.
     */
    static std::string rowToJSON(const ResultHandle& result, int row,
                                 const JSONOptions& options = JSONOptions{});

    /**
     * @brief Describe the shape of a result.
     *
     * Produces {"status", "rows", "fields", "affected_rows", "columns": [
     * {"name", "type", "oid"}, ...]}. "type" is null when the type is not
     * in the result's catalog.
     */
    static std::string describe(const ResultHandle& result, const JSONOptions& options = JSONOptions{});

    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});

    static bool isIntegerType(const std::string& typeName);
    static bool isFloatType(const std::string& typeName);
    static bool isBooleanType(const std::string& typeName);

private:
    static json rowObject(const ResultHandle& result, int row,
                          const std::vector<std::string>& names,
                          const std::vector<std::optional<std::string>>& types,
                          const JSONOptions& options);

    // Catalog type name of every column, by position
    static std::vector<std::optional<std::string>> columnTypes(const ResultHandle& result);

    static json hydrate(const std::string& value, const std::optional<std::string>& type);

    static std::string dump(const json& value, const JSONOptions& options);
};

}  // namespace pgresult
