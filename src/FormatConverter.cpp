#include "FormatConverter.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace pgresult {

bool FormatConverter::isIntegerType(const std::string& typeName) {
    return typeName == "int2" || typeName == "int4" || typeName == "int8" ||
           typeName == "oid";
}

bool FormatConverter::isFloatType(const std::string& typeName) {
    return typeName == "float4" || typeName == "float8" || typeName == "numeric";
}

bool FormatConverter::isBooleanType(const std::string& typeName) {
    return typeName == "bool";
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needs_quoting = options.quoteAll;

    if (!needs_quoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needs_quoting = true;
                break;
            }
        }
    }

    if (!needs_quoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

std::string FormatConverter::toCSV(const ResultHandle& result, const CSVOptions& options) {
    std::ostringstream out;

    auto names = result.getFieldNames();
    int num_rows = result.countRows();
    int num_fields = static_cast<int>(names.size());

    // Header
    if (options.includeHeader) {
        for (int col = 0; col < num_fields; ++col) {
            if (col > 0) out << options.delimiter;
            out << escapeCSVField(names[col], options);
        }
        out << options.lineEnding;
    }

    // Rows
    for (int row = 0; row < num_rows; ++row) {
        for (int col = 0; col < num_fields; ++col) {
            if (col > 0) out << options.delimiter;

            auto value = result.getValue(row, col);
            if (value) {
                out << escapeCSVField(*value, options);
            }
            // NULL values are represented as empty
        }
        out << options.lineEnding;
    }

    return out.str();
}

json FormatConverter::hydrate(const std::string& value, const std::optional<std::string>& type) {
    if (!type) {
        return value;
    }

    try {
        if (isIntegerType(*type)) {
            size_t used = 0;
            long long number = std::stoll(value, &used);
            if (used == value.size()) return number;
        } else if (isFloatType(*type)) {
            size_t used = 0;
            double number = std::stod(value, &used);
            if (used == value.size() && std::isfinite(number)) return number;
        } else if (isBooleanType(*type)) {
            return value == "t" || value == "true";
        }
    } catch (const std::logic_error&) {
        // Out of range values stay text
        spdlog::debug("Keeping {} value '{}' as text", *type, value);
    }

    return value;
}

json FormatConverter::rowObject(const ResultHandle& result, int row,
                                const std::vector<std::string>& names,
                                const std::vector<std::optional<std::string>>& types,
                                const JSONOptions& options) {
    json obj = json::object();

    for (size_t col = 0; col < names.size(); ++col) {
        auto value = result.getValue(row, static_cast<int>(col));
        if (value) {
            obj[names[col]] = hydrate(*value, types[col]);
        } else if (options.includeNull) {
            obj[names[col]] = nullptr;
        } else {
            // A later NULL column hides an earlier one of the same name
            obj.erase(names[col]);
        }
    }

    return obj;
}

std::vector<std::optional<std::string>> FormatConverter::columnTypes(const ResultHandle& result) {
    std::vector<std::optional<std::string>> types;
    int num_fields = result.countFields();
    types.reserve(num_fields);
    for (int col = 0; col < num_fields; ++col) {
        types.push_back(result.getFieldTypeAt(col));
    }
    return types;
}

std::string FormatConverter::dump(const json& value, const JSONOptions& options) {
    return options.pretty ? value.dump(options.indent) : value.dump();
}

std::string FormatConverter::toJSON(const ResultHandle& result, const JSONOptions& options) {
    auto names = result.getFieldNames();
    auto types = columnTypes(result);

    json arr = json::array();
    int num_rows = result.countRows();
    for (int row = 0; row < num_rows; ++row) {
        arr.push_back(rowObject(result, row, names, types, options));
    }

    if (options.arrayFormat) {
        return dump(arr, options);
    }

    json wrapper = json::object();
    wrapper["rows"] = std::move(arr);
    return dump(wrapper, options);
}

std::string FormatConverter::rowToJSON(const ResultHandle& result, int row,
                                       const JSONOptions& options) {
    if (row < 0 || row >= result.countRows()) {
        throw OutOfBoundsError("Cannot jump to non existing row " + std::to_string(row) + ".");
    }

    auto names = result.getFieldNames();
    auto types = columnTypes(result);

    return dump(rowObject(result, row, names, types, options), options);
}

std::string FormatConverter::describe(const ResultHandle& result, const JSONOptions& options) {
    json summary = json::object();
    summary["status"] = result.statusMessage();
    summary["rows"] = result.countRows();
    summary["fields"] = result.countFields();
    summary["affected_rows"] = result.countAffectedRows();

    json columns = json::array();
    int num_fields = result.countFields();
    for (int col = 0; col < num_fields; ++col) {
        json column = json::object();
        column["name"] = result.getFieldName(col);

        auto type = result.getFieldTypeAt(col);
        if (type) {
            column["type"] = *type;
        } else {
            column["type"] = nullptr;
        }

        try {
            column["oid"] = result.getTypeOidAt(col);
        } catch (const WrappedFailureError& e) {
            spdlog::warn("{}", e.what());
            column["oid"] = nullptr;
        }

        columns.push_back(std::move(column));
    }
    summary["columns"] = std::move(columns);

    return dump(summary, options);
}

}  // namespace pgresult
