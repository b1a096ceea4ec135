#include "ResultHandle.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace pgresult {

namespace {

// PQfnumber treats a double-quoted name as case-sensitive; "" is a literal quote
std::string quoteFieldName(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += "\"\"";
        else quoted += c;
    }
    quoted += "\"";
    return quoted;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += names[i];
    }
    return joined;
}

}  // namespace

// ============================================================================
// RowData
// ============================================================================

RowData::RowData(std::initializer_list<value_type> fields) {
    for (const auto& field : fields) {
        (*this)[field.first] = field.second;
    }
}

SqlValue& RowData::operator[](const std::string& name) {
    auto it = std::find_if(m_fields.begin(), m_fields.end(),
                           [&name](const value_type& field) { return field.first == name; });
    if (it != m_fields.end()) {
        return it->second;
    }
    m_fields.emplace_back(name, std::nullopt);
    return m_fields.back().second;
}

const SqlValue& RowData::at(const std::string& name) const {
    for (const auto& field : m_fields) {
        if (field.first == name) return field.second;
    }
    throw std::out_of_range("No column named '" + name + "' in row");
}

size_t RowData::count(const std::string& name) const {
    return std::count_if(m_fields.begin(), m_fields.end(),
                         [&name](const value_type& field) { return field.first == name; });
}

// ============================================================================
// ResultHandle
// ============================================================================

ResultHandle::ResultHandle(PGresult* result, std::shared_ptr<const TypeCatalog> catalog)
    : m_res(nullptr)
    , m_catalog(catalog ? std::move(catalog) : TypeCatalog::builtin()) {
    if (!result) {
        throw InvalidArgumentError(
            "Given handler is not a PostgreSQL query result ('null' given).");
    }

    ExecStatusType status = PQresultStatus(result);
    if (!ErrorHandler::isCompletedStatus(status)) {
        std::string observed = ErrorHandler::statusName(status);
        spdlog::warn("Rejecting result with status {}", observed);
        PQclear(result);
        throw InvalidArgumentError(
            "Given handler is not a completed PostgreSQL query result ('" + observed + "' given).");
    }

    m_res = result;
    spdlog::debug("Wrapped result {} ({} rows, {} fields)",
                  static_cast<const void*>(m_res), PQntuples(m_res), PQnfields(m_res));
}

ResultHandle::~ResultHandle() {
    free();
}

ResultHandle::ResultHandle(ResultHandle&& other) noexcept
    : m_res(other.m_res), m_catalog(other.m_catalog) {
    other.m_res = nullptr;
}

ResultHandle& ResultHandle::operator=(ResultHandle&& other) noexcept {
    if (this != &other) {
        free();
        m_res = other.m_res;
        m_catalog = other.m_catalog;
        other.m_res = nullptr;
    }
    return *this;
}

ResultHandle& ResultHandle::free() {
    if (m_res) {
        spdlog::debug("Freeing result {}", static_cast<const void*>(m_res));
        PQclear(m_res);
        m_res = nullptr;
    }
    return *this;
}

PGresult* ResultHandle::alive() const {
    if (!m_res) {
        throw OutOfBoundsError("Result has been freed.");
    }
    return m_res;
}

ExecStatusType ResultHandle::status() const {
    return PQresultStatus(alive());
}

std::string ResultHandle::statusMessage() const {
    return ErrorHandler::statusName(status());
}

RowData ResultHandle::fetchRow(int index) const {
    if (!m_res || index < 0 || index >= PQntuples(m_res)) {
        throw OutOfBoundsError(
            "Cannot jump to non existing row " + std::to_string(index) + ".");
    }

    RowData row;
    int nFields = PQnfields(m_res);
    for (int col = 0; col < nFields; ++col) {
        SqlValue value;
        if (!PQgetisnull(m_res, index, col)) {
            value = std::string(PQgetvalue(m_res, index, col),
                                static_cast<size_t>(PQgetlength(m_res, index, col)));
        }
        row[PQfname(m_res, col)] = std::move(value);
    }
    return row;
}

SqlValue ResultHandle::getValue(int row, int field_no) const {
    PGresult* res = alive();
    if (row < 0 || row >= PQntuples(res)) {
        throw OutOfBoundsError(
            "Cannot jump to non existing row " + std::to_string(row) + ".");
    }
    if (field_no < 0 || field_no >= PQnfields(res)) {
        throw OutOfBoundsError(
            "Field number " + std::to_string(field_no) + " is out of range.");
    }
    if (PQgetisnull(res, row, field_no)) {
        return std::nullopt;
    }
    return std::string(PQgetvalue(res, row, field_no),
                       static_cast<size_t>(PQgetlength(res, row, field_no)));
}

std::vector<SqlValue> ResultHandle::fetchColumn(const std::string& name) const {
    int col = getFieldNumber(name);
    int nRows = PQntuples(m_res);

    std::vector<SqlValue> values;
    values.reserve(nRows);
    for (int row = 0; row < nRows; ++row) {
        values.push_back(getValue(row, col));
    }
    return values;
}

int ResultHandle::countFields() const {
    return PQnfields(alive());
}

int ResultHandle::countRows() const {
    return PQntuples(alive());
}

uint64_t ResultHandle::countAffectedRows() const {
    const char* affected = PQcmdTuples(alive());
    if (!affected || !*affected) return 0;
    return std::strtoull(affected, nullptr, 10);
}

std::vector<std::string> ResultHandle::getFieldNames() const {
    std::vector<std::string> names;
    int nFields = countFields();
    names.reserve(nFields);

    for (int i = 0; i < nFields; ++i) {
        names.push_back(getFieldName(i));
    }
    return names;
}

std::string ResultHandle::getFieldName(int field_no) const {
    const char* name = PQfname(alive(), field_no);
    if (!name) {
        throw OutOfBoundsError(
            "Field number " + std::to_string(field_no) + " is out of range.");
    }
    return name;
}

int ResultHandle::lookupField(const std::string& name) const {
    PGresult* res = alive();
    // PQfnumber would stop at the NUL and match a prefix
    if (name.find('\0') != std::string::npos) {
        return -1;
    }
    return PQfnumber(res, quoteFieldName(name).c_str());
}

int ResultHandle::getFieldNumber(const std::string& name) const {
    int no = lookupField(name);

    if (no == -1) {
        throw InvalidArgumentError(
            "Could not find field name '" + name + "'. Available fields are {" +
            joinNames(getFieldNames()) + "}.");
    }
    return no;
}

bool ResultHandle::fieldExist(const std::string& name) const {
    if (!m_res) return false;
    return lookupField(name) > -1;
}

std::optional<std::string> ResultHandle::getFieldType(const std::string& name) const {
    return getFieldTypeAt(getFieldNumber(name));
}

std::optional<std::string> ResultHandle::getFieldTypeAt(int field_no) const {
    Oid oid = PQftype(alive(), checkedField(field_no));
    auto type = m_catalog->typeName(oid);

    if (!type || *type == "unknown") {
        return std::nullopt;
    }
    return type;
}

Oid ResultHandle::getTypeOid(const std::string& name) const {
    return getTypeOidAt(getFieldNumber(name));
}

Oid ResultHandle::getTypeOidAt(int field_no) const {
    Oid oid = PQftype(alive(), checkedField(field_no));

    if (oid == InvalidOid) {
        throw WrappedFailureError(
            "Error while fetching type oid for field '" + getFieldName(field_no) + "'.");
    }
    return oid;
}

int ResultHandle::checkedField(int field_no) const {
    if (field_no < 0 || field_no >= PQnfields(alive())) {
        throw OutOfBoundsError(
            "Field number " + std::to_string(field_no) + " is out of range.");
    }
    return field_no;
}

void ResultHandle::setTypeCatalog(std::shared_ptr<const TypeCatalog> catalog) {
    m_catalog = catalog ? std::move(catalog) : TypeCatalog::builtin();
}

}  // namespace pgresult
