#include "TypeCatalog.hpp"
#include "ResultHandle.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <utility>

namespace pgresult {

namespace {

struct BuiltinType {
    Oid oid;
    const char* name;
};

// Entries of pg_type that exist on every server
constexpr BuiltinType kBuiltinTypes[] = {
    {16, "bool"},
    {17, "bytea"},
    {18, "char"},
    {19, "name"},
    {20, "int8"},
    {21, "int2"},
    {22, "int2vector"},
    {23, "int4"},
    {24, "regproc"},
    {25, "text"},
    {26, "oid"},
    {27, "tid"},
    {28, "xid"},
    {29, "cid"},
    {30, "oidvector"},
    {114, "json"},
    {142, "xml"},
    {199, "_json"},
    {600, "point"},
    {601, "lseg"},
    {602, "path"},
    {603, "box"},
    {604, "polygon"},
    {628, "line"},
    {650, "cidr"},
    {700, "float4"},
    {701, "float8"},
    {705, "unknown"},
    {718, "circle"},
    {774, "macaddr8"},
    {790, "money"},
    {829, "macaddr"},
    {869, "inet"},
    {1000, "_bool"},
    {1001, "_bytea"},
    {1005, "_int2"},
    {1007, "_int4"},
    {1009, "_text"},
    {1015, "_varchar"},
    {1016, "_int8"},
    {1021, "_float4"},
    {1022, "_float8"},
    {1033, "aclitem"},
    {1042, "bpchar"},
    {1043, "varchar"},
    {1082, "date"},
    {1083, "time"},
    {1114, "timestamp"},
    {1115, "_timestamp"},
    {1182, "_date"},
    {1184, "timestamptz"},
    {1185, "_timestamptz"},
    {1186, "interval"},
    {1231, "_numeric"},
    {1266, "timetz"},
    {1560, "bit"},
    {1562, "varbit"},
    {1700, "numeric"},
    {1790, "refcursor"},
    {2205, "regclass"},
    {2206, "regtype"},
    {2249, "record"},
    {2275, "cstring"},
    {2278, "void"},
    {2279, "trigger"},
    {2950, "uuid"},
    {2951, "_uuid"},
    {3614, "tsvector"},
    {3615, "tsquery"},
    {3802, "jsonb"},
    {3807, "_jsonb"},
    {3904, "int4range"},
    {3906, "numrange"},
    {3908, "tsrange"},
    {3910, "tstzrange"},
    {3912, "daterange"},
    {3926, "int8range"},
};

Oid parseOid(const std::string& text) {
    if (text.empty()) {
        throw InvalidArgumentError("Type oid is empty.");
    }
    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || text[0] == '-' || value > 0xFFFFFFFFul) {
        throw InvalidArgumentError("Type oid '" + text + "' is not a valid oid.");
    }
    return static_cast<Oid>(value);
}

}  // namespace

std::shared_ptr<const TypeCatalog> TypeCatalog::builtin() {
    static const std::shared_ptr<const TypeCatalog> catalog = [] {
        auto built = std::make_shared<TypeCatalog>();
        for (const auto& type : kBuiltinTypes) {
            built->add(type.oid, type.name);
        }
        return built;
    }();
    return catalog;
}

TypeCatalog TypeCatalog::fromResult(ResultHandle& result) {
    TypeCatalog catalog = *builtin();

    auto oids = result.fetchColumn("oid");
    auto names = result.fetchColumn("typname");

    for (size_t i = 0; i < oids.size(); ++i) {
        if (!oids[i] || !names[i]) {
            spdlog::warn("Skipping pg_type row {} with NULL oid or name", i);
            continue;
        }
        catalog.add(parseOid(*oids[i]), *names[i]);
    }

    spdlog::debug("Loaded type catalog with {} entries", catalog.size());
    return catalog;
}

void TypeCatalog::add(Oid oid, std::string name) {
    m_names[oid] = std::move(name);
}

std::optional<std::string> TypeCatalog::typeName(Oid oid) const {
    auto it = m_names.find(oid);
    if (it == m_names.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TypeCatalog::contains(Oid oid) const {
    return m_names.find(oid) != m_names.end();
}

}  // namespace pgresult
