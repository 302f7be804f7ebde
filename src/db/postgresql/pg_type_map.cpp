#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <unordered_map>

namespace seedgen {

TypeFamily PgTypeMap::classify(const std::string& data_type,
                               const std::string& udt_name,
                               const EnumCatalog& enums) {
    const std::string udt = utils::to_lower(udt_name);
    if (enums.contains(udt)) {
        return TypeFamily::ENUM;
    }

    static const std::unordered_map<std::string, TypeFamily> DATA_TYPES = {
        {"smallint", TypeFamily::INTEGER},
        {"integer", TypeFamily::INTEGER},
        {"bigint", TypeFamily::INTEGER},
        {"numeric", TypeFamily::NUMERIC},
        {"decimal", TypeFamily::NUMERIC},
        {"text", TypeFamily::TEXT},
        {"character varying", TypeFamily::TEXT},
        {"character", TypeFamily::TEXT},
        {"boolean", TypeFamily::BOOLEAN},
        {"date", TypeFamily::DATE},
        {"timestamp without time zone", TypeFamily::TIMESTAMP},
        {"timestamp with time zone", TypeFamily::TIMESTAMP},
        {"uuid", TypeFamily::UUID},
    };

    static const std::unordered_map<std::string, TypeFamily> UDT_NAMES = {
        {"int2", TypeFamily::INTEGER},
        {"int4", TypeFamily::INTEGER},
        {"int8", TypeFamily::INTEGER},
        {"numeric", TypeFamily::NUMERIC},
        {"text", TypeFamily::TEXT},
        {"varchar", TypeFamily::TEXT},
        {"bpchar", TypeFamily::TEXT},
        {"bool", TypeFamily::BOOLEAN},
        {"date", TypeFamily::DATE},
        {"timestamp", TypeFamily::TIMESTAMP},
        {"timestamptz", TypeFamily::TIMESTAMP},
        {"uuid", TypeFamily::UUID},
    };

    if (const auto it = DATA_TYPES.find(utils::to_lower(data_type)); it != DATA_TYPES.end()) {
        return it->second;
    }
    if (const auto it = UDT_NAMES.find(udt); it != UDT_NAMES.end()) {
        return it->second;
    }
    return TypeFamily::OTHER;
}

uint8_t PgTypeMap::integer_bytes(const std::string& udt_name) {
    const std::string udt = utils::to_lower(udt_name);
    if (udt == "int2") return 2;
    if (udt == "int4") return 4;
    if (udt == "int8") return 8;
    return 0;
}

} // namespace seedgen
