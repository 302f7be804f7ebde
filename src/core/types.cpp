#include "core/types.hpp"
#include "core/utils.hpp"

namespace seedgen {

const std::vector<Column>& SchemaSnapshot::columns_of(const std::string& table) const {
    static const std::vector<Column> kEmpty;
    const auto it = columns.find(utils::to_lower(table));
    return it != columns.end() ? it->second : kEmpty;
}

const PrimaryKey* SchemaSnapshot::primary_key_of(const std::string& table) const {
    const auto it = primary_keys.find(utils::to_lower(table));
    return it != primary_keys.end() ? &it->second : nullptr;
}

const std::unordered_set<std::string>& SchemaSnapshot::unique_columns_of(
    const std::string& table) const {
    static const std::unordered_set<std::string> kEmpty;
    const auto it = unique_columns.find(utils::to_lower(table));
    return it != unique_columns.end() ? it->second : kEmpty;
}

std::vector<ForeignKey> SchemaSnapshot::foreign_keys_of(const std::string& table) const {
    const std::string key = utils::to_lower(table);
    std::vector<ForeignKey> result;
    for (const auto& fk : foreign_keys) {
        if (utils::to_lower(fk.table) == key) {
            result.push_back(fk);
        }
    }
    return result;
}

} // namespace seedgen
