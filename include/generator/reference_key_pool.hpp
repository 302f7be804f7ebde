#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace seedgen {

/**
 * @brief Primary-key values known to exist, per table
 *
 * Keyed by lowercased table name. An entry is replaced wholesale after
 * each table is loaded (or, without loading, generated), so it always
 * reflects the latest committed set.
 */
class ReferenceKeyPool {
public:
    void set(const std::string& table, std::vector<std::string> keys);

    [[nodiscard]] const std::vector<std::string>& keys(const std::string& table) const;
    [[nodiscard]] bool contains(const std::string& table) const;
    [[nodiscard]] size_t size(const std::string& table) const { return keys(table).size(); }
    [[nodiscard]] size_t table_count() const { return pools_.size(); }

    void clear() { pools_.clear(); }

private:
    std::unordered_map<std::string, std::vector<std::string>> pools_;
};

} // namespace seedgen
