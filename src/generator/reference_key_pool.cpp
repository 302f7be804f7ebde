#include "generator/reference_key_pool.hpp"
#include "core/utils.hpp"

namespace seedgen {

void ReferenceKeyPool::set(const std::string& table, std::vector<std::string> keys) {
    pools_[utils::to_lower(table)] = std::move(keys);
}

const std::vector<std::string>& ReferenceKeyPool::keys(const std::string& table) const {
    static const std::vector<std::string> kEmpty;
    const auto it = pools_.find(utils::to_lower(table));
    return it != pools_.end() ? it->second : kEmpty;
}

bool ReferenceKeyPool::contains(const std::string& table) const {
    return pools_.contains(utils::to_lower(table));
}

} // namespace seedgen
