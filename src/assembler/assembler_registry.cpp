#include "assembler/assembler_registry.hpp"
#include "assembler/date_range_assembler.hpp"
#include "assembler/default_assembler.hpp"
#include "assembler/junction_assembler.hpp"
#include "assembler/status_lifecycle_assembler.hpp"
#include "core/utils.hpp"
#include <format>

namespace seedgen {

AssemblerRegistry::AssemblerRegistry()
    : fallback_(std::make_shared<DefaultAssembler>()) {}

void AssemblerRegistry::register_assembler(const std::string& table,
                                           std::shared_ptr<ITableAssembler> assembler) {
    const std::string key = utils::to_lower(table);
    if (assemblers_.contains(key)) {
        utils::log::debug(std::format("Replacing assembler for table '{}' with '{}'",
            table, assembler->name()));
    }
    assemblers_[key] = std::move(assembler);
}

void AssemblerRegistry::apply_rules(const AssemblerRules& rules) {
    for (const auto& rule : rules.junction) {
        register_assembler(rule.table, std::make_shared<JunctionAssembler>(rule));
    }
    for (const auto& rule : rules.date_range) {
        register_assembler(rule.table, std::make_shared<DateRangeAssembler>(rule));
    }
    for (const auto& rule : rules.status_lifecycle) {
        register_assembler(rule.table, std::make_shared<StatusLifecycleAssembler>(rule));
    }
}

ITableAssembler& AssemblerRegistry::resolve(const std::string& table) const {
    const auto it = assemblers_.find(utils::to_lower(table));
    return it != assemblers_.end() ? *it->second : *fallback_;
}

bool AssemblerRegistry::has_bespoke(const std::string& table) const {
    return assemblers_.contains(utils::to_lower(table));
}

AssemblerRules AssemblerRegistry::builtin_rules() {
    AssemblerRules rules;

    rules.junction = {
        {"booking_room", {"booking_id"}, {"room_id"}, 1, 3},
        {"booking_discount", {"booking_id"}, {"promotion_id", "promo_id"}, 0, 2},
        {"review_score", {"review_id"}, {"review_category_id", "category_id"}, 1, 5},
        {"stay_guest", {"stay_id"}, {"guest_id"}, 1, 3},
    };

    rules.date_range = {
        {"room_night", {"room_id"}, {"night_date"}, -730, 365},
        {"rate_calendar", {"rate_plan_id"}, {"cal_date", "calendar_date", "stay_date", "rate_date"}, -730, 365},
    };

    rules.status_lifecycle = {
        {"stay", {"stay_status", "status"}, {"actual_checkin_at"}, {"actual_checkout_at"}, 180},
    };

    return rules;
}

AssemblerRegistry AssemblerRegistry::with_builtins() {
    AssemblerRegistry registry;
    registry.apply_rules(builtin_rules());
    return registry;
}

} // namespace seedgen
