#include "compute_budget.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

ResourceBudgeter::ResourceBudgeter()
    : units_{
        {"process_liquidity_deposit", 310000},
        {"process_liquidity_withdraw", 290000},
        {"process_swap_execute", 250000},
        {"process_pool_initialize", 150000},
        {"process_consolidate_pool_fees", 150000},
        {"process_treasury_donate_sol", 150000},
        {"process_system_pause", 150000},
        {"process_system_unpause", 150000},
        {"process_treasury_withdraw_fees", 150000},
        {"process_treasury_get_info", 150000},
        {"process_pool_pause", 150000},
        {"process_pool_unpause", 150000},
        {"process_pool_update_fees", 150000},
        {"process_swap_set_owner_only", 150000}
    } {}

uint32_t ResourceBudgeter::get_budget(const std::string& operation,
                                      const std::optional<BudgetContext>& context) const {
    if (operation == "process_consolidate_pool_fees" && context) {
        uint32_t units = consolidation_units(context->pool_count);
        spdlog::debug("Calculated {} CUs for consolidation of {} pools", units, context->pool_count);
        return units;
    }

    if (operation == "process_treasury_donate_sol" && context) {
        uint32_t units = donation_units(context->donation_amount);
        spdlog::debug("Calculated {} CUs for donation of {} lamports", units, context->donation_amount);
        return units;
    }

    auto it = units_.find(operation);
    if (it != units_.end()) {
        spdlog::debug("Using {} CUs for operation {}", it->second, operation);
        return it->second;
    }

    spdlog::warn("Unknown operation {}, defaulting to {} CUs", operation, kDefaultUnits);
    return kDefaultUnits;
}

uint32_t ResourceBudgeter::consolidation_units(int pool_count) {
    const uint64_t base = 4000;
    const uint64_t per_pool = 5000;
    uint64_t count = pool_count > 0 ? static_cast<uint64_t>(pool_count) : 0;
    return static_cast<uint32_t>(std::min<uint64_t>(base + per_pool * count, kDefaultUnits));
}

uint32_t ResourceBudgeter::donation_units(uint64_t donation_lamports) {
    // 1,000 whole coins
    const uint64_t small_donation_threshold = 1000ULL * 1000000000ULL;
    return donation_lamports <= small_donation_threshold ? 25000 : 120000;
}
