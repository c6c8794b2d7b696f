#pragma once
#include <string>
#include <optional>
#include <unordered_map>
#include <cstdint>

struct BudgetContext {
    int pool_count = 0;
    uint64_t donation_amount = 0;  // lamports
};

// Compute-unit budgets per contract instruction, from observed production usage
class ResourceBudgeter {
public:
    static constexpr uint32_t kDefaultUnits = 150000;

    ResourceBudgeter();

    uint32_t get_budget(const std::string& operation,
                        const std::optional<BudgetContext>& context = std::nullopt) const;

    static uint32_t consolidation_units(int pool_count);
    static uint32_t donation_units(uint64_t donation_lamports);

private:
    std::unordered_map<std::string, uint32_t> units_;
};
