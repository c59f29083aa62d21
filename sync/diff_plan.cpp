#include "diff_plan.hpp"

Result<DiffPlan> computeDiff(const Tree& source, const Tree& destination, const SameContent& same) {
    DiffPlan plan;

    for (const auto& entry : source) {
        auto match = destination.find(entry.first);
        if (match == destination.end()) {
            plan.toTransfer.push_back(entry.second);
            continue;
        }
        Result<bool> verdict = same(entry.second, match->second);
        if (!verdict.success) return Result<DiffPlan>::From(verdict, "compare " + entry.first);
        if (verdict.data) {
            ++plan.unchangedCount;
        } else {
            plan.toTransfer.push_back(entry.second);
        }
    }

    for (const auto& entry : destination) {
        if (source.find(entry.first) == source.end()) {
            plan.toDelete.push_back(entry.second);
        }
    }
    return Result<DiffPlan>::Ok(plan);
}
