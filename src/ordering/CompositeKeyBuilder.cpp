#include "CompositeKeyBuilder.hpp"
#include "ColumnKeyExtractor.hpp"
#include "OrderingError.hpp"
#include "common/Profiler.hpp"
#include <numeric>

namespace ordering {

PassPlan CompositeKeyBuilder::build(const Table& table, const std::vector<OrderSpec>& specs,
                                    const TextKeySource& textKeys) {
    if (specs.empty()) {
        throw EmptyOrderSpec();
    }

    PassPlan plan;
    plan.rowCount = table.rowCount();
    plan.passes.reserve(specs.size());

    ORDERING_PROFILE_SCOPE("extract_keys");
    for (auto it = specs.rbegin(); it != specs.rend(); ++it) {
        if (!table.hasColumn(it->column)) {
            throw UnknownColumnReference(it->column);
        }
        auto column = table.getColumn(it->column);
        plan.passes.push_back({it->column, ColumnKeyExtractor::extract(*column, *it, textKeys)});
    }
    return plan;
}

Permutation CompositeKeyBuilder::execute(const PassPlan& plan, const RadixSorter& sorter) {
    Permutation order(plan.rowCount);
    std::iota(order.begin(), order.end(), 0);

    ORDERING_PROFILE_SCOPE("radix_sort");
    for (const auto& pass : plan.passes) {
        order = sorter.sort(pass.keys, order);
    }
    return order;
}

} // namespace ordering
