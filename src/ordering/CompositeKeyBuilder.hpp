#pragma once

#include "OrderSpec.hpp"
#include "RadixSorter.hpp"
#include "SortKeys.hpp"
#include "TextKeySource.hpp"
#include "table/Table.hpp"
#include <string>
#include <vector>

namespace ordering {

struct SortPass {
    std::string column;
    SortKeys keys;
};

/**
 * Plan de tri multi-colonnes : une passe stable par OrderSpec, dans l'ordre
 * d'exécution (dernière OrderSpec d'abord, clé primaire en dernier).
 */
struct PassPlan {
    std::vector<SortPass> passes;
    size_t rowCount = 0;
};

class CompositeKeyBuilder {
public:
    static PassPlan build(const Table& table, const std::vector<OrderSpec>& specs,
                          const TextKeySource& textKeys);

    // Exécute les passes à partir de l'identité
    static Permutation execute(const PassPlan& plan, const RadixSorter& sorter);
};

} // namespace ordering
