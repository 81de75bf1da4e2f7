#include "LegacySorter.hpp"
#include "OrderingError.hpp"
#include <algorithm>
#include <functional>
#include <numeric>
#include <stdexcept>

namespace ordering {

namespace {

template <typename T>
int threeWay(const T& a, const T& b) {
    return (a > b) - (a < b);
}

} // namespace

Permutation LegacySorter::sort(const Table& table, const std::vector<OrderSpec>& specs,
                               const std::locale& locale) {
    if (specs.empty()) {
        throw EmptyOrderSpec();
    }

    Permutation indices(table.rowCount());
    std::iota(indices.begin(), indices.end(), 0);

    const auto& collate = std::use_facet<std::collate<char>>(locale);

    using CompareFn = std::function<int(size_t, size_t)>;
    std::vector<CompareFn> comparators;
    comparators.reserve(specs.size());

    // Garder les shared_ptr vivants pendant le tri
    std::vector<IColumnPtr> columnPtrs;
    columnPtrs.reserve(specs.size());

    for (const auto& spec : specs) {
        if (!table.hasColumn(spec.column)) {
            throw UnknownColumnReference(spec.column);
        }
        auto col = table.getColumn(spec.column);
        if (col->size() != indices.size()) {
            throw std::invalid_argument("Column '" + spec.column + "' has " +
                                        std::to_string(col->size()) + " rows, table has " +
                                        std::to_string(indices.size()));
        }
        columnPtrs.push_back(col);

        // Comparateur de valeurs présentes, ascendant
        CompareFn valueCmp;
        if (auto intCol = std::dynamic_pointer_cast<IntegerColumn>(col)) {
            valueCmp = [intCol](size_t a, size_t b) { return threeWay(intCol->at(a), intCol->at(b)); };
        } else if (auto realCol = std::dynamic_pointer_cast<RealColumn>(col)) {
            valueCmp = [realCol](size_t a, size_t b) { return threeWay(realCol->at(a), realCol->at(b)); };
        } else if (auto boolCol = std::dynamic_pointer_cast<BooleanColumn>(col)) {
            valueCmp = [boolCol](size_t a, size_t b) { return threeWay(boolCol->at(a), boolCol->at(b)); };
        } else if (auto catCol = std::dynamic_pointer_cast<CategoricalColumn>(col)) {
            valueCmp = [catCol](size_t a, size_t b) { return threeWay(catCol->rank(a), catCol->rank(b)); };
        } else if (auto textCol = std::dynamic_pointer_cast<TextColumn>(col)) {
            // Collation de l'environnement
            valueCmp = [textCol, &collate](size_t a, size_t b) {
                const auto& strA = textCol->at(a);
                const auto& strB = textCol->at(b);
                return collate.compare(strA.data(), strA.data() + strA.size(),
                                       strB.data(), strB.data() + strB.size());
            };
        } else {
            throw UnsupportedColumnType(col->getName(), columnKindToString(col->getKind()));
        }

        int missingSide = spec.missing == MissingPlacement::FIRST ? -1 : 1;
        int sign = spec.direction == Direction::ASCENDING ? 1 : -1;
        comparators.push_back([col, valueCmp, missingSide, sign](size_t a, size_t b) -> int {
            bool missingA = col->isMissing(a);
            bool missingB = col->isMissing(b);
            if (missingA || missingB) {
                if (missingA && missingB) return 0;
                return missingA ? missingSide : -missingSide;
            }
            return sign * valueCmp(a, b);
        });
    }

    std::stable_sort(indices.begin(), indices.end(), [&comparators](size_t a, size_t b) -> bool {
        for (const auto& cmp : comparators) {
            int result = cmp(a, b);
            if (result != 0) {
                return result < 0;
            }
        }
        return false;
    });

    return indices;
}

} // namespace ordering
