#include "RadixSorter.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace ordering {

Permutation RadixSorter::sort(const SortKeys& keys, const Permutation& order) const {
    if (keys.size() != order.size()) {
        throw std::invalid_argument("Radix pass over " + std::to_string(keys.size()) +
                                    " keys for " + std::to_string(order.size()) + " rows");
    }

    Permutation rows = order;
    if (rows.size() < 2) {
        return rows;
    }

    Permutation scratch(rows.size());
    std::array<size_t, SortKeys::ALPHABET> counts;
    std::vector<Range> pending;
    pending.push_back({0, rows.size(), 0});

    while (!pending.empty()) {
        Range range = pending.back();
        pending.pop_back();

        size_t count = range.end - range.begin;
        if (count < 2 || range.depth >= keys.maxLength()) {
            continue;
        }
        if (count < m_insertionThreshold) {
            insertionSort(keys, rows, range);
            continue;
        }

        // Histogramme du chiffre courant
        counts.fill(0);
        for (size_t i = range.begin; i < range.end; ++i) {
            ++counts[keys.digit(rows[i], range.depth)];
        }

        // Tous dans le même bucket : on passe au chiffre suivant sans déplacer
        SortKeys::Digit only = keys.digit(rows[range.begin], range.depth);
        if (counts[only] == count) {
            if (only != SortKeys::PAD_LOW && only != SortKeys::PAD_HIGH) {
                pending.push_back({range.begin, range.end, range.depth + 1});
            }
            continue;
        }

        // Sommes préfixes puis dispersion stable
        std::array<size_t, SortKeys::ALPHABET> starts;
        size_t offset = range.begin;
        for (size_t d = 0; d < SortKeys::ALPHABET; ++d) {
            starts[d] = offset;
            offset += counts[d];
        }
        for (size_t i = range.begin; i < range.end; ++i) {
            scratch[starts[keys.digit(rows[i], range.depth)]++] = rows[i];
        }
        std::copy(scratch.begin() + range.begin, scratch.begin() + range.end,
                  rows.begin() + range.begin);

        // Les buckets de bourrage contiennent des clés terminées, donc égales
        size_t bucketBegin = range.begin;
        for (size_t d = 0; d < SortKeys::ALPHABET; ++d) {
            size_t bucketEnd = bucketBegin + counts[d];
            if (counts[d] > 1 && d != SortKeys::PAD_LOW && d != SortKeys::PAD_HIGH) {
                pending.push_back({bucketBegin, bucketEnd, range.depth + 1});
            }
            bucketBegin = bucketEnd;
        }
    }

    return rows;
}

void RadixSorter::insertionSort(const SortKeys& keys, Permutation& rows, const Range& range) const {
    for (size_t i = range.begin + 1; i < range.end; ++i) {
        size_t row = rows[i];
        size_t j = i;
        // Inégalité stricte : les égaux gardent leur ordre
        while (j > range.begin && keys.compare(row, rows[j - 1], range.depth) < 0) {
            rows[j] = rows[j - 1];
            --j;
        }
        rows[j] = row;
    }
}

} // namespace ordering
