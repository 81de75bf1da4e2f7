#pragma once

#include "OrderSpec.hpp"
#include "SortKeys.hpp"
#include <vector>

namespace ordering {

/**
 * Tri radix MSD stable sur les clés d'une colonne
 *
 * - Un tri par comptage par chiffre, du plus significatif au moins significatif
 * - Pile de travail explicite : pas de récursion
 * - Les plages plus petites que le seuil finissent en tri par insertion (stable)
 * - Ordre de départ = permutation fournie ; les égalités la conservent
 */
class RadixSorter {
public:
    static constexpr size_t DEFAULT_INSERTION_THRESHOLD = 24;

    explicit RadixSorter(size_t insertionThreshold = DEFAULT_INSERTION_THRESHOLD)
        : m_insertionThreshold(insertionThreshold) {}

    // keys est indexé par position de ligne ; order est l'ordre courant des lignes
    Permutation sort(const SortKeys& keys, const Permutation& order) const;

    size_t insertionThreshold() const { return m_insertionThreshold; }

private:
    struct Range {
        size_t begin;
        size_t end;
        size_t depth;
    };

    void insertionSort(const SortKeys& keys, Permutation& rows, const Range& range) const;

    size_t m_insertionThreshold;
};

} // namespace ordering
