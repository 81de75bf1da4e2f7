#pragma once

#include "OrderSpec.hpp"
#include "table/Table.hpp"
#include <locale>
#include <vector>

namespace ordering {

/**
 * Ancien tri par comparaison (mode "legacy")
 *
 * Le texte est comparé avec la facette std::collate de la locale C++ passée,
 * par défaut la locale globale du process (std::locale::global). L'hôte qui
 * veut la collation de l'environnement installe std::locale("") ; ordering-cli
 * le fait pour --legacy. Conservé une version pour la compatibilité ; à
 * supprimer ensuite.
 */
class LegacySorter {
public:
    static Permutation sort(const Table& table, const std::vector<OrderSpec>& specs,
                            const std::locale& locale = std::locale());
};

} // namespace ordering
