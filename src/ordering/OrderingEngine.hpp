#pragma once

#include "Collator.hpp"
#include "EngineConfig.hpp"
#include "OrderSpec.hpp"
#include "RadixSorter.hpp"
#include "SortKeyCache.hpp"
#include "table/Table.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ordering {

/**
 * Point d'entrée du tri multi-colonnes
 *
 * order(table, specs, locale, mode) rend une permutation des lignes :
 * - locale "C" (ou vide) : octets bruts, aucune collation
 * - locale nommée        : clés de collation du Collator injecté
 * - mode LEGACY / locale "legacy" : ancien tri par comparaison selon la
 *   locale globale du process, avec un avertissement à chaque appel
 *
 * Toute la validation est faite avant le tri. order() est const et peut être
 * appelé depuis plusieurs threads.
 */
class OrderingEngine {
public:
    // collator peut être nul : seules les locales "C" et "legacy" sont alors utilisables
    explicit OrderingEngine(CollatorPtr collator = nullptr,
                            const EngineConfig& config = EngineConfig());

    Permutation order(const Table& table,
                      const std::vector<OrderSpec>& specs,
                      const std::string& locale = locale_id::C_LOCALE,
                      Mode mode = Mode::NORMAL) const;

    Permutation order(const Table& table, const OrderRequest& request) const;

    // Validation seule (lève la même erreur que order())
    void validate(const Table& table, const std::vector<OrderSpec>& specs,
                  const std::string& locale, Mode mode) const;

    std::shared_ptr<SortKeyCache> getKeyCache() const { return m_cache; }
    CollatorPtr getCollator() const { return m_collator; }
    const EngineConfig& getConfig() const { return m_config; }

private:
    CollatorPtr m_collator;
    std::shared_ptr<SortKeyCache> m_cache;
    EngineConfig m_config;
    RadixSorter m_sorter;
};

// Moteur par défaut du process : collation ICU et cache partagé
const OrderingEngine& defaultEngine();

Permutation order(const Table& table,
                  const std::vector<OrderSpec>& specs,
                  const std::string& locale = locale_id::C_LOCALE,
                  Mode mode = Mode::NORMAL);

} // namespace ordering
