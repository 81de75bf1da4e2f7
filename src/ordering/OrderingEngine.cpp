#include "OrderingEngine.hpp"
#include "ColumnKeyExtractor.hpp"
#include "CompositeKeyBuilder.hpp"
#include "IcuCollator.hpp"
#include "LegacySorter.hpp"
#include "OrderingError.hpp"
#include "TextKeySource.hpp"
#include "common/Logger.hpp"
#include "common/Profiler.hpp"
#include <stdexcept>

namespace ordering {

OrderingEngine::OrderingEngine(CollatorPtr collator, const EngineConfig& config)
    : m_collator(std::move(collator))
    , m_cache(config.keyCacheEnabled ? std::make_shared<SortKeyCache>(config.keyCacheCapacity)
                                     : nullptr)
    , m_config(config)
    , m_sorter(config.insertionThreshold)
{}

void OrderingEngine::validate(const Table& table, const std::vector<OrderSpec>& specs,
                              const std::string& locale, Mode mode) const {
    if (specs.empty()) {
        throw EmptyOrderSpec();
    }

    for (const auto& spec : specs) {
        if (!table.hasColumn(spec.column)) {
            throw UnknownColumnReference(spec.column);
        }
        auto column = table.getColumn(spec.column);
        if (!ColumnKeyExtractor::isSupported(column->getKind())) {
            throw UnsupportedColumnType(spec.column, columnKindToString(column->getKind()));
        }
        if (column->size() != table.rowCount()) {
            throw std::invalid_argument("Column '" + spec.column + "' has " +
                                        std::to_string(column->size()) + " rows, table has " +
                                        std::to_string(table.rowCount()));
        }
    }

    if (mode == Mode::LEGACY || locale_id::isLegacy(locale) || locale_id::isC(locale)) {
        return;
    }
    if (!locale_id::isWellFormed(locale)) {
        throw InvalidLocaleIdentifier(locale);
    }
    if (!m_collator) {
        throw LocaleUnavailable(locale, "no collation library configured");
    }
    if (!m_collator->supportsLocale(locale)) {
        throw LocaleUnavailable(locale, m_collator->name() + " has no collation for it");
    }
}

Permutation OrderingEngine::order(const Table& table,
                                  const std::vector<OrderSpec>& specs,
                                  const std::string& locale,
                                  Mode mode) const {
    try {
        validate(table, specs, locale, mode);
    } catch (const OrderingError& e) {
        ORDERING_LOG_DEBUG(std::string("Ordering request rejected: ") + e.what());
        throw;
    }

    if (mode == Mode::LEGACY || locale_id::isLegacy(locale)) {
        ORDERING_LOG_WARN("Legacy ordering mode is deprecated and will be removed in the next "
                          "release; pass an explicit locale (\"C\" or a named locale) instead");
        ORDERING_PROFILE_SCOPE("legacy_sort");
        return LegacySorter::sort(table, specs);
    }

    if (locale_id::isC(locale)) {
        ORDERING_LOG_DEBUG("Ordering " + std::to_string(table.rowCount()) + " rows by " +
                           std::to_string(specs.size()) + " column(s), locale C");
        RawByteKeySource textKeys;
        auto plan = CompositeKeyBuilder::build(table, specs, textKeys);
        return CompositeKeyBuilder::execute(plan, m_sorter);
    }

    ORDERING_LOG_DEBUG("Ordering " + std::to_string(table.rowCount()) + " rows by " +
                       std::to_string(specs.size()) + " column(s), locale " + locale +
                       " (" + m_collator->name() + ")");
    CollatingKeySource textKeys(*m_collator, locale, m_cache.get());
    PassPlan plan;
    {
        ORDERING_PROFILE_SCOPE("collate");
        plan = CompositeKeyBuilder::build(table, specs, textKeys);
    }
    return CompositeKeyBuilder::execute(plan, m_sorter);
}

Permutation OrderingEngine::order(const Table& table, const OrderRequest& request) const {
    return order(table, request.specs, request.locale, request.mode);
}

const OrderingEngine& defaultEngine() {
    static const OrderingEngine engine(std::make_shared<IcuCollator>());
    return engine;
}

Permutation order(const Table& table,
                  const std::vector<OrderSpec>& specs,
                  const std::string& locale,
                  Mode mode) {
    return defaultEngine().order(table, specs, locale, mode);
}

} // namespace ordering
