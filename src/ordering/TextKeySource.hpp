#pragma once

#include "Collator.hpp"
#include "SortKeyCache.hpp"
#include <string>

namespace ordering {

/**
 * Source des clés d'octets pour les valeurs texte d'une requête
 */
class TextKeySource {
public:
    virtual ~TextKeySource() = default;
    virtual std::string keyFor(const std::string& value) const = 0;
};

// Locale "C" : la clé est l'encodage brut de la valeur
class RawByteKeySource : public TextKeySource {
public:
    std::string keyFor(const std::string& value) const override { return value; }
};

/**
 * Locale nommée : clé calculée par le Collator, mémoïsée dans le cache s'il y en a un
 */
class CollatingKeySource : public TextKeySource {
public:
    CollatingKeySource(const Collator& collator, std::string locale, SortKeyCache* cache)
        : m_collator(collator), m_locale(std::move(locale)), m_cache(cache) {}

    std::string keyFor(const std::string& value) const override;

private:
    const Collator& m_collator;
    std::string m_locale;
    SortKeyCache* m_cache;
};

} // namespace ordering
