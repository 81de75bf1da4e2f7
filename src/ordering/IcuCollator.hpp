#pragma once

#include "Collator.hpp"
#include <unicode/coll.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace ordering {

/**
 * Collation ICU : une instance icu::Collator par locale, créée à la demande
 *
 * Identifiants acceptés : forme ICU (es_ES, de@collation=phonebook,
 * en@colNumeric=yes) ou BCP 47 (es-ES, en-u-kn).
 *
 * Seules les locales servies sont mémorisées, au plus maxCachedLocales ;
 * au-delà la table est vidée.
 */
class IcuCollator : public Collator {
public:
    static constexpr size_t DEFAULT_MAX_CACHED_LOCALES = 64;

    explicit IcuCollator(size_t maxCachedLocales = DEFAULT_MAX_CACHED_LOCALES)
        : m_maxCachedLocales(maxCachedLocales) {}

    std::string collateKey(const std::string& value, const std::string& locale) const override;
    bool supportsLocale(const std::string& locale) const override;
    std::string name() const override;

    static icu::Locale toIcuLocale(const std::string& locale);

    size_t cachedLocaleCount() const;

private:
    // nullptr si la locale n'est pas servie sans repli sur la racine
    std::shared_ptr<const icu::Collator> collatorFor(const std::string& locale) const;

    size_t m_maxCachedLocales;
    mutable std::mutex m_mutex;
    mutable std::map<std::string, std::shared_ptr<const icu::Collator>> m_collators;
};

} // namespace ordering
