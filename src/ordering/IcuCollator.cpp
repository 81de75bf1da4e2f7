#include "IcuCollator.hpp"
#include "OrderingError.hpp"
#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>
#include <unicode/uversion.h>
#include <cstring>
#include <vector>

namespace ordering {

namespace {

// Langues pour lesquelles ICU fournit des données de collation
bool hasCollationData(const icu::Locale& locale) {
    if (std::strcmp(locale.getLanguage(), "") == 0 ||
        std::strcmp(locale.getLanguage(), "root") == 0 ||
        std::strcmp(locale.getLanguage(), "und") == 0) {
        return true;
    }
    int32_t count = 0;
    const icu::Locale* available = icu::Collator::getAvailableLocales(count);
    for (int32_t i = 0; i < count; ++i) {
        if (std::strcmp(available[i].getLanguage(), locale.getLanguage()) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

icu::Locale IcuCollator::toIcuLocale(const std::string& locale) {
    if (locale.find('-') != std::string::npos) {
        UErrorCode status = U_ZERO_ERROR;
        icu::Locale result = icu::Locale::forLanguageTag(locale, status);
        if (U_FAILURE(status)) {
            result.setToBogus();
        }
        return result;
    }
    return icu::Locale::createFromName(locale.c_str());
}

std::shared_ptr<const icu::Collator> IcuCollator::collatorFor(const std::string& locale) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_collators.find(locale);
    if (it != m_collators.end()) {
        return it->second;
    }

    icu::Locale icuLocale = toIcuLocale(locale);
    if (icuLocale.isBogus()) {
        return nullptr;
    }

    UErrorCode status = U_ZERO_ERROR;
    std::shared_ptr<const icu::Collator> collator(icu::Collator::createInstance(icuLocale, status));
    if (U_FAILURE(status) || !collator) {
        return nullptr;
    }
    if (status == U_USING_DEFAULT_WARNING && !hasCollationData(icuLocale)) {
        // ICU a substitué la collation racine : refusé
        return nullptr;
    }

    if (m_maxCachedLocales == 0) {
        return collator;
    }
    if (m_collators.size() >= m_maxCachedLocales) {
        // Les appelants en cours gardent leur shared_ptr
        m_collators.clear();
    }
    m_collators.emplace(locale, collator);
    return collator;
}

size_t IcuCollator::cachedLocaleCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_collators.size();
}

bool IcuCollator::supportsLocale(const std::string& locale) const {
    return collatorFor(locale) != nullptr;
}

std::string IcuCollator::collateKey(const std::string& value, const std::string& locale) const {
    auto collator = collatorFor(locale);
    if (!collator) {
        throw LocaleUnavailable(locale, "no ICU collation data");
    }

    icu::UnicodeString text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(value.data(), static_cast<int32_t>(value.size())));

    std::vector<uint8_t> buffer(64 + value.size() * 4);
    int32_t keySize = collator->getSortKey(text, buffer.data(), static_cast<int32_t>(buffer.size()));
    if (keySize > static_cast<int32_t>(buffer.size())) {
        buffer.resize(keySize);
        keySize = collator->getSortKey(text, buffer.data(), keySize);
    }

    // getSortKey termine la clé par un octet nul : on l'exclut
    size_t length = keySize > 0 ? static_cast<size_t>(keySize - 1) : 0;
    return std::string(reinterpret_cast<const char*>(buffer.data()), length);
}

std::string IcuCollator::name() const {
    return std::string("ICU ") + U_ICU_VERSION;
}

} // namespace ordering
