#include "TextKeySource.hpp"

namespace ordering {

std::string CollatingKeySource::keyFor(const std::string& value) const {
    if (m_cache) {
        if (auto cached = m_cache->lookup(m_locale, value)) {
            return *cached;
        }
    }

    std::string key = m_collator.collateKey(value, m_locale);
    if (m_cache) {
        m_cache->insert(m_locale, value, key);
    }
    return key;
}

} // namespace ordering
