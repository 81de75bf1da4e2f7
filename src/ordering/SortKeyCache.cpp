#include "SortKeyCache.hpp"
#include <mutex>

namespace ordering {

std::optional<std::string> SortKeyCache::lookup(const std::string& locale,
                                                const std::string& value) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    auto localeIt = m_byLocale.find(locale);
    if (localeIt != m_byLocale.end()) {
        auto it = localeIt->second.find(value);
        if (it != localeIt->second.end()) {
            ++m_hits;
            return it->second;
        }
    }
    ++m_misses;
    return std::nullopt;
}

void SortKeyCache::insert(const std::string& locale, const std::string& value,
                          const std::string& key) {
    if (m_capacity == 0) return;

    std::unique_lock<std::shared_mutex> lock(m_mutex);

    if (m_size >= m_capacity) {
        m_byLocale.clear();
        m_size = 0;
    }

    auto& keys = m_byLocale[locale];
    auto result = keys.insert_or_assign(value, key);
    if (result.second) {
        ++m_size;
    }
}

void SortKeyCache::clear() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_byLocale.clear();
    m_size = 0;
}

size_t SortKeyCache::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_size;
}

} // namespace ordering
