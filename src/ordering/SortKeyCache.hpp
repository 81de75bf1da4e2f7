#pragma once

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ordering {

/**
 * Cache des clés de collation, indexé par (locale, valeur)
 *
 * Mémoïsation pure : le vider à tout moment ne change aucun résultat.
 * Lectures concurrentes sans blocage mutuel ; une insertion concurrente de la
 * même clé écrit la même valeur. Au-delà de la capacité, le cache est vidé.
 */
class SortKeyCache {
public:
    explicit SortKeyCache(size_t capacity = 100000) : m_capacity(capacity) {}

    std::optional<std::string> lookup(const std::string& locale, const std::string& value) const;
    void insert(const std::string& locale, const std::string& value, const std::string& key);
    void clear();

    size_t size() const;
    size_t capacity() const { return m_capacity; }
    uint64_t hits() const { return m_hits.load(); }
    uint64_t misses() const { return m_misses.load(); }

private:
    using KeyMap = std::unordered_map<std::string, std::string>;

    size_t m_capacity;
    size_t m_size = 0;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, KeyMap> m_byLocale;
    mutable std::atomic<uint64_t> m_hits{0};
    mutable std::atomic<uint64_t> m_misses{0};
};

} // namespace ordering
