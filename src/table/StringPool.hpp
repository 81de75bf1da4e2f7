#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <cstdint>

namespace ordering {

/**
 * String pooling / Dictionary encoding des colonnes texte
 *
 * Chaque valeur distincte est stockée une seule fois et identifiée par un
 * StringId (uint32_t). Le moteur de tri s'en sert pour ne calculer qu'une
 * clé de collation par valeur distincte.
 */
class StringPool {
public:
    using StringId = uint32_t;
    static constexpr StringId INVALID_ID = UINT32_MAX;

    StringPool() {
        m_strings.reserve(1024);
        m_string_to_id.reserve(1024);
    }

    /**
     * Ajoute une string au pool et retourne son ID
     * Si la string existe déjà, retourne l'ID existant
     */
    StringId intern(const std::string& str) {
        auto it = m_string_to_id.find(str);
        if (it != m_string_to_id.end()) {
            return it->second;
        }

        StringId id = static_cast<StringId>(m_strings.size());
        m_strings.push_back(str);
        m_string_to_id.emplace(str, id);
        return id;
    }

    /**
     * Récupère la string à partir de son ID (string vide si ID invalide)
     */
    const std::string& getString(StringId id) const {
        if (id >= m_strings.size()) {
            static const std::string empty;
            return empty;
        }
        return m_strings[id];
    }

    bool isValid(StringId id) const {
        return id < m_strings.size();
    }

    // Nombre de strings distinctes
    size_t size() const {
        return m_strings.size();
    }

    void reserve(size_t capacity) {
        m_strings.reserve(capacity);
        m_string_to_id.reserve(capacity);
    }

private:
    std::vector<std::string> m_strings;                          // ID → String
    std::unordered_map<std::string, StringId> m_string_to_id;    // String → ID
};

} // namespace ordering
