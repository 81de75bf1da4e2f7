#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace ordering {

/**
 * Clés de tri d'une colonne : une chaîne d'octets par ligne
 *
 * La comparaison se fait chiffre par chiffre sur un alphabet de 258 symboles :
 *   PAD_LOW (0) < octets 0x00..0xFF (1..256) < PAD_HIGH (257)
 * Une clé plus courte est complétée (conceptuellement) par le symbole de
 * bourrage de la colonne : PAD_LOW en ascendant, PAD_HIGH pour le texte en
 * descendant, de sorte qu'un préfixe passe après ses extensions.
 *
 * Le premier octet de chaque clé est le tag de placement des manquants.
 */
class SortKeys {
public:
    using Digit = uint16_t;

    static constexpr Digit PAD_LOW = 0;
    static constexpr Digit PAD_HIGH = 257;
    static constexpr size_t ALPHABET = 258;

    static constexpr uint8_t TAG_MISSING_FIRST = 0x00;
    static constexpr uint8_t TAG_PRESENT = 0x01;
    static constexpr uint8_t TAG_MISSING_LAST = 0x02;

    SortKeys() = default;

    // Clés de largeur fixe (numériques, booléens, catégories)
    static SortKeys fixedWidth(size_t rowCount, size_t width) {
        SortKeys keys;
        keys.m_fixedWidth = width;
        keys.m_maxLength = width;
        keys.m_rows = rowCount;
        keys.m_bytes.assign(rowCount * width, 0);
        return keys;
    }

    // Clés de longueur variable (texte), remplies par append()
    static SortKeys variableWidth(size_t rowCount, Digit padDigit) {
        SortKeys keys;
        keys.m_padDigit = padDigit;
        keys.m_offsets.reserve(rowCount + 1);
        keys.m_offsets.push_back(0);
        return keys;
    }

    void append(const uint8_t* data, size_t length) {
        m_bytes.insert(m_bytes.end(), data, data + length);
        m_offsets.push_back(m_bytes.size());
        m_maxLength = std::max(m_maxLength, length);
        ++m_rows;
    }

    uint8_t* mutableKey(size_t row) { return m_bytes.data() + row * m_fixedWidth; }

    size_t size() const { return m_rows; }
    bool isFixedWidth() const { return m_offsets.empty(); }
    size_t maxLength() const { return m_maxLength; }
    Digit padDigit() const { return m_padDigit; }

    size_t length(size_t row) const {
        return isFixedWidth() ? m_fixedWidth : m_offsets[row + 1] - m_offsets[row];
    }

    const uint8_t* key(size_t row) const {
        return m_bytes.data() + (isFixedWidth() ? row * m_fixedWidth : m_offsets[row]);
    }

    Digit digit(size_t row, size_t depth) const {
        if (depth >= length(row)) return m_padDigit;
        return static_cast<Digit>(key(row)[depth]) + 1;
    }

    // Compare deux lignes à partir d'une profondeur donnée (-1, 0, 1)
    int compare(size_t a, size_t b, size_t depth = 0) const {
        size_t end = std::max(length(a), length(b));
        for (size_t d = depth; d < end; ++d) {
            Digit da = digit(a, d);
            Digit db = digit(b, d);
            if (da != db) return da < db ? -1 : 1;
        }
        return 0;
    }

    std::string keyBytes(size_t row) const {
        return std::string(reinterpret_cast<const char*>(key(row)), length(row));
    }

private:
    std::vector<uint8_t> m_bytes;
    std::vector<size_t> m_offsets;
    size_t m_fixedWidth = 0;
    size_t m_maxLength = 0;
    size_t m_rows = 0;
    Digit m_padDigit = PAD_LOW;
};

} // namespace ordering
