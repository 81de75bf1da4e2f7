#pragma once

#include "StringPool.hpp"
#include <vector>
#include <string>
#include <memory>
#include <cstdint>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace ordering {

/**
 * Types sémantiques des colonnes. L'ensemble est fermé : le moteur de tri
 * sait extraire une clé pour tous les types sauf LIST.
 */
enum class ColumnKind {
    INTEGER,
    REAL,
    BOOLEAN,
    TEXT,
    CATEGORICAL,
    LIST
};

std::string columnKindToString(ColumnKind kind);

/**
 * Interface de base des colonnes
 * Une colonne est immuable une fois ajoutée à une Table.
 */
class IColumn {
public:
    virtual ~IColumn() = default;

    virtual const std::string& getName() const = 0;
    virtual ColumnKind getKind() const = 0;
    virtual size_t size() const = 0;
    virtual bool isMissing(size_t index) const = 0;

    // Représentation texte d'une valeur ("NA" si manquante), utilisée par l'export CSV
    virtual std::string valueToString(size_t index) const = 0;

    // Nouvelle colonne contenant les lignes aux positions données, dans cet ordre
    virtual std::shared_ptr<IColumn> take(const std::vector<size_t>& indices) const = 0;
};

using IColumnPtr = std::shared_ptr<IColumn>;

/**
 * Partie commune : nom + masque des valeurs manquantes
 */
class ColumnBase : public IColumn {
public:
    explicit ColumnBase(const std::string& name) : m_name(name) {}

    const std::string& getName() const override { return m_name; }
    size_t size() const override { return m_missing.size(); }
    bool isMissing(size_t index) const override { return m_missing[index] != 0; }

    size_t missingCount() const {
        size_t count = 0;
        for (auto flag : m_missing) count += flag;
        return count;
    }

protected:
    std::string m_name;
    std::vector<uint8_t> m_missing;
};

/**
 * Colonne d'entiers 64 bits
 */
class IntegerColumn : public ColumnBase {
public:
    using ColumnBase::ColumnBase;

    ColumnKind getKind() const override { return ColumnKind::INTEGER; }

    void push_back(int64_t value) {
        m_data.push_back(value);
        m_missing.push_back(0);
    }

    void pushMissing() {
        m_data.push_back(0);
        m_missing.push_back(1);
    }

    int64_t at(size_t index) const { return m_data[index]; }
    const std::vector<int64_t>& data() const { return m_data; }

    std::string valueToString(size_t index) const override {
        return isMissing(index) ? "NA" : std::to_string(m_data[index]);
    }

    std::shared_ptr<IColumn> take(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<IntegerColumn>(m_name);
        newCol->m_data.reserve(indices.size());
        newCol->m_missing.reserve(indices.size());
        for (size_t idx : indices) {
            newCol->m_data.push_back(m_data.at(idx));
            newCol->m_missing.push_back(m_missing[idx]);
        }
        return newCol;
    }

private:
    std::vector<int64_t> m_data;
};

/**
 * Colonne de doubles
 * NaN est stocké comme valeur manquante.
 */
class RealColumn : public ColumnBase {
public:
    using ColumnBase::ColumnBase;

    ColumnKind getKind() const override { return ColumnKind::REAL; }

    void push_back(double value) {
        m_data.push_back(value);
        m_missing.push_back(std::isnan(value) ? 1 : 0);
    }

    void pushMissing() {
        m_data.push_back(0.0);
        m_missing.push_back(1);
    }

    double at(size_t index) const { return m_data[index]; }
    const std::vector<double>& data() const { return m_data; }

    std::string valueToString(size_t index) const override;

    std::shared_ptr<IColumn> take(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<RealColumn>(m_name);
        newCol->m_data.reserve(indices.size());
        newCol->m_missing.reserve(indices.size());
        for (size_t idx : indices) {
            newCol->m_data.push_back(m_data.at(idx));
            newCol->m_missing.push_back(m_missing[idx]);
        }
        return newCol;
    }

private:
    std::vector<double> m_data;
};

class BooleanColumn : public ColumnBase {
public:
    using ColumnBase::ColumnBase;

    ColumnKind getKind() const override { return ColumnKind::BOOLEAN; }

    void push_back(bool value) {
        m_data.push_back(value ? 1 : 0);
        m_missing.push_back(0);
    }

    void pushMissing() {
        m_data.push_back(0);
        m_missing.push_back(1);
    }

    bool at(size_t index) const { return m_data[index] != 0; }

    std::string valueToString(size_t index) const override {
        if (isMissing(index)) return "NA";
        return m_data[index] ? "true" : "false";
    }

    std::shared_ptr<IColumn> take(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<BooleanColumn>(m_name);
        newCol->m_data.reserve(indices.size());
        newCol->m_missing.reserve(indices.size());
        for (size_t idx : indices) {
            newCol->m_data.push_back(m_data.at(idx));
            newCol->m_missing.push_back(m_missing[idx]);
        }
        return newCol;
    }

private:
    std::vector<uint8_t> m_data;
};

/**
 * Colonne texte avec dictionary encoding
 * - Stocke des StringId au lieu des strings
 * - Le pool peut être partagé entre plusieurs colonnes
 */
class TextColumn : public ColumnBase {
public:
    using StringId = StringPool::StringId;

    TextColumn(const std::string& name, std::shared_ptr<StringPool> pool)
        : ColumnBase(name), m_string_pool(std::move(pool)) {
        if (!m_string_pool) {
            throw std::invalid_argument("TextColumn '" + name + "' requires a string pool");
        }
    }

    ColumnKind getKind() const override { return ColumnKind::TEXT; }

    void push_back(const std::string& value) {
        m_data.push_back(m_string_pool->intern(value));
        m_missing.push_back(0);
    }

    void pushMissing() {
        m_data.push_back(StringPool::INVALID_ID);
        m_missing.push_back(1);
    }

    const std::string& at(size_t index) const {
        return m_string_pool->getString(m_data[index]);
    }

    StringId getId(size_t index) const { return m_data[index]; }
    const std::vector<StringId>& data() const { return m_data; }
    std::shared_ptr<StringPool> getStringPool() const { return m_string_pool; }

    std::string valueToString(size_t index) const override {
        return isMissing(index) ? "NA" : at(index);
    }

    std::shared_ptr<IColumn> take(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<TextColumn>(m_name, m_string_pool);
        newCol->m_data.reserve(indices.size());
        newCol->m_missing.reserve(indices.size());
        for (size_t idx : indices) {
            newCol->m_data.push_back(m_data.at(idx));
            newCol->m_missing.push_back(m_missing[idx]);
        }
        return newCol;
    }

private:
    std::shared_ptr<StringPool> m_string_pool;
    std::vector<StringId> m_data;
};

/**
 * Colonne catégorielle : liste de niveaux ordonnée et fixe,
 * chaque valeur est le rang de son niveau.
 */
class CategoricalColumn : public ColumnBase {
public:
    CategoricalColumn(const std::string& name, std::vector<std::string> levels)
        : ColumnBase(name), m_levels(std::move(levels)) {
        for (size_t i = 0; i < m_levels.size(); ++i) {
            if (!m_rankByLevel.emplace(m_levels[i], static_cast<uint32_t>(i)).second) {
                throw std::invalid_argument("Duplicate level '" + m_levels[i] +
                                            "' in categorical column '" + name + "'");
            }
        }
    }

    ColumnKind getKind() const override { return ColumnKind::CATEGORICAL; }

    void push_back(const std::string& level) {
        auto it = m_rankByLevel.find(level);
        if (it == m_rankByLevel.end()) {
            throw std::out_of_range("Unknown level '" + level + "' for column '" + m_name + "'");
        }
        m_ranks.push_back(it->second);
        m_missing.push_back(0);
    }

    void pushRank(uint32_t rank) {
        if (rank >= m_levels.size()) {
            throw std::out_of_range("Level rank " + std::to_string(rank) +
                                    " out of range for column '" + m_name + "'");
        }
        m_ranks.push_back(rank);
        m_missing.push_back(0);
    }

    void pushMissing() {
        m_ranks.push_back(0);
        m_missing.push_back(1);
    }

    uint32_t rank(size_t index) const { return m_ranks[index]; }
    const std::string& at(size_t index) const { return m_levels[m_ranks[index]]; }
    const std::vector<std::string>& levels() const { return m_levels; }

    std::string valueToString(size_t index) const override {
        return isMissing(index) ? "NA" : at(index);
    }

    std::shared_ptr<IColumn> take(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<CategoricalColumn>(m_name, m_levels);
        newCol->m_ranks.reserve(indices.size());
        newCol->m_missing.reserve(indices.size());
        for (size_t idx : indices) {
            newCol->m_ranks.push_back(m_ranks.at(idx));
            newCol->m_missing.push_back(m_missing[idx]);
        }
        return newCol;
    }

private:
    std::vector<std::string> m_levels;
    std::unordered_map<std::string, uint32_t> m_rankByLevel;
    std::vector<uint32_t> m_ranks;
};

/**
 * Colonne de listes (valeurs imbriquées)
 * Pas d'ordre défini : le tri sur ce type est refusé.
 */
class ListColumn : public ColumnBase {
public:
    using ColumnBase::ColumnBase;

    ColumnKind getKind() const override { return ColumnKind::LIST; }

    void push_back(std::vector<std::string> items) {
        m_data.push_back(std::move(items));
        m_missing.push_back(0);
    }

    void pushMissing() {
        m_data.emplace_back();
        m_missing.push_back(1);
    }

    const std::vector<std::string>& at(size_t index) const { return m_data[index]; }

    std::string valueToString(size_t index) const override;

    std::shared_ptr<IColumn> take(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<ListColumn>(m_name);
        newCol->m_data.reserve(indices.size());
        newCol->m_missing.reserve(indices.size());
        for (size_t idx : indices) {
            newCol->m_data.push_back(m_data.at(idx));
            newCol->m_missing.push_back(m_missing[idx]);
        }
        return newCol;
    }

private:
    std::vector<std::vector<std::string>> m_data;
};

} // namespace ordering
