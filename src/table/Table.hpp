#pragma once

#include "Column.hpp"
#include "StringPool.hpp"
#include <unordered_map>
#include <vector>
#include <string>
#include <memory>

namespace ordering {

/**
 * Table : séquence ordonnée de colonnes nommées de même longueur
 *
 * Le moteur de tri lit les colonnes sans jamais les modifier ; l'ordre des
 * lignes est rendu sous forme de permutation, appliquée ensuite par take().
 */
class Table {
public:
    Table() : m_string_pool(std::make_shared<StringPool>()) {}

    // Construction
    void addColumn(IColumnPtr column);
    std::shared_ptr<IntegerColumn> addIntegerColumn(const std::string& name);
    std::shared_ptr<RealColumn> addRealColumn(const std::string& name);
    std::shared_ptr<BooleanColumn> addBooleanColumn(const std::string& name);
    std::shared_ptr<TextColumn> addTextColumn(const std::string& name);
    std::shared_ptr<CategoricalColumn> addCategoricalColumn(const std::string& name,
                                                            std::vector<std::string> levels);

    // Ajoute une ligne sous forme texte ; "NA" (ou vide) = valeur manquante
    void addRow(const std::vector<std::string>& values);
    // literal[i] : champ cité, jamais manquant pour une colonne texte ("NA" reste un texte)
    void addRow(const std::vector<std::string>& values, const std::vector<bool>& literal);

    // Accesseurs
    IColumnPtr getColumn(const std::string& name) const;
    bool hasColumn(const std::string& name) const;
    const std::vector<std::string>& getColumnNames() const { return m_columnOrder; }
    size_t rowCount() const;
    size_t columnCount() const { return m_columnOrder.size(); }

    // Nouvelle table avec les lignes dans l'ordre donné
    std::shared_ptr<Table> take(const std::vector<size_t>& permutation) const;

    std::shared_ptr<StringPool> getStringPool() const { return m_string_pool; }

    static bool isMissingToken(const std::string& value) {
        return value.empty() || value == "NA";
    }

private:
    std::unordered_map<std::string, IColumnPtr> m_columns;
    std::vector<std::string> m_columnOrder;
    std::shared_ptr<StringPool> m_string_pool;
};

using TablePtr = std::shared_ptr<Table>;

} // namespace ordering
