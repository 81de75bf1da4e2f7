#include "Table.hpp"
#include <stdexcept>

namespace ordering {

// ============================================================================
// Construction
// ============================================================================

void Table::addColumn(IColumnPtr column) {
    if (!column) {
        throw std::invalid_argument("Cannot add null column");
    }

    const auto& name = column->getName();
    if (m_columns.find(name) != m_columns.end()) {
        throw std::invalid_argument("Column '" + name + "' already exists");
    }
    // Les colonnes vides peuvent être remplies ensuite via addRow
    if (!m_columnOrder.empty() && column->size() != rowCount()) {
        throw std::invalid_argument("Column '" + name + "' has " + std::to_string(column->size()) +
                                    " rows, table has " + std::to_string(rowCount()));
    }

    m_columns[name] = column;
    m_columnOrder.push_back(name);
}

std::shared_ptr<IntegerColumn> Table::addIntegerColumn(const std::string& name) {
    auto col = std::make_shared<IntegerColumn>(name);
    addColumn(col);
    return col;
}

std::shared_ptr<RealColumn> Table::addRealColumn(const std::string& name) {
    auto col = std::make_shared<RealColumn>(name);
    addColumn(col);
    return col;
}

std::shared_ptr<BooleanColumn> Table::addBooleanColumn(const std::string& name) {
    auto col = std::make_shared<BooleanColumn>(name);
    addColumn(col);
    return col;
}

std::shared_ptr<TextColumn> Table::addTextColumn(const std::string& name) {
    auto col = std::make_shared<TextColumn>(name, m_string_pool);
    addColumn(col);
    return col;
}

std::shared_ptr<CategoricalColumn> Table::addCategoricalColumn(const std::string& name,
                                                               std::vector<std::string> levels) {
    auto col = std::make_shared<CategoricalColumn>(name, std::move(levels));
    addColumn(col);
    return col;
}

void Table::addRow(const std::vector<std::string>& values) {
    addRow(values, std::vector<bool>());
}

void Table::addRow(const std::vector<std::string>& values, const std::vector<bool>& literal) {
    if (values.size() != m_columnOrder.size()) {
        throw std::invalid_argument("Row size mismatch");
    }
    if (!literal.empty() && literal.size() != values.size()) {
        throw std::invalid_argument("Row literal flags size mismatch");
    }

    for (size_t i = 0; i < values.size(); ++i) {
        auto col = m_columns[m_columnOrder[i]];
        const std::string& value = values[i];
        bool missing = isMissingToken(value);

        if (auto intCol = std::dynamic_pointer_cast<IntegerColumn>(col)) {
            missing ? intCol->pushMissing() : intCol->push_back(std::stoll(value));
        } else if (auto realCol = std::dynamic_pointer_cast<RealColumn>(col)) {
            missing ? realCol->pushMissing() : realCol->push_back(std::stod(value));
        } else if (auto boolCol = std::dynamic_pointer_cast<BooleanColumn>(col)) {
            if (missing) {
                boolCol->pushMissing();
            } else if (value == "true" || value == "TRUE" || value == "1") {
                boolCol->push_back(true);
            } else if (value == "false" || value == "FALSE" || value == "0") {
                boolCol->push_back(false);
            } else {
                throw std::invalid_argument("Invalid boolean '" + value + "' for column '" +
                                            col->getName() + "'");
            }
        } else if (auto textCol = std::dynamic_pointer_cast<TextColumn>(col)) {
            // Un texte vide reste une valeur ; seul "NA" non cité est manquant
            bool quoted = !literal.empty() && literal[i];
            (value == "NA" && !quoted) ? textCol->pushMissing() : textCol->push_back(value);
        } else if (auto catCol = std::dynamic_pointer_cast<CategoricalColumn>(col)) {
            missing ? catCol->pushMissing() : catCol->push_back(value);
        } else {
            throw std::invalid_argument("Column '" + col->getName() + "' of kind " +
                                        columnKindToString(col->getKind()) +
                                        " cannot be filled from text");
        }
    }
}

// ============================================================================
// Accesseurs
// ============================================================================

IColumnPtr Table::getColumn(const std::string& name) const {
    auto it = m_columns.find(name);
    if (it == m_columns.end()) {
        throw std::out_of_range("Column '" + name + "' not found");
    }
    return it->second;
}

bool Table::hasColumn(const std::string& name) const {
    return m_columns.find(name) != m_columns.end();
}

size_t Table::rowCount() const {
    if (m_columnOrder.empty()) return 0;
    return m_columns.at(m_columnOrder.front())->size();
}

std::shared_ptr<Table> Table::take(const std::vector<size_t>& permutation) const {
    auto result = std::make_shared<Table>();
    result->m_string_pool = m_string_pool;

    for (const auto& colName : m_columnOrder) {
        result->addColumn(m_columns.at(colName)->take(permutation));
    }
    return result;
}

} // namespace ordering
