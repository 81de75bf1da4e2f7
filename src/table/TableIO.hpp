#pragma once

#include "Table.hpp"
#include <string>
#include <vector>
#include <memory>

namespace ordering {

/**
 * IO CSV pour Table
 */
class TableIO {
public:
    /**
     * Charge un CSV dans une Table
     * Le type de chaque colonne est déduit de toutes ses valeurs non manquantes
     * (integer, real, boolean, sinon text). "NA" et les champs vides sont manquants ;
     * "NA" entre guillemets est un texte.
     */
    static std::shared_ptr<Table> readCSV(
        const std::string& filepath,
        char delimiter = ',',
        bool hasHeader = true
    );

    static void writeCSV(
        const Table& table,
        const std::string& filepath,
        char delimiter = ',',
        bool includeHeader = true
    );

    static std::vector<std::string> parseCSVLine(const std::string& line, char delimiter);
    // quoted[i] : le champ i était entre guillemets
    static std::vector<std::string> parseCSVLine(const std::string& line, char delimiter,
                                                 std::vector<bool>& quoted);

    static ColumnKind detectKind(const std::vector<std::string>& values);

private:
    static std::string quoteField(const std::string& value, char delimiter);
};

} // namespace ordering
