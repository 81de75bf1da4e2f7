#include "TableIO.hpp"
#include <fstream>
#include <cctype>
#include <stdexcept>

namespace ordering {

namespace {

bool isIntegerLiteral(const std::string& value) {
    size_t start = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    if (start >= value.size()) return false;
    for (size_t i = start; i < value.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return false;
    }
    try {
        std::stoll(value);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool isRealLiteral(const std::string& value) {
    try {
        size_t consumed = 0;
        std::stod(value, &consumed);
        return consumed == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool isBooleanLiteral(const std::string& value) {
    return value == "true" || value == "false" || value == "TRUE" || value == "FALSE";
}

} // namespace

std::shared_ptr<Table> TableIO::readCSV(
    const std::string& filepath,
    char delimiter,
    bool hasHeader
) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::vector<bool>> quotedFlags;
    std::string line;
    bool firstLine = true;

    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        std::vector<bool> quoted;
        auto fields = parseCSVLine(line, delimiter, quoted);

        if (firstLine) {
            firstLine = false;
            if (hasHeader) {
                headers = fields;
                continue;
            }
            for (size_t i = 0; i < fields.size(); ++i) {
                headers.push_back("col" + std::to_string(i));
            }
        }

        fields.resize(headers.size());
        quoted.resize(headers.size(), false);
        rows.push_back(std::move(fields));
        quotedFlags.push_back(std::move(quoted));
    }

    auto table = std::make_shared<Table>();
    table->getStringPool()->reserve(rows.size());

    // Détection des types colonne par colonne
    for (size_t c = 0; c < headers.size(); ++c) {
        std::vector<std::string> values;
        values.reserve(rows.size());
        bool quotedMissingToken = false;
        for (size_t r = 0; r < rows.size(); ++r) {
            values.push_back(rows[r][c]);
            quotedMissingToken = quotedMissingToken || (quotedFlags[r][c] && rows[r][c] == "NA");
        }

        // "NA" cité est une valeur texte
        ColumnKind kind = quotedMissingToken ? ColumnKind::TEXT : detectKind(values);
        switch (kind) {
            case ColumnKind::INTEGER: table->addIntegerColumn(headers[c]); break;
            case ColumnKind::REAL:    table->addRealColumn(headers[c]); break;
            case ColumnKind::BOOLEAN: table->addBooleanColumn(headers[c]); break;
            default:                  table->addTextColumn(headers[c]); break;
        }
    }

    for (size_t r = 0; r < rows.size(); ++r) {
        table->addRow(rows[r], quotedFlags[r]);
    }
    return table;
}

void TableIO::writeCSV(
    const Table& table,
    const std::string& filepath,
    char delimiter,
    bool includeHeader
) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filepath);
    }

    const auto& columnNames = table.getColumnNames();
    std::vector<IColumnPtr> columns;
    for (const auto& name : columnNames) {
        columns.push_back(table.getColumn(name));
    }

    if (includeHeader) {
        for (size_t c = 0; c < columnNames.size(); ++c) {
            if (c > 0) file << delimiter;
            file << quoteField(columnNames[c], delimiter);
        }
        file << "\n";
    }

    size_t rows = table.rowCount();
    for (size_t i = 0; i < rows; ++i) {
        for (size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) file << delimiter;
            if (columns[c]->isMissing(i)) {
                file << "NA";
            } else {
                file << quoteField(columns[c]->valueToString(i), delimiter);
            }
        }
        file << "\n";
    }
}

std::vector<std::string> TableIO::parseCSVLine(const std::string& line, char delimiter) {
    std::vector<bool> quoted;
    return parseCSVLine(line, delimiter, quoted);
}

std::vector<std::string> TableIO::parseCSVLine(const std::string& line, char delimiter,
                                               std::vector<bool>& quotedFields) {
    std::vector<std::string> fields;
    quotedFields.clear();
    std::string field;
    bool inQuotes = false;
    bool quoted = false;

    auto flush = [&]() {
        quotedFields.push_back(quoted);
        if (quoted) {
            fields.push_back(field);
        } else {
            size_t start = field.find_first_not_of(" \t");
            size_t end = field.find_last_not_of(" \t");
            fields.push_back(start == std::string::npos ? "" : field.substr(start, end - start + 1));
        }
        field.clear();
        quoted = false;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '"') {
            if (inQuotes && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else {
                inQuotes = !inQuotes;
                quoted = true;
            }
        } else if (c == delimiter && !inQuotes) {
            flush();
        } else {
            field += c;
        }
    }
    flush();

    return fields;
}

ColumnKind TableIO::detectKind(const std::vector<std::string>& values) {
    bool allInteger = true;
    bool allReal = true;
    bool allBoolean = true;
    bool any = false;

    for (const auto& value : values) {
        if (Table::isMissingToken(value)) continue;
        any = true;
        allInteger = allInteger && isIntegerLiteral(value);
        allReal = allReal && isRealLiteral(value);
        allBoolean = allBoolean && isBooleanLiteral(value);
        if (!allInteger && !allReal && !allBoolean) break;
    }

    if (!any) return ColumnKind::TEXT;
    if (allInteger) return ColumnKind::INTEGER;
    if (allReal) return ColumnKind::REAL;
    if (allBoolean) return ColumnKind::BOOLEAN;
    return ColumnKind::TEXT;
}

std::string TableIO::quoteField(const std::string& value, char delimiter) {
    if (value != "NA" && value.find(delimiter) == std::string::npos &&
        value.find('"') == std::string::npos && value.find('\n') == std::string::npos) {
        return value;
    }
    std::string result = "\"";
    for (char c : value) {
        if (c == '"') result += '"';
        result += c;
    }
    result += '"';
    return result;
}

} // namespace ordering
