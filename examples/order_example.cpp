#include "ordering/IcuCollator.hpp"
#include "ordering/OrderingEngine.hpp"
#include "table/Table.hpp"
#include <iostream>

using namespace ordering;

static void printTable(const Table& table) {
    for (const auto& name : table.getColumnNames()) {
        std::cout << name << "\t";
    }
    std::cout << "\n";
    for (size_t row = 0; row < table.rowCount(); ++row) {
        for (const auto& name : table.getColumnNames()) {
            std::cout << table.getColumn(name)->valueToString(row) << "\t";
        }
        std::cout << "\n";
    }
}

int main() {
    std::cout << "=== Ordering Example ===" << std::endl;

    Table table;
    table.addTextColumn("name");
    table.addIntegerColumn("age");
    table.addRealColumn("salary");
    table.addCategoricalColumn("grade", {"junior", "senior", "lead"});

    table.addRow({"Ñoño", "30", "50000.0", "senior"});
    table.addRow({"nadia", "25", "NA", "junior"});
    table.addRow({"Zoé", "35", "60000.0", "lead"});
    table.addRow({"Noah", "NA", "52000.0", "senior"});
    table.addRow({"élodie", "32", "55000.0", "junior"});

    std::cout << "\n=== Original ===" << std::endl;
    printTable(table);

    OrderingEngine engine(std::make_shared<IcuCollator>());

    // ===== Locale C : ordre des octets =====
    std::cout << "\n=== name ASC, locale C ===" << std::endl;
    auto byBytes = engine.order(table, {OrderSpec("name")});
    printTable(*table.take(byBytes));

    // ===== Locale espagnole =====
    std::cout << "\n=== name ASC, locale es ===" << std::endl;
    auto bySpanish = engine.order(table, {OrderSpec("name")}, "es");
    printTable(*table.take(bySpanish));

    // ===== Multi-colonnes, manquants en tête =====
    std::cout << "\n=== grade DESC, salary ASC (missing first) ===" << std::endl;
    auto request = OrderSpecParser::fromJson(json::parse(R"({
        "locale": "C",
        "order": [
            {"column": "grade", "order": "desc"},
            {"column": "salary", "order": "asc", "missing": "first"}
        ]
    })"));
    printTable(*table.take(engine.order(table, request)));

    std::cout << "\n=== Example Complete ===" << std::endl;
    return 0;
}
