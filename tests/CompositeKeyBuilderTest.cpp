#include <catch2/catch_test_macros.hpp>
#include "ordering/CompositeKeyBuilder.hpp"
#include "ordering/OrderingError.hpp"

using namespace ordering;

TEST_CASE("CompositeKeyBuilder plans passes from last spec to first", "[CompositeKeyBuilder]") {
    Table table;
    table.addIntegerColumn("a");
    table.addIntegerColumn("b");
    table.addIntegerColumn("c");
    table.addRow({"1", "2", "3"});

    auto plan = CompositeKeyBuilder::build(
        table, {OrderSpec("a"), OrderSpec("b"), OrderSpec("c")}, RawByteKeySource{});

    REQUIRE(plan.rowCount == 1);
    REQUIRE(plan.passes.size() == 3);
    REQUIRE(plan.passes[0].column == "c");
    REQUIRE(plan.passes[1].column == "b");
    REQUIRE(plan.passes[2].column == "a");
}

TEST_CASE("CompositeKeyBuilder single spec makes one pass", "[CompositeKeyBuilder]") {
    Table table;
    table.addIntegerColumn("a");
    table.addRow({"2"});
    table.addRow({"1"});

    auto plan = CompositeKeyBuilder::build(table, {OrderSpec("a")}, RawByteKeySource{});
    REQUIRE(plan.passes.size() == 1);

    auto order = CompositeKeyBuilder::execute(plan, RadixSorter());
    REQUIRE(order == Permutation{1, 0});
}

TEST_CASE("CompositeKeyBuilder primary asc secondary desc", "[CompositeKeyBuilder]") {
    Table table;
    table.addIntegerColumn("a");
    table.addIntegerColumn("b");
    table.addRow({"1", "2"});
    table.addRow({"1", "1"});
    table.addRow({"2", "3"});
    table.addRow({"1", "5"});
    table.addRow({"0", "0"});

    auto plan = CompositeKeyBuilder::build(
        table, {OrderSpec("a"), OrderSpec("b", Direction::DESCENDING)}, RawByteKeySource{});
    auto order = CompositeKeyBuilder::execute(plan, RadixSorter());

    REQUIRE(order == Permutation{4, 3, 0, 1, 2});
}

TEST_CASE("CompositeKeyBuilder mixes text and numeric columns", "[CompositeKeyBuilder]") {
    Table table;
    table.addTextColumn("dept");
    table.addIntegerColumn("salary");
    table.addRow({"Sales", "60000"});
    table.addRow({"Engineering", "80000"});
    table.addRow({"Sales", "70000"});
    table.addRow({"Engineering", "90000"});
    table.addRow({"Engineering", "80000"});

    auto plan = CompositeKeyBuilder::build(
        table, {OrderSpec("dept"), OrderSpec("salary", Direction::DESCENDING)}, RawByteKeySource{});
    auto order = CompositeKeyBuilder::execute(plan, RadixSorter());

    // Engineering d'abord, salaires décroissants, égalités dans l'ordre d'origine
    REQUIRE(order == Permutation{3, 1, 4, 2, 0});
}

// =============================================================================
// Error Handling Tests
// =============================================================================

TEST_CASE("CompositeKeyBuilder empty spec list throws", "[CompositeKeyBuilder][error]") {
    Table table;
    table.addIntegerColumn("a");

    REQUIRE_THROWS_AS(CompositeKeyBuilder::build(table, {}, RawByteKeySource{}), EmptyOrderSpec);
}

TEST_CASE("CompositeKeyBuilder unknown column throws", "[CompositeKeyBuilder][error]") {
    Table table;
    table.addIntegerColumn("a");

    REQUIRE_THROWS_AS(CompositeKeyBuilder::build(table, {OrderSpec("zzz")}, RawByteKeySource{}),
                      UnknownColumnReference);
}
