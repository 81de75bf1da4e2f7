#include <catch2/catch_test_macros.hpp>
#include "ordering/ColumnKeyExtractor.hpp"
#include "ordering/OrderingError.hpp"
#include <limits>

using namespace ordering;

namespace {

// Vérifie que la comparaison des clés suit l'ordre attendu des lignes
void requireKeyOrder(const SortKeys& keys, const std::vector<size_t>& expected) {
    for (size_t i = 1; i < expected.size(); ++i) {
        INFO("rows " << expected[i - 1] << " and " << expected[i]);
        REQUIRE(keys.compare(expected[i - 1], expected[i]) < 0);
    }
}

const RawByteKeySource rawKeys{};

} // namespace

TEST_CASE("Extract integer keys follow numeric order", "[ColumnKeyExtractor]") {
    IntegerColumn col("n");
    for (int64_t v : {int64_t{0}, int64_t{-1}, std::numeric_limits<int64_t>::max(),
                      std::numeric_limits<int64_t>::min(), int64_t{42}}) {
        col.push_back(v);
    }

    auto keys = ColumnKeyExtractor::extract(col, OrderSpec("n"), rawKeys);

    REQUIRE(keys.isFixedWidth());
    REQUIRE(keys.maxLength() == 9);
    requireKeyOrder(keys, {3, 1, 0, 4, 2});
}

TEST_CASE("Extract real keys follow IEEE order", "[ColumnKeyExtractor]") {
    RealColumn col("x");
    for (double v : {1.5, -2.25, 0.0, -std::numeric_limits<double>::infinity(),
                     std::numeric_limits<double>::infinity(), -0.0, 1e-300}) {
        col.push_back(v);
    }

    auto keys = ColumnKeyExtractor::extract(col, OrderSpec("x"), rawKeys);

    requireKeyOrder(keys, {3, 1, 2, 6, 0, 4});
    // -0.0 et 0.0 sont égaux
    REQUIRE(keys.compare(2, 5) == 0);
}

TEST_CASE("Extract descending inverts value bytes", "[ColumnKeyExtractor]") {
    IntegerColumn col("n");
    col.push_back(1);
    col.push_back(3);
    col.push_back(2);

    auto keys = ColumnKeyExtractor::extract(col, OrderSpec("n", Direction::DESCENDING), rawKeys);

    requireKeyOrder(keys, {1, 2, 0});
}

TEST_CASE("Extract missing keys sit at the chosen extreme", "[ColumnKeyExtractor]") {
    IntegerColumn col("n");
    col.push_back(std::numeric_limits<int64_t>::min());
    col.pushMissing();
    col.push_back(std::numeric_limits<int64_t>::max());

    SECTION("last, ascending") {
        auto keys = ColumnKeyExtractor::extract(col, OrderSpec("n"), rawKeys);
        requireKeyOrder(keys, {0, 2, 1});
    }
    SECTION("first, ascending") {
        auto keys = ColumnKeyExtractor::extract(
            col, OrderSpec("n", Direction::ASCENDING, MissingPlacement::FIRST), rawKeys);
        requireKeyOrder(keys, {1, 0, 2});
    }
    SECTION("last, descending keeps missing last") {
        auto keys = ColumnKeyExtractor::extract(
            col, OrderSpec("n", Direction::DESCENDING, MissingPlacement::LAST), rawKeys);
        requireKeyOrder(keys, {2, 0, 1});
    }
}

TEST_CASE("Extract boolean and categorical keys", "[ColumnKeyExtractor]") {
    BooleanColumn flags("f");
    flags.push_back(true);
    flags.push_back(false);
    auto flagKeys = ColumnKeyExtractor::extract(flags, OrderSpec("f"), rawKeys);
    requireKeyOrder(flagKeys, {1, 0});

    // L'ordre des niveaux prime sur l'ordre alphabétique
    CategoricalColumn sizes("s", {"small", "medium", "large"});
    sizes.push_back("large");
    sizes.push_back("small");
    sizes.push_back("medium");
    auto sizeKeys = ColumnKeyExtractor::extract(sizes, OrderSpec("s"), rawKeys);
    requireKeyOrder(sizeKeys, {1, 2, 0});
}

TEST_CASE("Extract text keys use raw bytes in C locale", "[ColumnKeyExtractor]") {
    TextColumn col("t", std::make_shared<StringPool>());
    col.push_back("b");
    col.push_back("B");
    col.push_back("");
    col.push_back("ba");

    auto keys = ColumnKeyExtractor::extract(col, OrderSpec("t"), rawKeys);

    REQUIRE_FALSE(keys.isFixedWidth());
    requireKeyOrder(keys, {2, 1, 0, 3});
}

TEST_CASE("Extract descending text puts a prefix after its extensions", "[ColumnKeyExtractor]") {
    TextColumn col("t", std::make_shared<StringPool>());
    col.push_back("a");
    col.push_back("ab");
    col.push_back("b");
    col.pushMissing();

    auto keys = ColumnKeyExtractor::extract(col, OrderSpec("t", Direction::DESCENDING), rawKeys);

    requireKeyOrder(keys, {2, 1, 0, 3});
}

TEST_CASE("Extract text computes one key per distinct value", "[ColumnKeyExtractor]") {
    struct CountingSource : TextKeySource {
        mutable int calls = 0;
        std::string keyFor(const std::string& value) const override {
            ++calls;
            return value;
        }
    } source;

    TextColumn col("t", std::make_shared<StringPool>());
    for (int i = 0; i < 50; ++i) {
        col.push_back(i % 2 ? "odd" : "even");
    }

    ColumnKeyExtractor::extract(col, OrderSpec("t"), source);

    REQUIRE(source.calls == 2);
}

TEST_CASE("Extract list column is unsupported", "[ColumnKeyExtractor][error]") {
    ListColumn col("tags");
    col.push_back({"a"});

    REQUIRE_FALSE(ColumnKeyExtractor::isSupported(ColumnKind::LIST));
    try {
        ColumnKeyExtractor::extract(col, OrderSpec("tags"), rawKeys);
        FAIL("expected UnsupportedColumnType");
    } catch (const UnsupportedColumnType& e) {
        REQUIRE(e.code() == ErrorCode::UNSUPPORTED_COLUMN_TYPE);
        REQUIRE(e.subject() == "tags");
    }
}
