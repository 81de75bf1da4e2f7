#include <catch2/catch_test_macros.hpp>
#include "common/Logger.hpp"
#include "ordering/IcuCollator.hpp"
#include "ordering/OrderingEngine.hpp"
#include "ordering/OrderingError.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <locale>
#include <numeric>
#include <random>
#include <sstream>
#include <thread>

using namespace ordering;

namespace {

const std::string N_TILDE = "\xC3\xB1";  // ñ

std::shared_ptr<Table> textTable(const std::vector<std::string>& values) {
    auto table = std::make_shared<Table>();
    table->addTextColumn("t");
    for (const auto& v : values) table->addRow({v});
    return table;
}

bool isPermutation(const Permutation& p, size_t n) {
    if (p.size() != n) return false;
    std::vector<bool> seen(n, false);
    for (size_t row : p) {
        if (row >= n || seen[row]) return false;
        seen[row] = true;
    }
    return true;
}

// Collation de test : la clé est la valeur lue à l'envers
class ReversingCollator : public Collator {
public:
    std::string collateKey(const std::string& value, const std::string&) const override {
        ++calls;
        return std::string(value.rbegin(), value.rend());
    }
    bool supportsLocale(const std::string& locale) const override { return locale == "rev"; }
    std::string name() const override { return "reversing"; }

    mutable int calls = 0;
};

// Capture les logs le temps d'un test
class LogCapture {
public:
    LogCapture() {
        common::Logger::instance().setOutputStream(&m_stream);
        common::Logger::instance().setLevel(common::LogLevel::WARN);
    }
    ~LogCapture() {
        common::Logger::instance().setOutputStream(nullptr);
        common::Logger::instance().setLevel(common::LogLevel::INFO);
    }
    std::string str() const { return m_stream.str(); }

private:
    std::ostringstream m_stream;
};

// Collation de test : ordre inverse des octets
class ReverseCollate : public std::collate<char> {
protected:
    int do_compare(const char* low1, const char* high1,
                   const char* low2, const char* high2) const override {
        return std::collate<char>::do_compare(low2, high2, low1, high1);
    }
};

// Installe une locale globale le temps d'un test
class GlobalLocaleGuard {
public:
    explicit GlobalLocaleGuard(const std::locale& locale)
        : m_previous(std::locale::global(locale)) {}
    ~GlobalLocaleGuard() { std::locale::global(m_previous); }

private:
    std::locale m_previous;
};

} // namespace

// =============================================================================
// Scenarios
// =============================================================================

TEST_CASE("Order C locale groups uppercase before lowercase", "[OrderingEngine]") {
    OrderingEngine engine(std::make_shared<IcuCollator>());
    auto table = textTable({"a", "b", "C", "B", "c"});

    auto order = engine.order(*table, {OrderSpec("t")}, "C");

    // B, C, a, b, c
    REQUIRE(order == Permutation{3, 2, 0, 1, 4});
}

TEST_CASE("Order English locale groups letters regardless of case", "[OrderingEngine]") {
    OrderingEngine engine(std::make_shared<IcuCollator>());
    auto table = textTable({"a", "b", "C", "B", "c"});

    auto order = engine.order(*table, {OrderSpec("t")}, "en");

    // a, b, B, c, C
    REQUIRE(order == Permutation{0, 1, 3, 4, 2});
}

TEST_CASE("Order n-tilde by bytes in C and as a letter in Spanish", "[OrderingEngine]") {
    OrderingEngine engine(std::make_shared<IcuCollator>());
    auto table = textTable({N_TILDE, "n", "z"});

    REQUIRE(engine.order(*table, {OrderSpec("t")}, "C") == Permutation{1, 2, 0});
    REQUIRE(engine.order(*table, {OrderSpec("t")}, "es") == Permutation{1, 0, 2});
}

TEST_CASE("Order multi-column tie-break with mixed directions", "[OrderingEngine]") {
    Table table;
    table.addIntegerColumn("a");
    table.addIntegerColumn("b");
    table.addRow({"1", "2"});
    table.addRow({"1", "1"});
    table.addRow({"2", "3"});

    auto order = ordering::order(table, {OrderSpec("a"), OrderSpec("b", Direction::DESCENDING)});

    REQUIRE(order == Permutation{0, 1, 2});
}

TEST_CASE("Order missing values placement", "[OrderingEngine]") {
    Table table;
    table.addIntegerColumn("v");
    table.addRow({"5"});
    table.addRow({"NA"});
    table.addRow({"3"});

    OrderingEngine engine;

    SECTION("last") {
        auto order = engine.order(table, {OrderSpec("v", Direction::ASCENDING, MissingPlacement::LAST)});
        REQUIRE(order == Permutation{2, 0, 1});
    }
    SECTION("first") {
        auto order = engine.order(table, {OrderSpec("v", Direction::ASCENDING, MissingPlacement::FIRST)});
        REQUIRE(order == Permutation{1, 2, 0});
    }
    SECTION("descending keeps explicit placement") {
        auto order = engine.order(table, {OrderSpec("v", Direction::DESCENDING, MissingPlacement::LAST)});
        REQUIRE(order == Permutation{0, 2, 1});
    }
}

TEST_CASE("Order categorical column by level order", "[OrderingEngine]") {
    Table table;
    table.addCategoricalColumn("size", {"small", "medium", "large"});
    table.addRow({"large"});
    table.addRow({"small"});
    table.addRow({"NA"});
    table.addRow({"medium"});

    OrderingEngine engine;
    auto order = engine.order(table, {OrderSpec("size", Direction::DESCENDING, MissingPlacement::FIRST)});

    REQUIRE(order == Permutation{2, 0, 3, 1});
}

// =============================================================================
// Properties
// =============================================================================

TEST_CASE("Order result is a permutation and stable", "[OrderingEngine][property]") {
    std::mt19937 rng(2024);
    OrderingEngine engine;

    for (size_t n : {size_t{0}, size_t{1}, size_t{17}, size_t{300}, size_t{3000}}) {
        for (int distinct : {1, 3, 1000}) {
            std::uniform_int_distribution<int> dist(0, distinct - 1);
            Table table;
            auto key = table.addIntegerColumn("key");
            auto label = table.addTextColumn("label");
            for (size_t i = 0; i < n; ++i) {
                key->push_back(dist(rng));
                label->push_back(std::to_string(dist(rng) % 7));
            }

            auto order = engine.order(table, {OrderSpec("key"), OrderSpec("label", Direction::DESCENDING)});

            INFO("n=" << n << " distinct=" << distinct);
            REQUIRE(isPermutation(order, n));

            auto expected = order;
            std::iota(expected.begin(), expected.end(), 0);
            std::stable_sort(expected.begin(), expected.end(), [&](size_t a, size_t b) {
                if (key->at(a) != key->at(b)) return key->at(a) < key->at(b);
                return label->at(a) > label->at(b);
            });
            REQUIRE(order == expected);
        }
    }
}

TEST_CASE("Order descending reverses ascending modulo ties", "[OrderingEngine][property]") {
    std::mt19937 rng(99);
    std::uniform_real_distribution<double> dist(-10.0, 10.0);

    Table table;
    auto values = table.addRealColumn("x");
    for (int i = 0; i < 500; ++i) {
        values->push_back(i % 5 == 0 ? 1.0 : dist(rng));
    }

    OrderingEngine engine;
    auto ascending = engine.order(table, {OrderSpec("x")});
    auto sorted = table.take(ascending);
    auto resorted = engine.order(*sorted, {OrderSpec("x", Direction::DESCENDING)});

    auto sortedValues = std::dynamic_pointer_cast<RealColumn>(sorted->getColumn("x"));
    std::vector<double> asc, desc;
    for (size_t i = 0; i < ascending.size(); ++i) {
        asc.push_back(sortedValues->at(i));
        desc.push_back(sortedValues->at(resorted[i]));
    }
    std::reverse(desc.begin(), desc.end());
    REQUIRE(asc == desc);

    // Les égalités gardent leur ordre relatif dans les deux sens
    std::vector<size_t> tiesAsc, tiesDesc;
    for (size_t i = 0; i < ascending.size(); ++i) {
        if (sortedValues->at(i) == 1.0) tiesAsc.push_back(i);
        if (sortedValues->at(resorted[i]) == 1.0) tiesDesc.push_back(resorted[i]);
    }
    REQUIRE(tiesAsc == tiesDesc);
}

TEST_CASE("Order named locale is deterministic across engines", "[OrderingEngine][property]") {
    auto table = textTable({"caf\xC3\xA9", "cafe", "Cafe", "caff", N_TILDE + "u", "nu", "Zoo", "abc"});

    OrderingEngine first(std::make_shared<IcuCollator>());
    OrderingEngine second(std::make_shared<IcuCollator>());

    REQUIRE(first.order(*table, {OrderSpec("t")}, "es") == second.order(*table, {OrderSpec("t")}, "es"));
    REQUIRE(first.order(*table, {OrderSpec("t")}, "en") == second.order(*table, {OrderSpec("t")}, "en"));
}

TEST_CASE("Order cache on and off give identical results", "[OrderingEngine][property]") {
    auto table = textTable({"pera", "Pera", N_TILDE + "apa", "nada", "pera", "zeta", "NA"});

    EngineConfig noCache;
    noCache.keyCacheEnabled = false;
    OrderingEngine cached(std::make_shared<IcuCollator>());
    OrderingEngine uncached(std::make_shared<IcuCollator>(), noCache);

    REQUIRE(uncached.getKeyCache() == nullptr);
    for (int round = 0; round < 2; ++round) {
        REQUIRE(cached.order(*table, {OrderSpec("t")}, "es") == uncached.order(*table, {OrderSpec("t")}, "es"));
    }
    REQUIRE(cached.getKeyCache()->size() == 5);
    REQUIRE(cached.getKeyCache()->hits() >= 5);
}

TEST_CASE("Order is safe to call from several threads", "[OrderingEngine]") {
    std::mt19937 rng(5);
    std::uniform_int_distribution<int> letter('a', 'z');
    std::vector<std::string> words(400);
    for (auto& w : words) {
        w = std::string(1, static_cast<char>(letter(rng))) + static_cast<char>(letter(rng));
    }
    auto table = textTable(words);

    OrderingEngine engine(std::make_shared<IcuCollator>());
    auto expected = engine.order(*table, {OrderSpec("t")}, "en");

    std::vector<Permutation> results(4);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < results.size(); ++t) {
        workers.emplace_back([&, t]() {
            results[t] = engine.order(*table, {OrderSpec("t")}, "en");
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& result : results) {
        REQUIRE(result == expected);
    }
}

// =============================================================================
// Collation injection
// =============================================================================

TEST_CASE("Order uses the injected collator for named locales", "[OrderingEngine]") {
    auto collator = std::make_shared<ReversingCollator>();
    OrderingEngine engine(collator);
    auto table = textTable({"ab", "ba", "ca", "ab"});

    auto order = engine.order(*table, {OrderSpec("t")}, "rev");

    // Clés inversées : "ba" → "ab", "ca" → "ac", "ab" → "ba"
    REQUIRE(order == Permutation{1, 2, 0, 3});
    // Une seule collation par valeur distincte
    REQUIRE(collator->calls == 3);
}

TEST_CASE("Order C locale never calls the collator", "[OrderingEngine]") {
    auto collator = std::make_shared<ReversingCollator>();
    OrderingEngine engine(collator);
    auto table = textTable({"b", "a"});

    REQUIRE(engine.order(*table, {OrderSpec("t")}) == Permutation{1, 0});
    REQUIRE(engine.order(*table, {OrderSpec("t")}, "") == Permutation{1, 0});
    REQUIRE(collator->calls == 0);
}

// =============================================================================
// Legacy mode
// =============================================================================

TEST_CASE("Order legacy mode logs a deprecation warning", "[OrderingEngine][legacy]") {
    LogCapture capture;
    OrderingEngine engine;
    auto table = textTable({"b", "a", "c"});

    auto byMode = engine.order(*table, {OrderSpec("t")}, "C", Mode::LEGACY);
    auto byLocale = engine.order(*table, {OrderSpec("t")}, "legacy");

    REQUIRE(byMode == Permutation{1, 0, 2});
    REQUIRE(byLocale == byMode);

    auto logs = capture.str();
    REQUIRE(logs.find("deprecated") != std::string::npos);
    REQUIRE(logs.find("deprecated") != logs.rfind("deprecated"));
}

TEST_CASE("Order legacy mode follows the global locale collation", "[OrderingEngine][legacy]") {
    LogCapture capture;
    OrderingEngine engine;
    auto table = textTable({"b", "a", "NA", "c"});

    GlobalLocaleGuard guard(std::locale(std::locale::classic(), new ReverseCollate));

    // c, b, a puis le manquant
    REQUIRE(engine.order(*table, {OrderSpec("t")}, "C", Mode::LEGACY) == Permutation{3, 0, 1, 2});
    // Le chemin normal en locale C reste sur les octets
    REQUIRE(engine.order(*table, {OrderSpec("t")}, "C") == Permutation{1, 0, 3, 2});
}

TEST_CASE("Order normal mode logs no warning", "[OrderingEngine][legacy]") {
    LogCapture capture;
    OrderingEngine engine;
    auto table = textTable({"b", "a"});

    engine.order(*table, {OrderSpec("t")});

    REQUIRE(capture.str().empty());
}

// =============================================================================
// Error Handling Tests
// =============================================================================

TEST_CASE("Order rejects an empty spec list", "[OrderingEngine][error]") {
    OrderingEngine engine;
    auto table = textTable({"a"});

    REQUIRE_THROWS_AS(engine.order(*table, {}), EmptyOrderSpec);
    REQUIRE_THROWS_AS(engine.order(*table, {}, "C", Mode::LEGACY), EmptyOrderSpec);
}

TEST_CASE("Order rejects unknown columns", "[OrderingEngine][error]") {
    OrderingEngine engine;
    auto table = textTable({"a"});

    try {
        engine.order(*table, {OrderSpec("t"), OrderSpec("ghost")});
        FAIL("expected UnknownColumnReference");
    } catch (const UnknownColumnReference& e) {
        REQUIRE(e.subject() == "ghost");
        REQUIRE(e.toJson()["error"] == "UnknownColumnReference");
    }
}

TEST_CASE("Order rejects list columns", "[OrderingEngine][error]") {
    Table table;
    auto tags = std::make_shared<ListColumn>("tags");
    tags->push_back({"x"});
    table.addColumn(tags);

    OrderingEngine engine;
    REQUIRE_THROWS_AS(engine.order(table, {OrderSpec("tags")}), UnsupportedColumnType);
    REQUIRE_THROWS_AS(engine.order(table, {OrderSpec("tags")}, "C", Mode::LEGACY), UnsupportedColumnType);
}

TEST_CASE("Order rejects malformed locale identifiers", "[OrderingEngine][error]") {
    OrderingEngine engine(std::make_shared<IcuCollator>());
    auto table = textTable({"a"});

    REQUIRE_THROWS_AS(engine.order(*table, {OrderSpec("t")}, "en_US.UTF-8"), InvalidLocaleIdentifier);
    REQUIRE_THROWS_AS(engine.order(*table, {OrderSpec("t")}, "!!"), InvalidLocaleIdentifier);
}

TEST_CASE("Order named locale without collator is unavailable", "[OrderingEngine][error]") {
    OrderingEngine engine;
    auto table = textTable({"a"});

    try {
        engine.order(*table, {OrderSpec("t")}, "es");
        FAIL("expected LocaleUnavailable");
    } catch (const LocaleUnavailable& e) {
        REQUIRE(e.code() == ErrorCode::LOCALE_UNAVAILABLE);
        REQUIRE(e.subject() == "es");
    }
}

TEST_CASE("Order never substitutes an unsupported locale", "[OrderingEngine][error]") {
    OrderingEngine engine(std::make_shared<IcuCollator>());
    auto table = textTable({"a"});

    REQUIRE_THROWS_AS(engine.order(*table, {OrderSpec("t")}, "qq"), LocaleUnavailable);
}

TEST_CASE("Order rejects a column shorter than the table", "[OrderingEngine][error]") {
    auto collator = std::make_shared<ReversingCollator>();
    OrderingEngine engine(collator);

    Table table;
    auto a = table.addIntegerColumn("a");
    auto b = table.addTextColumn("b");
    for (int i = 0; i < 5; ++i) a->push_back(i);
    b->push_back("x");

    REQUIRE_THROWS_AS(engine.order(table, {OrderSpec("b")}, "rev"), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.order(table, {OrderSpec("b")}), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.order(table, {OrderSpec("b")}, "C", Mode::LEGACY), std::invalid_argument);
    REQUIRE(collator->calls == 0);
}

TEST_CASE("Order validates before any collation work", "[OrderingEngine][error]") {
    auto collator = std::make_shared<ReversingCollator>();
    OrderingEngine engine(collator);
    auto table = textTable({"a", "b"});

    REQUIRE_THROWS_AS(engine.order(*table, {OrderSpec("t"), OrderSpec("ghost")}, "rev"),
                      UnknownColumnReference);
    REQUIRE(collator->calls == 0);
}

TEST_CASE("Order accepts a parsed request", "[OrderingEngine]") {
    Table table;
    table.addTextColumn("name");
    table.addIntegerColumn("n");
    table.addRow({"x", "2"});
    table.addRow({"y", "NA"});
    table.addRow({"z", "1"});

    auto request = OrderSpecParser::fromJson(nlohmann::json::parse(R"({
        "locale": "C",
        "order": [{"column": "n", "order": "desc", "missing": "first"}]
    })"));

    OrderingEngine engine;
    REQUIRE(engine.order(table, request) == Permutation{1, 0, 2});
}
