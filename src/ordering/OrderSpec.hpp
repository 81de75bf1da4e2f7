#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ordering {

using json = nlohmann::json;

// Permutation des positions de lignes (0-based)
using Permutation = std::vector<size_t>;

enum class Direction {
    ASCENDING,
    DESCENDING
};

enum class MissingPlacement {
    FIRST,
    LAST
};

enum class Mode {
    NORMAL,
    LEGACY  // Tri par comparaison selon la locale globale du process, à retirer
};

struct OrderSpec {
    std::string column;
    Direction direction = Direction::ASCENDING;
    MissingPlacement missing = MissingPlacement::LAST;

    OrderSpec() = default;
    OrderSpec(std::string column_, Direction direction_ = Direction::ASCENDING,
              MissingPlacement missing_ = MissingPlacement::LAST)
        : column(std::move(column_)), direction(direction_), missing(missing_) {}
};

/**
 * Requête de tri complète : colonnes (clé primaire en premier), locale, mode
 */
struct OrderRequest {
    std::vector<OrderSpec> specs;
    std::string locale = "C";
    Mode mode = Mode::NORMAL;
};

namespace locale_id {

constexpr const char* C_LOCALE = "C";
constexpr const char* LEGACY = "legacy";

// "C" ou vide (locale omise)
bool isC(const std::string& locale);
bool isLegacy(const std::string& locale);

// Syntaxe ICU (es_ES, de@collation=phonebook) ou BCP 47 (es-ES, en-u-kn)
bool isWellFormed(const std::string& locale);

} // namespace locale_id

/**
 * Lecture des requêtes de tri depuis JSON ou depuis la ligne de commande
 *
 * JSON:
 *   [{"column": "a", "order": "desc", "missing": "first"}, ...]
 * ou
 *   {"locale": "es", "mode": "normal", "order": [ ... ]}
 *
 * Ligne de commande: "colonne[:asc|desc][:first|last]"
 */
class OrderSpecParser {
public:
    static OrderRequest fromJson(const json& requestJson);
    static OrderSpec specFromJson(const json& specJson);
    static OrderSpec fromToken(const std::string& token);

    static Direction parseDirection(const std::string& value);
    static MissingPlacement parseMissing(const std::string& value);
    static Mode parseMode(const std::string& value);

    static json toJson(const OrderRequest& request);
};

} // namespace ordering
