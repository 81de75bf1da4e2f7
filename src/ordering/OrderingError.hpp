#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace ordering {

using json = nlohmann::json;

enum class ErrorCode {
    UNSUPPORTED_COLUMN_TYPE,
    EMPTY_ORDER_SPEC,
    UNKNOWN_COLUMN_REFERENCE,
    LOCALE_UNAVAILABLE,
    INVALID_LOCALE_IDENTIFIER
};

std::string errorCodeToString(ErrorCode code);

/**
 * Erreur structurée du moteur de tri
 * Toutes ces erreurs sont détectées avant le début du tri : aucune
 * permutation partielle n'est jamais rendue.
 */
class OrderingError : public std::runtime_error {
public:
    OrderingError(ErrorCode code, std::string subject, const std::string& message)
        : std::runtime_error(message), m_code(code), m_subject(std::move(subject)) {}

    ErrorCode code() const { return m_code; }

    // Colonne ou locale concernée (vide pour EMPTY_ORDER_SPEC)
    const std::string& subject() const { return m_subject; }

    json toJson() const {
        return json{{"error", errorCodeToString(m_code)},
                    {"subject", m_subject},
                    {"message", what()}};
    }

private:
    ErrorCode m_code;
    std::string m_subject;
};

class UnsupportedColumnType : public OrderingError {
public:
    UnsupportedColumnType(const std::string& column, const std::string& kind)
        : OrderingError(ErrorCode::UNSUPPORTED_COLUMN_TYPE, column,
                        "Column '" + column + "' of type " + kind + " cannot be ordered") {}
};

class EmptyOrderSpec : public OrderingError {
public:
    EmptyOrderSpec()
        : OrderingError(ErrorCode::EMPTY_ORDER_SPEC, "",
                        "Ordering request names no column") {}
};

class UnknownColumnReference : public OrderingError {
public:
    explicit UnknownColumnReference(const std::string& column)
        : OrderingError(ErrorCode::UNKNOWN_COLUMN_REFERENCE, column,
                        "Column '" + column + "' not found") {}
};

class LocaleUnavailable : public OrderingError {
public:
    LocaleUnavailable(const std::string& locale, const std::string& reason)
        : OrderingError(ErrorCode::LOCALE_UNAVAILABLE, locale,
                        "Locale '" + locale + "' is unavailable: " + reason) {}
};

class InvalidLocaleIdentifier : public OrderingError {
public:
    explicit InvalidLocaleIdentifier(const std::string& locale)
        : OrderingError(ErrorCode::INVALID_LOCALE_IDENTIFIER, locale,
                        "Invalid locale identifier '" + locale + "'") {}
};

} // namespace ordering
