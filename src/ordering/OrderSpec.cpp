#include "OrderSpec.hpp"
#include <regex>
#include <sstream>
#include <stdexcept>

namespace ordering {

namespace locale_id {

bool isC(const std::string& locale) {
    return locale.empty() || locale == C_LOCALE;
}

bool isLegacy(const std::string& locale) {
    return locale == LEGACY;
}

bool isWellFormed(const std::string& locale) {
    static const std::regex icuForm(
        "[A-Za-z]{2,8}(_[A-Za-z0-9]{1,8})*"
        "(@[A-Za-z]+=[A-Za-z0-9]+(;[A-Za-z]+=[A-Za-z0-9]+)*)?");
    static const std::regex bcp47Form("[A-Za-z]{2,8}(-[A-Za-z0-9]{1,8})*");
    return std::regex_match(locale, icuForm) || std::regex_match(locale, bcp47Form);
}

} // namespace locale_id

Direction OrderSpecParser::parseDirection(const std::string& value) {
    if (value == "asc" || value == "ascending") return Direction::ASCENDING;
    if (value == "desc" || value == "descending") return Direction::DESCENDING;
    throw std::invalid_argument("Unknown order direction '" + value + "'");
}

MissingPlacement OrderSpecParser::parseMissing(const std::string& value) {
    if (value == "first") return MissingPlacement::FIRST;
    if (value == "last") return MissingPlacement::LAST;
    throw std::invalid_argument("Unknown missing placement '" + value + "'");
}

Mode OrderSpecParser::parseMode(const std::string& value) {
    if (value == "normal") return Mode::NORMAL;
    if (value == "legacy") return Mode::LEGACY;
    throw std::invalid_argument("Unknown ordering mode '" + value + "'");
}

OrderSpec OrderSpecParser::specFromJson(const json& specJson) {
    if (!specJson.is_object() || !specJson.contains("column") || !specJson["column"].is_string()) {
        throw std::invalid_argument("Order item must be an object with a 'column' string");
    }

    OrderSpec spec(specJson["column"].get<std::string>());
    if (specJson.contains("order")) {
        spec.direction = parseDirection(specJson["order"].get<std::string>());
    }
    if (specJson.contains("missing")) {
        spec.missing = parseMissing(specJson["missing"].get<std::string>());
    }
    return spec;
}

OrderRequest OrderSpecParser::fromJson(const json& requestJson) {
    OrderRequest request;
    const json* orderItems = &requestJson;

    if (requestJson.is_object()) {
        if (requestJson.contains("locale")) {
            request.locale = requestJson["locale"].get<std::string>();
        }
        if (requestJson.contains("mode")) {
            request.mode = parseMode(requestJson["mode"].get<std::string>());
        }
        if (!requestJson.contains("order")) {
            throw std::invalid_argument("Ordering request has no 'order' array");
        }
        orderItems = &requestJson["order"];
    }

    if (!orderItems->is_array()) {
        throw std::invalid_argument("Ordering request 'order' must be an array");
    }

    request.specs.reserve(orderItems->size());
    for (const auto& item : *orderItems) {
        request.specs.push_back(specFromJson(item));
    }
    return request;
}

OrderSpec OrderSpecParser::fromToken(const std::string& token) {
    std::vector<std::string> parts;
    std::stringstream ss(token);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }

    if (parts.empty() || parts[0].empty() || parts.size() > 3) {
        throw std::invalid_argument("Invalid order token '" + token + "'");
    }

    OrderSpec spec(parts[0]);
    for (size_t i = 1; i < parts.size(); ++i) {
        if (parts[i] == "first" || parts[i] == "last") {
            spec.missing = parseMissing(parts[i]);
        } else {
            spec.direction = parseDirection(parts[i]);
        }
    }
    return spec;
}

json OrderSpecParser::toJson(const OrderRequest& request) {
    json order = json::array();
    for (const auto& spec : request.specs) {
        order.push_back({
            {"column", spec.column},
            {"order", spec.direction == Direction::ASCENDING ? "asc" : "desc"},
            {"missing", spec.missing == MissingPlacement::FIRST ? "first" : "last"}
        });
    }
    return json{
        {"locale", request.locale},
        {"mode", request.mode == Mode::LEGACY ? "legacy" : "normal"},
        {"order", order}
    };
}

} // namespace ordering
