#pragma once

#include <string>
#include <memory>

namespace ordering {

/**
 * Transformation de collation : texte → clé d'octets
 *
 * Pour deux valeurs a et b d'une même locale, la comparaison octet par octet
 * de leurs clés reproduit l'ordre linguistique de la locale. Une clé ne dépend
 * que de (valeur, locale).
 */
class Collator {
public:
    virtual ~Collator() = default;

    virtual std::string collateKey(const std::string& value, const std::string& locale) const = 0;

    // false si la locale ne peut être servie qu'en substituant une autre locale
    virtual bool supportsLocale(const std::string& locale) const = 0;

    virtual std::string name() const = 0;
};

using CollatorPtr = std::shared_ptr<const Collator>;

} // namespace ordering
