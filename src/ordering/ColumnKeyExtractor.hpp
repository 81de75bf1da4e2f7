#pragma once

#include "OrderSpec.hpp"
#include "SortKeys.hpp"
#include "TextKeySource.hpp"
#include "table/Column.hpp"
#include <cstdint>

namespace ordering {

/**
 * Extraction des clés de tri d'une colonne
 *
 * Clé = tag de placement (1 octet) + octets de valeur (valeurs présentes seulement).
 * - INTEGER     : 8 octets big-endian, bit de signe inversé
 * - REAL        : 8 octets big-endian, transformation IEEE → ordre monotone
 * - BOOLEAN     : 1 octet
 * - CATEGORICAL : rang du niveau, 4 octets big-endian
 * - TEXT        : clé de la TextKeySource, une seule fois par valeur distincte
 * En descendant, seuls les octets de valeur sont complémentés : le placement
 * des manquants ne dépend pas de la direction.
 */
class ColumnKeyExtractor {
public:
    static SortKeys extract(const IColumn& column, const OrderSpec& spec,
                            const TextKeySource& textKeys);

    static bool isSupported(ColumnKind kind);

    static void encodeInteger(int64_t value, uint8_t* out);
    static void encodeReal(double value, uint8_t* out);
    static void encodeRank(uint32_t rank, uint8_t* out);

private:
    template <typename Encode>
    static SortKeys extractFixed(const IColumn& column, const OrderSpec& spec,
                                 size_t valueWidth, Encode encode);

    static SortKeys extractText(const TextColumn& column, const OrderSpec& spec,
                                const TextKeySource& textKeys);
};

} // namespace ordering
