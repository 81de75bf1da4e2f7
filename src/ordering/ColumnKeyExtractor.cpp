#include "ColumnKeyExtractor.hpp"
#include "OrderingError.hpp"
#include "common/Logger.hpp"
#include <cstring>

namespace ordering {

namespace {

uint8_t missingTag(const OrderSpec& spec) {
    return spec.missing == MissingPlacement::FIRST ? SortKeys::TAG_MISSING_FIRST
                                                   : SortKeys::TAG_MISSING_LAST;
}

void writeBigEndian64(uint64_t bits, uint8_t* out) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(bits & 0xFF);
        bits >>= 8;
    }
}

} // namespace

void ColumnKeyExtractor::encodeInteger(int64_t value, uint8_t* out) {
    writeBigEndian64(static_cast<uint64_t>(value) ^ 0x8000000000000000ULL, out);
}

void ColumnKeyExtractor::encodeReal(double value, uint8_t* out) {
    if (value == 0.0) value = 0.0;  // -0.0 → +0.0

    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    if (bits & 0x8000000000000000ULL) {
        bits = ~bits;
    } else {
        bits |= 0x8000000000000000ULL;
    }
    writeBigEndian64(bits, out);
}

void ColumnKeyExtractor::encodeRank(uint32_t rank, uint8_t* out) {
    out[0] = static_cast<uint8_t>(rank >> 24);
    out[1] = static_cast<uint8_t>(rank >> 16);
    out[2] = static_cast<uint8_t>(rank >> 8);
    out[3] = static_cast<uint8_t>(rank);
}

bool ColumnKeyExtractor::isSupported(ColumnKind kind) {
    switch (kind) {
        case ColumnKind::INTEGER:
        case ColumnKind::REAL:
        case ColumnKind::BOOLEAN:
        case ColumnKind::TEXT:
        case ColumnKind::CATEGORICAL:
            return true;
        default:
            return false;
    }
}

template <typename Encode>
SortKeys ColumnKeyExtractor::extractFixed(const IColumn& column, const OrderSpec& spec,
                                          size_t valueWidth, Encode encode) {
    const size_t rows = column.size();
    const uint8_t tagMissing = missingTag(spec);
    const bool descending = spec.direction == Direction::DESCENDING;

    SortKeys keys = SortKeys::fixedWidth(rows, valueWidth + 1);
    for (size_t i = 0; i < rows; ++i) {
        uint8_t* key = keys.mutableKey(i);
        if (column.isMissing(i)) {
            key[0] = tagMissing;
            continue;
        }
        key[0] = SortKeys::TAG_PRESENT;
        encode(i, key + 1);
        if (descending) {
            for (size_t b = 1; b <= valueWidth; ++b) {
                key[b] = static_cast<uint8_t>(~key[b]);
            }
        }
    }
    return keys;
}

SortKeys ColumnKeyExtractor::extractText(const TextColumn& column, const OrderSpec& spec,
                                         const TextKeySource& textKeys) {
    const size_t rows = column.size();
    const uint8_t tagMissing = missingTag(spec);
    const bool descending = spec.direction == Direction::DESCENDING;

    // Une clé par valeur distincte du pool
    const auto& pool = *column.getStringPool();
    std::vector<std::string> keyById(pool.size());
    std::vector<uint8_t> computed(pool.size(), 0);
    size_t distinct = 0;

    SortKeys keys = SortKeys::variableWidth(rows, descending ? SortKeys::PAD_HIGH
                                                             : SortKeys::PAD_LOW);
    std::string buffer;
    for (size_t i = 0; i < rows; ++i) {
        if (column.isMissing(i)) {
            keys.append(&tagMissing, 1);
            continue;
        }

        auto id = column.getId(i);
        if (!computed[id]) {
            keyById[id] = textKeys.keyFor(pool.getString(id));
            computed[id] = 1;
            ++distinct;
        }

        const std::string& valueKey = keyById[id];
        buffer.assign(1, static_cast<char>(SortKeys::TAG_PRESENT));
        buffer.append(valueKey);
        if (descending) {
            for (size_t b = 1; b < buffer.size(); ++b) {
                buffer[b] = static_cast<char>(~static_cast<uint8_t>(buffer[b]));
            }
        }
        keys.append(reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size());
    }

    ORDERING_LOG_DEBUG("Column '" + column.getName() + "': " + std::to_string(distinct) +
                       " distinct text keys for " + std::to_string(rows) + " rows");
    return keys;
}

SortKeys ColumnKeyExtractor::extract(const IColumn& column, const OrderSpec& spec,
                                     const TextKeySource& textKeys) {
    if (auto intCol = dynamic_cast<const IntegerColumn*>(&column)) {
        return extractFixed(column, spec, 8, [intCol](size_t i, uint8_t* out) {
            encodeInteger(intCol->at(i), out);
        });
    } else if (auto realCol = dynamic_cast<const RealColumn*>(&column)) {
        return extractFixed(column, spec, 8, [realCol](size_t i, uint8_t* out) {
            encodeReal(realCol->at(i), out);
        });
    } else if (auto boolCol = dynamic_cast<const BooleanColumn*>(&column)) {
        return extractFixed(column, spec, 1, [boolCol](size_t i, uint8_t* out) {
            out[0] = boolCol->at(i) ? 1 : 0;
        });
    } else if (auto catCol = dynamic_cast<const CategoricalColumn*>(&column)) {
        return extractFixed(column, spec, 4, [catCol](size_t i, uint8_t* out) {
            encodeRank(catCol->rank(i), out);
        });
    } else if (auto textCol = dynamic_cast<const TextColumn*>(&column)) {
        return extractText(*textCol, spec, textKeys);
    }

    throw UnsupportedColumnType(column.getName(), columnKindToString(column.getKind()));
}

} // namespace ordering
