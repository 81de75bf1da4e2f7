#include "Column.hpp"
#include <sstream>
#include <iomanip>

namespace ordering {

std::string columnKindToString(ColumnKind kind) {
    switch (kind) {
        case ColumnKind::INTEGER:     return "integer";
        case ColumnKind::REAL:        return "real";
        case ColumnKind::BOOLEAN:     return "boolean";
        case ColumnKind::TEXT:        return "text";
        case ColumnKind::CATEGORICAL: return "categorical";
        case ColumnKind::LIST:        return "list";
    }
    return "unknown";
}

std::string RealColumn::valueToString(size_t index) const {
    if (isMissing(index)) return "NA";
    std::ostringstream oss;
    oss << std::setprecision(17) << m_data[index];
    return oss.str();
}

std::string ListColumn::valueToString(size_t index) const {
    if (isMissing(index)) return "NA";
    std::string result = "[";
    const auto& items = m_data[index];
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += ";";
        result += items[i];
    }
    result += "]";
    return result;
}

} // namespace ordering
